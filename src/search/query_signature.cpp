#include <ragrank/config/config_helpers.h>
#include <ragrank/crypto/hasher.h>
#include <ragrank/search/query_signature.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace ragrank::search {

using json = nlohmann::json;

std::string normalizeQueryForCache(const std::string& query) {
    std::string out = query;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    config::trim(out);
    return out;
}

QuerySignature QuerySignature::fromQuery(const std::string& query,
                                         const std::optional<std::vector<DocumentId>>& docIds,
                                         size_t topK) {
    QuerySignature sig;
    sig.query_ = normalizeQueryForCache(query);
    sig.topK_ = topK;

    if (docIds) {
        sig.docIds_ = *docIds;
        std::sort(sig.docIds_.begin(), sig.docIds_.end());
        sig.docIds_.erase(std::unique(sig.docIds_.begin(), sig.docIds_.end()), sig.docIds_.end());
    }

    // json objects keep their keys ordered, which gives the sorted-key form
    json key = {{"doc_ids", sig.docIds_}, {"query", sig.query_}, {"top_k", sig.topK_}};
    sig.canonical_ = key.dump(-1, ' ', false, json::error_handler_t::replace);
    sig.digest_ = crypto::SHA256Hasher::hashText(sig.canonical_);
    return sig;
}

} // namespace ragrank::search
