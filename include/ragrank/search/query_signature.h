#pragma once

#include <ragrank/core/types.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ragrank::search {

/**
 * @brief Cache identity of a retrieval request
 *
 * Built from the normalized query (lower-cased, trimmed), the document filter
 * (sorted, duplicates removed; an empty filter is the same as no filter) and
 * the effective result count. The canonical form is the JSON object
 * {"doc_ids":[...],"query":"...","top_k":N} with sorted keys; the digest is its
 * SHA-256 in lower-case hex. Argument order never changes the signature.
 */
class QuerySignature {
public:
    static QuerySignature fromQuery(const std::string& query,
                                    const std::optional<std::vector<DocumentId>>& docIds,
                                    size_t topK);

    QuerySignature() = default;

    const std::string& digest() const { return digest_; }
    const std::string& canonical() const { return canonical_; }

    const std::string& normalizedQuery() const { return query_; }
    const std::vector<DocumentId>& documentIds() const { return docIds_; }
    size_t topK() const { return topK_; }

    bool operator==(const QuerySignature& other) const { return digest_ == other.digest_; }
    bool operator!=(const QuerySignature& other) const { return !(*this == other); }

private:
    std::string query_;
    std::vector<DocumentId> docIds_;
    size_t topK_ = 0;
    std::string canonical_;
    std::string digest_;
};

/**
 * @brief Lower-case and trim a query for cache comparison
 */
std::string normalizeQueryForCache(const std::string& query);

struct QuerySignatureHash {
    size_t operator()(const QuerySignature& sig) const {
        return std::hash<std::string>{}(sig.digest());
    }
};

} // namespace ragrank::search
