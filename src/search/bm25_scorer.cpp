#include <ragrank/search/bm25_scorer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>

namespace ragrank::search {

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char ch : text) {
        if (std::isspace(ch)) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(static_cast<char>(std::tolower(ch)));
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

// ============================================================================
// BM25Index
// ============================================================================

BM25Index::BM25Index(const std::vector<std::vector<std::string>>& corpus, const BM25Params& params)
    : params_(params) {
    termFrequencies_.reserve(corpus.size());
    docLengths_.reserve(corpus.size());

    std::unordered_map<std::string, size_t> documentFrequency;
    size_t totalLength = 0;

    for (const auto& document : corpus) {
        docLengths_.push_back(document.size());
        totalLength += document.size();

        std::unordered_map<std::string, size_t> frequencies;
        for (const auto& token : document) {
            ++frequencies[token];
        }
        for (const auto& entry : frequencies) {
            ++documentFrequency[entry.first];
        }
        termFrequencies_.push_back(std::move(frequencies));
    }

    if (!corpus.empty()) {
        avgDocLength_ = static_cast<double>(totalLength) / static_cast<double>(corpus.size());
    }

    // idf = ln(N - n + 0.5) - ln(n + 0.5); common terms go negative and are
    // floored at epsilon * mean idf
    const auto n = static_cast<double>(corpus.size());
    double idfSum = 0.0;
    std::vector<std::string> negativeTerms;
    idf_.reserve(documentFrequency.size());
    for (const auto& [term, freq] : documentFrequency) {
        const auto df = static_cast<double>(freq);
        const double value = std::log(n - df + 0.5) - std::log(df + 0.5);
        idf_[term] = value;
        idfSum += value;
        if (value < 0.0) {
            negativeTerms.push_back(term);
        }
    }

    if (!idf_.empty()) {
        const double averageIdf = idfSum / static_cast<double>(idf_.size());
        const double floor = params_.epsilon * averageIdf;
        for (const auto& term : negativeTerms) {
            idf_[term] = floor;
        }
    }
}

double BM25Index::idf(const std::string& term) const {
    auto it = idf_.find(term);
    return it == idf_.end() ? 0.0 : it->second;
}

std::vector<double> BM25Index::scores(const std::vector<std::string>& queryTokens) const {
    std::vector<double> result(docLengths_.size(), 0.0);
    if (result.empty()) {
        return result;
    }

    const double k1 = params_.k1;
    const double b = params_.b;

    // Repeated query tokens contribute once per occurrence
    for (const auto& token : queryTokens) {
        const double termIdf = idf(token);
        if (termIdf == 0.0) {
            continue;
        }
        for (size_t i = 0; i < docLengths_.size(); ++i) {
            auto it = termFrequencies_[i].find(token);
            if (it == termFrequencies_[i].end()) {
                continue;
            }
            const auto tf = static_cast<double>(it->second);
            const double lengthRatio =
                avgDocLength_ > 0.0 ? static_cast<double>(docLengths_[i]) / avgDocLength_ : 1.0;
            result[i] += termIdf * (tf * (k1 + 1.0)) / (tf + k1 * (1.0 - b + b * lengthRatio));
        }
    }

    return result;
}

// ============================================================================
// BM25Scorer
// ============================================================================

BM25Scorer::BM25Scorer(const BM25Params& params) : params_(params) {}

std::vector<double> BM25Scorer::score(std::string_view query,
                                      const std::vector<Chunk>& chunks) const {
    if (chunks.empty()) {
        return {};
    }

    std::vector<std::vector<std::string>> corpus;
    corpus.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        corpus.push_back(tokenize(chunk.text));
    }

    BM25Index index(corpus, params_);
    auto scores = index.scores(tokenize(query));

    // A negative epsilon floor (corpus dominated by common terms) can push raw
    // scores below zero; those carry no lexical evidence
    const double maxScore = *std::max_element(scores.begin(), scores.end());
    const double divisor = maxScore > 0.0 ? maxScore : 1.0;
    for (auto& s : scores) {
        s = std::max(s, 0.0) / divisor;
    }

    if (spdlog::should_log(spdlog::level::debug)) {
        auto [minIt, maxIt] = std::minmax_element(scores.begin(), scores.end());
        const double avg =
            std::accumulate(scores.begin(), scores.end(), 0.0) / static_cast<double>(scores.size());
        spdlog::debug("BM25 scores: min={:.3f}, max={:.3f}, avg={:.3f}", *minIt, *maxIt, avg);
    }

    return scores;
}

std::vector<ScoredChunk> BM25Scorer::rank(std::string_view query,
                                          const std::vector<Chunk>& chunks) const {
    const auto scores = score(query, chunks);

    std::vector<ScoredChunk> ranked;
    ranked.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        ScoredChunk sc(chunks[i], scores[i]);
        sc.bm25Score = scores[i];
        ranked.push_back(std::move(sc));
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const ScoredChunk& a, const ScoredChunk& b) { return a.score > b.score; });
    return ranked;
}

} // namespace ragrank::search
