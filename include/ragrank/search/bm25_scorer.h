#pragma once

#include <ragrank/core/chunk.h>

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ragrank::search {

/**
 * @brief Okapi BM25 parameters
 */
struct BM25Params {
    double k1 = 1.5;       ///< Term frequency saturation
    double b = 0.75;       ///< Length normalization strength
    double epsilon = 0.25; ///< Floor for negative idf, as a fraction of the mean idf
};

/**
 * @brief Lower-case the text and split it on whitespace
 *
 * No stemming and no stopword removal.
 */
std::vector<std::string> tokenize(std::string_view text);

/**
 * @brief In-memory BM25 index over a tokenized corpus
 *
 * Built per query over the candidate set; there is no incremental update.
 */
class BM25Index {
public:
    explicit BM25Index(const std::vector<std::vector<std::string>>& corpus,
                       const BM25Params& params = {});

    /**
     * @brief Raw (unnormalized) score of every document for the query tokens
     */
    std::vector<double> scores(const std::vector<std::string>& queryTokens) const;

    /**
     * @brief Inverse document frequency of a term, 0 for unseen terms
     */
    double idf(const std::string& term) const;

    size_t documentCount() const { return docLengths_.size(); }
    double averageDocumentLength() const { return avgDocLength_; }

private:
    BM25Params params_;
    std::vector<std::unordered_map<std::string, size_t>> termFrequencies_;
    std::vector<size_t> docLengths_;
    std::unordered_map<std::string, double> idf_;
    double avgDocLength_ = 0.0;
};

/**
 * @brief Lexical scorer producing normalized BM25 scores for chunks
 */
class BM25Scorer {
public:
    explicit BM25Scorer(const BM25Params& params = {});

    /**
     * @brief Score every chunk against the query
     *
     * Scores are divided by the batch maximum so they lie in [0,1]; when the
     * maximum is not positive every score is 0. Order matches `chunks`.
     */
    std::vector<double> score(std::string_view query, const std::vector<Chunk>& chunks) const;

    /**
     * @brief Score and rank chunks, highest first
     *
     * Sets `bm25Score` and `score`. Equal scores keep their input order.
     */
    std::vector<ScoredChunk> rank(std::string_view query, const std::vector<Chunk>& chunks) const;

private:
    BM25Params params_;
};

} // namespace ragrank::search
