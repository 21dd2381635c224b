#pragma once

#include <ragrank/core/types.h>
#include <ragrank/search/response_cache.h>
#include <ragrank/search/retrieval_pipeline.h>

#include <spdlog/common.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace ragrank::config {

/**
 * @brief Everything a retrieval deployment reads from its config file
 */
struct RetrievalSettings {
    search::RetrievalConfig retrieval;
    search::ResponseCacheConfig cache;
    std::string logLevel = "info";

    std::filesystem::path sourcePath; // Empty when no config file was found
};

/**
 * @brief Load settings from the TOML config file, then apply environment overrides
 *
 * File sections and keys:
 *   [retrieval] default_top_k, max_top_k, overfetch_factor, rerank_candidate_cap,
 *               rerank_timeout_ms, min_similarity_score, rrf_k, mmr_lambda,
 *               bm25_k1, bm25_b, bm25_epsilon, embedding_dim, parallel_scoring,
 *               preview_length
 *   [cache]     max_entries, ttl_seconds, enable_statistics
 *   [logging]   level
 *
 * Each retrieval key can be overridden by RAGRANK_<KEY>, each cache key by
 * RAGRANK_CACHE_<KEY>, and the log level by RAGRANK_LOG_LEVEL. The file
 * location comes from overridePath, then RAGRANK_CONFIG, then
 * get_config_path(). A missing file is not an error.
 *
 * @return ErrorCode::InvalidConfiguration for unparsable or out-of-range values
 */
Result<RetrievalSettings> loadRetrievalSettings(const std::string& overridePath = "");

/**
 * @brief Parse a level name (trace, debug, info, warn, error, critical, off)
 */
Result<spdlog::level::level_enum> parseLogLevel(std::string_view level);

/**
 * @brief Set the default spdlog logger level from a level name
 */
Result<void> applyLogLevel(std::string_view level);

} // namespace ragrank::config
