#pragma once

#include <ragrank/core/types.h>
#include <ragrank/search/query_signature.h>
#include <ragrank/search/retrieval_response.h>

#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ragrank::search {

/**
 * @brief Configuration for the response cache
 */
struct ResponseCacheConfig {
    size_t maxEntries = 500;                         ///< Capacity before FIFO eviction
    std::chrono::milliseconds defaultTTL{86400000};  ///< 24 hours
    bool enableStatistics = true;                    ///< Track hit/miss counters
};

/**
 * @brief Snapshot of cache counters
 */
struct ResponseCacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t insertions = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    uint64_t invalidations = 0;
    size_t size = 0;
    size_t maxSize = 0;

    double hitRate() const {
        uint64_t total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

/**
 * @brief Thread-safe FIFO cache of complete retrieval responses
 *
 * Entries expire `ttl` after they were stored; an expired entry is removed on
 * the lookup that finds it. When the cache is full the oldest inserted entry
 * is evicted, regardless of how often it was read. Every operation runs under
 * a single lock, so expire-and-delete and evict-and-insert are atomic.
 */
class ResponseCache {
public:
    struct CacheEntry {
        std::shared_ptr<const RetrievalResponse> response;
        TimePoint cachedAt;
        std::chrono::milliseconds ttl{0};

        bool isExpired(TimePoint now) const { return now >= cachedAt + ttl; }
    };

    explicit ResponseCache(const ResponseCacheConfig& config = {});
    ~ResponseCache() = default;

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    // ===== Core Operations =====

    /**
     * @brief Look up a cached response
     * @return nullptr on a miss or when the entry has expired
     */
    std::shared_ptr<const RetrievalResponse> get(const QuerySignature& signature);

    std::shared_ptr<const RetrievalResponse>
    get(const std::string& query, const std::optional<std::vector<DocumentId>>& docIds,
        size_t topK);

    /**
     * @brief Store a response
     *
     * Re-storing an existing key replaces the value and restarts its TTL but
     * keeps its eviction position. A zero ttl uses the configured default.
     */
    void put(const QuerySignature& signature, RetrievalResponse response,
             std::chrono::milliseconds ttl = std::chrono::milliseconds{0});

    void put(const std::string& query, const std::optional<std::vector<DocumentId>>& docIds,
             size_t topK, RetrievalResponse response,
             std::chrono::milliseconds ttl = std::chrono::milliseconds{0});

    /**
     * @brief Check if key exists and is not expired (does not count as a lookup)
     */
    bool contains(const QuerySignature& signature) const;

    /**
     * @brief Remove an entry; returns whether it was present
     */
    bool invalidate(const QuerySignature& signature);

    void clear();

    // ===== Cache Management =====

    size_t size() const;

    /**
     * @brief Drop every expired entry
     * @return Number of entries removed
     */
    size_t removeExpired();

    ResponseCacheStats getStats() const;
    void resetStats();

    const ResponseCacheConfig& getConfig() const { return config_; }

private:
    using ListIterator = std::list<std::string>::iterator;

    struct Slot {
        CacheEntry entry;
        ListIterator position;
    };

    void eraseLocked(std::unordered_map<std::string, Slot>::iterator it);

    mutable std::mutex mutex_;
    ResponseCacheConfig config_;

    std::list<std::string> insertionOrder_; ///< Oldest first
    std::unordered_map<std::string, Slot> entries_;

    ResponseCacheStats stats_;
};

} // namespace ragrank::search
