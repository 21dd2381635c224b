#include <ragrank/search/response_cache.h>

#include <spdlog/spdlog.h>

#include <iterator>

namespace ragrank::search {

ResponseCache::ResponseCache(const ResponseCacheConfig& config) : config_(config) {
    stats_.maxSize = config.maxEntries;
}

std::shared_ptr<const RetrievalResponse> ResponseCache::get(const QuerySignature& signature) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(signature.digest());
    if (it == entries_.end()) {
        if (config_.enableStatistics) {
            ++stats_.misses;
        }
        spdlog::debug("Cache miss for query '{}'", signature.normalizedQuery());
        return nullptr;
    }

    if (it->second.entry.isExpired(std::chrono::system_clock::now())) {
        eraseLocked(it);
        if (config_.enableStatistics) {
            ++stats_.expirations;
            ++stats_.misses;
        }
        spdlog::debug("Cache entry expired for query '{}'", signature.normalizedQuery());
        return nullptr;
    }

    if (config_.enableStatistics) {
        ++stats_.hits;
    }
    spdlog::info("Cache hit for query '{}'", signature.normalizedQuery());
    return it->second.entry.response;
}

std::shared_ptr<const RetrievalResponse>
ResponseCache::get(const std::string& query, const std::optional<std::vector<DocumentId>>& docIds,
                   size_t topK) {
    return get(QuerySignature::fromQuery(query, docIds, topK));
}

void ResponseCache::put(const QuerySignature& signature, RetrievalResponse response,
                        std::chrono::milliseconds ttl) {
    auto stored = std::make_shared<const RetrievalResponse>(std::move(response));
    const auto effectiveTtl = ttl.count() > 0 ? ttl : config_.defaultTTL;
    const auto now = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(signature.digest());
    if (it != entries_.end()) {
        // Same FIFO position, fresh timestamp
        it->second.entry = CacheEntry{std::move(stored), now, effectiveTtl};
        return;
    }

    if (config_.maxEntries == 0) {
        return;
    }

    while (entries_.size() >= config_.maxEntries && !insertionOrder_.empty()) {
        auto oldest = entries_.find(insertionOrder_.front());
        if (oldest == entries_.end()) {
            insertionOrder_.pop_front();
            continue;
        }
        eraseLocked(oldest);
        if (config_.enableStatistics) {
            ++stats_.evictions;
        }
    }

    insertionOrder_.push_back(signature.digest());
    entries_.emplace(signature.digest(),
                     Slot{CacheEntry{std::move(stored), now, effectiveTtl},
                          std::prev(insertionOrder_.end())});

    if (config_.enableStatistics) {
        ++stats_.insertions;
    }
    spdlog::debug("Cached response for query '{}' ({} entries)", signature.normalizedQuery(),
                  entries_.size());
}

void ResponseCache::put(const std::string& query,
                        const std::optional<std::vector<DocumentId>>& docIds, size_t topK,
                        RetrievalResponse response, std::chrono::milliseconds ttl) {
    put(QuerySignature::fromQuery(query, docIds, topK), std::move(response), ttl);
}

bool ResponseCache::contains(const QuerySignature& signature) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(signature.digest());
    if (it == entries_.end()) {
        return false;
    }
    return !it->second.entry.isExpired(std::chrono::system_clock::now());
}

bool ResponseCache::invalidate(const QuerySignature& signature) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(signature.digest());
    if (it == entries_.end()) {
        return false;
    }
    eraseLocked(it);
    if (config_.enableStatistics) {
        ++stats_.invalidations;
    }
    return true;
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    insertionOrder_.clear();
    spdlog::info("Response cache cleared");
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t ResponseCache::removeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto now = std::chrono::system_clock::now();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.entry.isExpired(now)) {
            insertionOrder_.erase(it->second.position);
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (config_.enableStatistics) {
        stats_.expirations += removed;
    }
    if (removed > 0) {
        spdlog::debug("Removed {} expired cache entries", removed);
    }
    return removed;
}

ResponseCacheStats ResponseCache::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ResponseCacheStats snapshot = stats_;
    snapshot.size = entries_.size();
    return snapshot;
}

void ResponseCache::resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = ResponseCacheStats{};
    stats_.maxSize = config_.maxEntries;
}

void ResponseCache::eraseLocked(std::unordered_map<std::string, Slot>::iterator it) {
    insertionOrder_.erase(it->second.position);
    entries_.erase(it);
}

} // namespace ragrank::search
