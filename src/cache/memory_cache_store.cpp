// EN: Implementation of MemoryCacheStore. TTL expiry, LRU eviction and zlib compression in one process.
// FR: Implémentation de MemoryCacheStore. Expiration TTL, éviction LRU et compression zlib en processus.

#include "cache/memory_cache_store.hpp"
#include "infrastructure/logging/logger.hpp"

#include <zlib.h>

namespace MDC {

MemoryCacheStore::MemoryCacheStore(const MemoryStoreConfig& config, TimeSource time_source)
    : config_(config), now_(std::move(time_source)) {
    if (config_.max_entries == 0) {
        throw std::invalid_argument("max_entries must be at least 1");
    }
    if (!now_) {
        now_ = systemTimeSource();
    }
    if (config_.cleanup_interval.count() > 0) {
        startCleanupThread();
    }
    LOG_DEBUG("store", "Memory store configured - Max entries: " + std::to_string(config_.max_entries) +
              ", compression: " + std::string(config_.enable_compression ? "on" : "off"));
}

MemoryCacheStore::~MemoryCacheStore() {
    stopCleanupThread();
}

std::optional<std::string> MemoryCacheStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    const auto now = now_();
    if (isExpired(it->second, now)) {
        entries_.erase(it);
        expirations_++;
        return std::nullopt;
    }

    it->second.last_accessed = now;
    if (it->second.compressed) {
        return decompress(it->second.data, it->second.original_size);
    }
    return it->second.data;
}

void MemoryCacheStore::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    if (ttl.count() < 0) {
        throw StoreError("Negative TTL for key " + key);
    }

    StoredValue stored;
    stored.original_size = value.size();
    if (config_.enable_compression && !value.empty() && value.size() >= config_.compression_threshold) {
        stored.data = compress(value);
        stored.compressed = true;
    } else {
        stored.data = value;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = now_();
    stored.last_accessed = now;
    if (ttl.count() > 0) {
        stored.expires_at = now + ttl;
    }

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second = std::move(stored);
        return;
    }

    if (entries_.size() >= config_.max_entries) {
        evictLRU();
    }
    entries_.emplace(key, std::move(stored));
}

bool MemoryCacheStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

bool MemoryCacheStore::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && !isExpired(it->second, now_());
}

std::vector<std::string> MemoryCacheStore::keysMatching(const std::string& pattern) {
    const std::regex matcher = compileGlob(pattern);

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = now_();
    std::vector<std::string> keys;
    for (const auto& [key, value] : entries_) {
        if (!isExpired(value, now) && std::regex_match(key, matcher)) {
            keys.push_back(key);
        }
    }
    return keys;
}

size_t MemoryCacheStore::removeMatching(const std::string& pattern) {
    const std::regex matcher = compileGlob(pattern);

    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (std::regex_match(it->first, matcher)) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

void MemoryCacheStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t removed_count = entries_.size();
    entries_.clear();
    LOG_INFO("store", "Cleared memory store, removed " + std::to_string(removed_count) + " entries");
}

size_t MemoryCacheStore::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = now_();
    size_t removed_count = 0;

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (isExpired(it->second, now)) {
            it = entries_.erase(it);
            removed_count++;
        } else {
            ++it;
        }
    }
    expirations_ += removed_count;

    if (removed_count > 0) {
        LOG_DEBUG("store", "Cleanup removed " + std::to_string(removed_count) + " expired entries");
    }
    return removed_count;
}

MemoryStoreStats MemoryCacheStore::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    MemoryStoreStats stats;
    stats.entries_count = entries_.size();
    stats.evictions = evictions_;
    stats.expirations = expirations_;
    for (const auto& [key, value] : entries_) {
        stats.memory_usage_bytes += key.size() + value.data.size() + sizeof(StoredValue);
        if (value.compressed) {
            stats.compressed_entries++;
        }
    }
    return stats;
}

bool MemoryCacheStore::isExpired(const StoredValue& value, Clock::time_point now) const {
    return value.expires_at && now >= *value.expires_at;
}

void MemoryCacheStore::evictLRU() {
    while (!entries_.empty() && entries_.size() >= config_.max_entries) {
        auto lru_it = entries_.begin();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->second.last_accessed < lru_it->second.last_accessed) {
                lru_it = it;
            }
        }

        LOG_DEBUG("store", "Evicted LRU entry: " + lru_it->first);
        entries_.erase(lru_it);
        evictions_++;
    }
}

std::string MemoryCacheStore::compress(const std::string& content) const {
    uLongf bound = compressBound(static_cast<uLong>(content.size()));
    std::string compressed(bound, '\0');

    const int result = compress2(reinterpret_cast<Bytef*>(&compressed[0]), &bound,
                                 reinterpret_cast<const Bytef*>(content.data()),
                                 static_cast<uLong>(content.size()), Z_DEFAULT_COMPRESSION);
    if (result != Z_OK) {
        throw StoreError("zlib compression failed with code " + std::to_string(result));
    }
    compressed.resize(bound);
    return compressed;
}

std::string MemoryCacheStore::decompress(const std::string& compressed_content, size_t original_size) const {
    std::string decompressed(original_size, '\0');
    uLongf length = static_cast<uLongf>(original_size);

    const int result = uncompress(reinterpret_cast<Bytef*>(&decompressed[0]), &length,
                                  reinterpret_cast<const Bytef*>(compressed_content.data()),
                                  static_cast<uLong>(compressed_content.size()));
    if (result != Z_OK || length != original_size) {
        throw StoreError("zlib decompression failed with code " + std::to_string(result));
    }
    return decompressed;
}

void MemoryCacheStore::startCleanupThread() {
    should_stop_cleanup_ = false;
    cleanup_thread_ = std::make_unique<std::thread>([this]() {
        cleanupLoop();
    });
}

void MemoryCacheStore::stopCleanupThread() {
    if (cleanup_thread_) {
        {
            std::lock_guard<std::mutex> lock(cleanup_mutex_);
            should_stop_cleanup_ = true;
        }
        cleanup_condition_.notify_all();
        cleanup_thread_->join();
        cleanup_thread_.reset();
    }
}

void MemoryCacheStore::cleanupLoop() {
    std::unique_lock<std::mutex> lock(cleanup_mutex_);
    while (!should_stop_cleanup_) {
        cleanup_condition_.wait_for(lock, config_.cleanup_interval, [this] {
            return should_stop_cleanup_.load();
        });
        if (should_stop_cleanup_) {
            break;
        }
        lock.unlock();
        cleanup();
        lock.lock();
    }
}

} // namespace MDC
