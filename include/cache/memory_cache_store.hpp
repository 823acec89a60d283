#pragma once

#include "cache/cache_store.hpp"
#include "cache/cache_types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace MDC {

// EN: Configuration for the in-process store.
// FR: Configuration du stockage en mémoire.
struct MemoryStoreConfig {
    // EN: Maximum number of entries before least-recently-used eviction.
    // FR: Nombre maximum d'entrées avant éviction LRU.
    size_t max_entries = 100000;

    // EN: Deflate payloads at or above the threshold.
    // FR: Compresse les contenus au-delà du seuil.
    bool enable_compression = true;
    size_t compression_threshold = 512;

    // EN: Background removal of expired entries; zero disables the thread.
    // FR: Suppression en arrière-plan des entrées expirées ; zéro désactive le thread.
    std::chrono::seconds cleanup_interval{300};
};

// EN: Statistics for store monitoring.
// FR: Statistiques pour le monitoring du stockage.
struct MemoryStoreStats {
    size_t entries_count = 0;
    size_t memory_usage_bytes = 0;
    size_t compressed_entries = 0;
    size_t evictions = 0;
    size_t expirations = 0;
};

// EN: Thread-safe in-process CacheStore with TTL, LRU eviction and optional zlib compression.
// FR: CacheStore en mémoire thread-safe avec TTL, éviction LRU et compression zlib optionnelle.
class MemoryCacheStore : public CacheStore {
public:
    explicit MemoryCacheStore(const MemoryStoreConfig& config = MemoryStoreConfig{},
                              TimeSource time_source = systemTimeSource());
    ~MemoryCacheStore() override;

    MemoryCacheStore(const MemoryCacheStore&) = delete;
    MemoryCacheStore& operator=(const MemoryCacheStore&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    bool remove(const std::string& key) override;
    bool exists(const std::string& key) override;
    std::vector<std::string> keysMatching(const std::string& pattern) override;

    // EN: Matches and removes under one lock.
    // FR: Recherche et supprime sous un seul verrou.
    size_t removeMatching(const std::string& pattern) override;

    // EN: Remove every entry.
    // FR: Supprime toutes les entrées.
    void clear();

    // EN: Remove expired entries now and return how many were removed.
    // FR: Supprime maintenant les entrées expirées et retourne leur nombre.
    size_t cleanup();

    MemoryStoreStats getStats() const;

    const MemoryStoreConfig& getConfig() const { return config_; }

private:
    struct StoredValue {
        std::string data;
        bool compressed = false;
        size_t original_size = 0;
        std::optional<Clock::time_point> expires_at;
        Clock::time_point last_accessed;
    };

    bool isExpired(const StoredValue& value, Clock::time_point now) const;

    // EN: Evict least recently used entries while the store is full. Caller holds the lock.
    // FR: Évince les entrées les moins récemment utilisées tant que le stockage est plein. Verrou tenu.
    void evictLRU();

    std::string compress(const std::string& content) const;
    std::string decompress(const std::string& compressed_content, size_t original_size) const;

    void startCleanupThread();
    void stopCleanupThread();
    void cleanupLoop();

    MemoryStoreConfig config_;
    TimeSource now_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoredValue> entries_;
    size_t evictions_ = 0;
    size_t expirations_ = 0;

    std::unique_ptr<std::thread> cleanup_thread_;
    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_condition_;
    std::atomic<bool> should_stop_cleanup_{false};
};

} // namespace MDC
