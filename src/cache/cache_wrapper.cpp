// EN: Implementation of CacheWrapper - single-flight compute-or-fetch with TTL, stale and error policies.
// FR: Implémentation de CacheWrapper - calcul-ou-lecture single-flight avec politiques TTL, stale et erreurs.

#include "cache/cache_wrapper.hpp"
#include "cache/cache_key.hpp"
#include "infrastructure/logging/logger.hpp"

#include <functional>
#include <stdexcept>

namespace MDC {

CacheWrapper::CacheWrapper(std::shared_ptr<CacheStore> store,
                           std::shared_ptr<HealthMonitor> health,
                           const WrapperConfig& config,
                           TimeSource time_source)
    : store_(std::move(store)),
      health_(std::move(health)),
      config_(config),
      now_(std::move(time_source)),
      enabled_(config.enabled) {

    if (!store_) {
        throw std::invalid_argument("CacheWrapper requires a store");
    }
    if (!health_) {
        throw std::invalid_argument("CacheWrapper requires a health monitor");
    }
    if (!now_) {
        now_ = systemTimeSource();
    }

    ThreadPoolConfig pool_config;
    pool_config.thread_count = config_.refresh_threads > 0 ? config_.refresh_threads : 1;
    pool_config.name = "cache-refresh";
    refresh_pool_ = std::make_unique<ThreadPool>(pool_config);

    if (config_.sweep_interval.count() > 0) {
        maintenance_thread_ = std::make_unique<std::thread>(&CacheWrapper::maintenanceLoop, this);
    }

    LOG_INFO("cache", "Cache wrapper ready - version " + config_.software_version +
             (enabled_ ? "" : " (caching disabled)"));
}

CacheWrapper::~CacheWrapper() {
    shutdown();
}

void CacheWrapper::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }

    if (maintenance_thread_) {
        {
            std::lock_guard<std::mutex> lock(maintenance_mutex_);
            stop_maintenance_ = true;
        }
        maintenance_condition_.notify_all();
        maintenance_thread_->join();
        maintenance_thread_.reset();
    }

    refresh_pool_->shutdown();
}

void CacheWrapper::setEnabled(bool enabled) {
    enabled_ = enabled;
    LOG_INFO("cache", std::string("Caching ") + (enabled ? "enabled" : "disabled"));
}

void CacheWrapper::validateOptions(const WrapOptions& options) {
    if (options.ttl.count() < 0 || options.stale_window.count() < 0 ||
        options.error_ttl.count() < 0 || options.not_found_ttl.count() < 0 ||
        options.rate_limited_ttl.count() < 0 || options.rejected_ttl.count() < 0) {
        throw std::invalid_argument("Cache TTLs must not be negative");
    }
    if (options.max_retries < 0) {
        throw std::invalid_argument("max_retries must not be negative");
    }
}

nlohmann::json CacheWrapper::wrap(const std::string& key, ComputeFunction compute, const WrapOptions& options) {
    if (!compute) {
        throw std::invalid_argument("wrap requires a compute function");
    }
    validateOptions(options);

    if (!enabled_) {
        return compute();
    }

    int prior_retries = 0;
    if (auto entry = readEntry(key, options.category)) {
        if (auto served = serveEntry(key, *entry, compute, options, true)) {
            return *served;
        }
        if (entry->is_error_marker) {
            prior_retries = entry->retry_count;
        }
    }

    std::shared_future<nlohmann::json> pending;
    Slot slot;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        auto it = inflight_.find(key);
        if (it != inflight_.end()) {
            pending = it->second.result;
        } else {
            slot = claimSlotLocked(key);
        }
    }

    if (pending.valid()) {
        LOG_DEBUG("cache", "Joining in-flight computation for " + CacheKey::truncateForLog(key));
        return pending.get();
    }

    // EN: A previous leader may have settled between the lookup and the claim.
    // FR: Un leader précédent a pu terminer entre la lecture et la réservation.
    try {
        if (auto entry = readEntry(key, options.category)) {
            if (auto served = serveEntry(key, *entry, compute, options, false)) {
                releaseSlot(key, slot.token);
                slot.promise->set_value(*served);
                return *served;
            }
            if (entry->is_error_marker) {
                prior_retries = entry->retry_count;
            }
        }
    } catch (const CacheError&) {
        releaseSlot(key, slot.token);
        slot.promise->set_exception(std::current_exception());
        throw;
    }

    return computeAsLeader(key, compute, options, prior_retries, slot, false);
}

std::optional<nlohmann::json> CacheWrapper::serveEntry(const std::string& key, const CacheEntry& entry,
                                                       const ComputeFunction& compute,
                                                       const WrapOptions& options, bool allow_stale) {
    switch (entry.stateAt(now_())) {
        case EntryState::FRESH:
            health_->recordHit(options.category);
            LOG_DEBUG("cache", "Cache hit for " + CacheKey::truncateForLog(key));
            return entry.value;

        case EntryState::STALE:
            if (!allow_stale) {
                return std::nullopt;
            }
            health_->recordStaleHit(options.category);
            LOG_DEBUG("cache", "Serving stale value for " + CacheKey::truncateForLog(key));
            scheduleRefresh(key, compute, options);
            return entry.value;

        case EntryState::ERROR_CACHED:
            health_->recordErrorHit(options.category);
            LOG_DEBUG("cache", "Cached " + failureKindToString(entry.error_kind) + " failure for " +
                      CacheKey::truncateForLog(key));
            std::rethrow_exception(makeCachedFailure(entry.error_kind, entry.error_message, entry.error_status));

        case EntryState::EMPTY:
        case EntryState::EXPIRED:
            break;
    }
    return std::nullopt;
}

std::optional<CacheEntry> CacheWrapper::readEntry(const std::string& key, CacheCategory category) {
    std::optional<std::string> raw;
    try {
        raw = store_->get(key);
    } catch (const std::exception& e) {
        health_->recordError(category);
        LOG_WARN_META("cache", "Store read failed, treating as miss: " + std::string(e.what()),
                      (std::unordered_map<std::string, std::string>{{"key", CacheKey::truncateForLog(key)}}));
        return std::nullopt;
    }

    if (!raw) {
        return std::nullopt;
    }

    try {
        return parseEntry(key, *raw);
    } catch (const std::invalid_argument& e) {
        health_->recordError(category);
        LOG_WARN_META("cache", "Corrupted cache entry removed: " + std::string(e.what()),
                      (std::unordered_map<std::string, std::string>{{"key", CacheKey::truncateForLog(key)}}));
        try {
            store_->remove(key);
        } catch (const std::exception& remove_error) {
            LOG_ERROR("cache", "Failed to remove corrupted entry " + CacheKey::truncateForLog(key) +
                      ": " + remove_error.what());
        }
        return std::nullopt;
    }
}

std::optional<CacheEntry> CacheWrapper::peek(const std::string& key) {
    auto parts = CacheKey::parse(key);
    return readEntry(key, parts ? parts->category : CacheCategory::GLOBAL);
}

EntryState CacheWrapper::inspect(const std::string& key) {
    auto entry = peek(key);
    return entry ? entry->stateAt(now_()) : EntryState::EMPTY;
}

CacheWrapper::Slot CacheWrapper::claimSlotLocked(const std::string& key) {
    Slot slot;
    slot.promise = std::make_shared<std::promise<nlohmann::json>>();
    slot.token = next_token_++;
    inflight_[key] = InFlight{slot.promise->get_future().share(), now_(), slot.token};
    return slot;
}

void CacheWrapper::releaseSlot(const std::string& key, uint64_t token) {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    auto it = inflight_.find(key);
    if (it != inflight_.end() && it->second.token == token) {
        inflight_.erase(it);
    }
}

nlohmann::json CacheWrapper::computeAsLeader(const std::string& key, const ComputeFunction& compute,
                                             const WrapOptions& options, int prior_retries,
                                             const Slot& slot, bool background) {
    const auto started_at = now_();

    try {
        nlohmann::json value = compute();

        if (options.validator) {
            const auto issues = options.validator(value);
            if (!issues.empty()) {
                throw InternalComputeError("Computed value rejected: " + issues.front());
            }
        }

        health_->recordMiss(options.category);

        if (options.store_result) {
            if (!options.allow_empty && isEmptyPayload(value)) {
                LOG_DEBUG("cache", "Empty result not cached for " + CacheKey::truncateForLog(key));
            } else {
                storeValue(key, value, options, started_at);
            }
        } else {
            clearMarker(key, options.category);
        }

        releaseSlot(key, slot.token);
        slot.promise->set_value(value);
        return value;

    } catch (...) {
        const std::exception_ptr error = std::current_exception();

        health_->recordMiss(options.category);
        health_->recordError(options.category);
        recordFailure(key, error, options, prior_retries, started_at, background);

        releaseSlot(key, slot.token);
        slot.promise->set_exception(error);
        std::rethrow_exception(error);
    }
}

void CacheWrapper::recordFailure(const std::string& key, const std::exception_ptr& error,
                                 const WrapOptions& options, int prior_retries,
                                 Clock::time_point started_at, bool background) {
    const FailureKind kind = classifyFailure(error);
    const std::string message = describeFailure(error);
    const std::unordered_map<std::string, std::string> metadata = {
        {"key", CacheKey::truncateForLog(key)},
        {"category", categoryToString(options.category)},
        {"kind", failureKindToString(kind)}
    };

    if (kind == FailureKind::INTERNAL) {
        LOG_ERROR_META("cache", "Internal compute error, not cached: " + message, metadata);
        return;
    }

    // EN: A failed refresh never replaces the stale value with an error marker.
    // FR: Un rafraîchissement échoué ne remplace jamais la valeur stale par un marqueur.
    if (background) {
        LOG_WARN_META("cache", "Background refresh failed, keeping stale value: " + message, metadata);
        return;
    }

    if (!options.error_caching) {
        LOG_WARN_META("cache", "Upstream failure (error caching off): " + message, metadata);
        return;
    }

    const int status_code = failureStatusCode(error);
    const std::chrono::seconds marker_ttl = options.markerTtl(kind, status_code);

    CacheEntry marker;
    marker.key = key;
    marker.created_at = started_at;
    marker.category = options.category;
    marker.is_error_marker = true;
    marker.error_kind = kind;
    marker.error_message = message;
    marker.error_status = status_code;
    marker.ttl = marker_ttl;

    if (kind == FailureKind::NOT_FOUND) {
        if (marker_ttl.count() == 0) {
            return;
        }
        marker.retry_count = 0;
        storeEntry(marker, marker_ttl);
        LOG_INFO_META("cache", "Caching not-found result for " + std::to_string(marker_ttl.count()) + "s",
                      metadata);
        return;
    }

    if (prior_retries >= options.max_retries || marker_ttl.count() == 0) {
        try {
            store_->remove(key);
        } catch (const std::exception& e) {
            LOG_WARN("cache", "Failed to clear error marker for " + CacheKey::truncateForLog(key) +
                     ": " + e.what());
        }
        LOG_ERROR_META("cache", "Retry budget exhausted after " + std::to_string(prior_retries + 1) +
                       " attempts: " + message, metadata);
        return;
    }

    // EN: The marker outlives its freshness window so the retry count survives until the next attempt.
    // FR: Le marqueur survit à sa fenêtre de fraîcheur pour conserver le compteur jusqu'au prochain essai.
    marker.retry_count = prior_retries + 1;
    storeEntry(marker, marker_ttl * (options.max_retries + 1));
    LOG_WARN_META("cache", "Caching transient failure (attempt " + std::to_string(marker.retry_count) + "/" +
                  std::to_string(options.max_retries) + ") for " +
                  std::to_string(marker_ttl.count()) + "s: " + message, metadata);
}

bool CacheWrapper::storeValue(const std::string& key, const nlohmann::json& value,
                              const WrapOptions& options, Clock::time_point created_at) {
    if (options.ttl.count() <= 0) {
        LOG_DEBUG("cache", "Zero TTL, not caching " + CacheKey::truncateForLog(key));
        return false;
    }

    CacheEntry entry;
    entry.key = key;
    entry.value = value;
    entry.created_at = created_at;
    entry.ttl = options.ttl;
    entry.stale_window = options.stale_window;
    entry.category = options.category;
    return storeEntry(entry, options.ttl + options.stale_window);
}

std::mutex& CacheWrapper::writeStripe(const std::string& key) {
    return write_mutexes_[std::hash<std::string>{}(key) % kWriteStripes];
}

bool CacheWrapper::storeEntry(const CacheEntry& entry, std::chrono::seconds store_ttl) {
    std::lock_guard<std::mutex> lock(writeStripe(entry.key));

    try {
        if (auto raw = store_->get(entry.key)) {
            try {
                const CacheEntry existing = parseEntry(entry.key, *raw);
                if (!existing.is_error_marker && existing.created_at > entry.created_at) {
                    LOG_DEBUG("cache", "Discarding older result for " + CacheKey::truncateForLog(entry.key));
                    return false;
                }
            } catch (const std::invalid_argument&) {
                // EN: Corrupted previous value; overwrite it.
                // FR: Valeur précédente corrompue ; on l'écrase.
            }
        }

        store_->set(entry.key, serializeEntry(entry), store_ttl);
        return true;

    } catch (const std::exception& e) {
        health_->recordError(entry.category);
        LOG_WARN_META("cache", "Store write failed: " + std::string(e.what()),
                      (std::unordered_map<std::string, std::string>{{"key", CacheKey::truncateForLog(entry.key)}}));
        return false;
    }
}

void CacheWrapper::clearMarker(const std::string& key, CacheCategory category) {
    std::lock_guard<std::mutex> lock(writeStripe(key));
    try {
        if (store_->exists(key)) {
            store_->remove(key);
        }
    } catch (const std::exception& e) {
        health_->recordError(category);
        LOG_WARN("cache", "Failed to clear error marker for " + CacheKey::truncateForLog(key) + ": " + e.what());
    }
}

void CacheWrapper::scheduleRefresh(const std::string& key, const ComputeFunction& compute,
                                   const WrapOptions& options) {
    Slot slot;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        if (inflight_.find(key) != inflight_.end()) {
            return;
        }
        slot = claimSlotLocked(key);
    }

    try {
        refresh_pool_->submitNamed("refresh:" + key, TaskPriority::LOW,
            [this, key, compute, options, slot]() {
                try {
                    computeAsLeader(key, compute, options, 0, slot, true);
                } catch (const std::exception& e) {
                    LOG_DEBUG("cache", "Refresh of " + CacheKey::truncateForLog(key) + " ended with: " + e.what());
                } catch (...) {
                    LOG_WARN("cache", "Refresh of " + CacheKey::truncateForLog(key) +
                             " ended with a non-standard exception");
                }
            });
        LOG_DEBUG("cache", "Scheduled background refresh for " + CacheKey::truncateForLog(key));

    } catch (const std::exception& e) {
        LOG_WARN("cache", "Could not schedule refresh for " + CacheKey::truncateForLog(key) + ": " + e.what());
        releaseSlot(key, slot.token);
        slot.promise->set_exception(std::current_exception());
    }
}

size_t CacheWrapper::invalidate(const std::string& pattern) {
    const size_t removed = store_->removeMatching(pattern);
    LOG_INFO("cache", "Invalidated " + std::to_string(removed) + " entries matching " + pattern);
    return removed;
}

PurgeReport CacheWrapper::purgeInvalid(const std::string& pattern, const PayloadValidator& validator,
                                       const KeyFilter& include) {
    if (!validator) {
        throw std::invalid_argument("purgeInvalid requires a validator");
    }

    PurgeReport report;
    for (const auto& key : store_->keysMatching(pattern)) {
        if (include && !include(key)) {
            continue;
        }
        report.checked++;

        const auto parts = CacheKey::parse(key);
        const CacheCategory category = parts ? parts->category : CacheCategory::GLOBAL;
        const bool was_present = store_->exists(key);
        const auto entry = readEntry(key, category);
        if (!entry) {
            // EN: readEntry already dropped a corrupted envelope.
            // FR: readEntry a déjà supprimé une enveloppe corrompue.
            if (was_present && !store_->exists(key)) {
                report.removed++;
            }
            continue;
        }
        if (entry->is_error_marker) {
            continue;
        }

        const auto issues = validator(entry->value);
        if (issues.empty()) {
            continue;
        }

        std::lock_guard<std::mutex> lock(writeStripe(key));
        if (store_->remove(key)) {
            report.removed++;
            LOG_WARN_META("cache", "Removed cached entry with bad data: " + issues.front(),
                          (std::unordered_map<std::string, std::string>{
                              {"key", CacheKey::truncateForLog(key)},
                              {"issues", std::to_string(issues.size())}}));
        }
    }

    LOG_INFO("cache", "Content check of " + pattern + ": " + std::to_string(report.checked) + " checked, " +
             std::to_string(report.removed) + " removed");
    return report;
}

size_t CacheWrapper::sweepInFlight() {
    const auto now = now_();
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(inflight_mutex_);
    for (auto it = inflight_.begin(); it != inflight_.end();) {
        if (now - it->second.started_at > config_.inflight_timeout) {
            LOG_WARN("cache", "Dropping in-flight slot older than " +
                     std::to_string(config_.inflight_timeout.count()) + "s: " +
                     CacheKey::truncateForLog(it->first));
            it = inflight_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t CacheWrapper::inFlightCount() const {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    return inflight_.size();
}

void CacheWrapper::waitForRefreshes() {
    refresh_pool_->waitForAll();
}

void CacheWrapper::maintenanceLoop() {
    auto last_health_log = std::chrono::steady_clock::now();

    std::unique_lock<std::mutex> lock(maintenance_mutex_);
    while (!stop_maintenance_) {
        maintenance_condition_.wait_for(lock, config_.sweep_interval, [this] { return stop_maintenance_; });
        if (stop_maintenance_) {
            break;
        }
        lock.unlock();

        try {
            sweepInFlight();
            const auto now = std::chrono::steady_clock::now();
            if (config_.health_log_interval.count() > 0 &&
                now - last_health_log >= config_.health_log_interval) {
                LOG_INFO("health", health_->describe());
                last_health_log = now;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("cache", "Maintenance pass failed: " + std::string(e.what()));
        }

        lock.lock();
    }
}

} // namespace MDC
