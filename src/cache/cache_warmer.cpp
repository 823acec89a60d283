// EN: Implementation of CacheWarmer - essential, related and per-user cache warming.
// FR: Implémentation de CacheWarmer - warming essentiel, lié et par utilisateur.

#include "cache/cache_warmer.hpp"
#include "cache/cache_key.hpp"
#include "infrastructure/logging/logger.hpp"

#include <stdexcept>
#include <utility>

namespace MDC {

namespace {

// EN: Clears the in-progress flag of a pass whatever way it ends.
// FR: Efface le drapeau en cours d'une passe quelle que soit sa fin.
class PassGuard {
public:
    PassGuard(std::mutex& mutex, WarmingJob& job) : mutex_(mutex), job_(job) {}
    ~PassGuard() {
        std::lock_guard<std::mutex> lock(mutex_);
        job_.in_progress = false;
    }

    PassGuard(const PassGuard&) = delete;
    PassGuard& operator=(const PassGuard&) = delete;

private:
    std::mutex& mutex_;
    WarmingJob& job_;
};

} // namespace

std::string warmingStatusToString(WarmingStatus status) {
    switch (status) {
        case WarmingStatus::NEVER_RUN: return "never_run";
        case WarmingStatus::SUCCESS:   return "success";
        case WarmingStatus::PARTIAL:   return "partial";
        case WarmingStatus::FAILED:    return "failed";
        case WarmingStatus::SKIPPED:   return "skipped";
    }
    return "never_run";
}

CacheWarmer::CacheWarmer(CacheWrapper& wrapper,
                         std::vector<WarmTarget> essential_targets,
                         const WarmerConfig& config,
                         std::shared_ptr<ConfigProvider> config_provider)
    : wrapper_(wrapper),
      config_(config),
      config_provider_(std::move(config_provider)) {

    if (config_.max_concurrency == 0) {
        throw std::invalid_argument("Warming concurrency must be at least 1");
    }
    if (config_.maintenance_key.empty()) {
        throw std::invalid_argument("Maintenance key must not be empty");
    }

    ThreadPoolConfig pool_config;
    pool_config.thread_count = config_.max_concurrency;
    pool_config.max_queue_size = 0;
    pool_config.name = "cache-warmer";
    pool_ = std::make_unique<ThreadPool>(pool_config);

    setEssentialTargets(std::move(essential_targets));
}

CacheWarmer::~CacheWarmer() {
    shutdown();
}

void CacheWarmer::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    stopSchedule();
    pool_->shutdown();
}

void CacheWarmer::setEssentialTargets(std::vector<WarmTarget> targets) {
    for (const auto& target : targets) {
        if (target.key.empty() || !target.compute) {
            throw std::invalid_argument("Warm targets need a key and a compute function");
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    essential_targets_ = std::move(targets);
    job_.target_keys.clear();
    for (const auto& target : essential_targets_) {
        job_.target_keys.push_back(target.key);
    }
}

void CacheWarmer::setRelatedResolver(RelatedTargetsResolver resolver) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    related_resolver_ = std::move(resolver);
}

void CacheWarmer::setUserResolver(UserTargetsResolver resolver) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    user_resolver_ = std::move(resolver);
}

WarmingStatus CacheWarmer::warmEssential() {
    if (!config_.enabled || !wrapper_.isEnabled()) {
        LOG_INFO("warmer", "Essential warming skipped (warming or caching disabled)");
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.initial_warming_complete = true;
        return WarmingStatus::SKIPPED;
    }

    std::vector<WarmTarget> targets;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (job_.in_progress) {
            LOG_INFO("warmer", "Essential warming already in progress, skipping this run");
            return WarmingStatus::SKIPPED;
        }
        job_.in_progress = true;
        targets = essential_targets_;
    }
    PassGuard guard(state_mutex_, job_);

    const auto started_at = wrapper_.now();
    const auto wall_start = std::chrono::steady_clock::now();
    LOG_INFO("warmer", "Warming " + std::to_string(targets.size()) + " essential targets");

    size_t computed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    std::vector<std::pair<std::string, std::future<nlohmann::json>>> pending;

    for (const auto& target : targets) {
        if (wrapper_.inspect(target.key) == EntryState::FRESH) {
            skipped++;
            continue;
        }

        try {
            pending.emplace_back(target.key, pool_->submitNamed("warm:" + target.key, TaskPriority::NORMAL,
                [this, target]() {
                    return wrapper_.wrap(target.key, target.compute, target.options);
                }));
        } catch (const std::exception& e) {
            failed++;
            LOG_WARN("warmer", "Could not schedule warming of " + CacheKey::truncateForLog(target.key) +
                     ": " + e.what());
        }
    }

    for (auto& [key, future] : pending) {
        try {
            future.get();
            computed++;
        } catch (const std::exception& e) {
            failed++;
            LOG_WARN_META("warmer", "Failed to warm essential target: " + std::string(e.what()),
                          (std::unordered_map<std::string, std::string>{{"key", CacheKey::truncateForLog(key)}}));
        } catch (...) {
            failed++;
            LOG_WARN_META("warmer", "Failed to warm essential target: non-standard exception",
                          (std::unordered_map<std::string, std::string>{{"key", CacheKey::truncateForLog(key)}}));
        }
    }

    WarmingStatus status = WarmingStatus::SUCCESS;
    if (failed > 0) {
        status = (computed == 0 && skipped == 0) ? WarmingStatus::FAILED : WarmingStatus::PARTIAL;
    }

    recordMaintenance(started_at);

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - wall_start);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        job_.last_run_at = started_at;
        job_.last_status = status;
        job_.last_computed = computed;
        job_.last_skipped = skipped;
        job_.last_failed = failed;
        state_.initial_warming_complete = true;
        state_.passes_completed++;
    }

    const std::string summary = "Essential warming " + warmingStatusToString(status) + " in " +
                                std::to_string(duration.count()) + "ms (" + std::to_string(computed) +
                                " warmed, " + std::to_string(skipped) + " fresh, " +
                                std::to_string(failed) + " failed)";
    if (status == WarmingStatus::SUCCESS) {
        LOG_INFO("warmer", summary);
    } else {
        LOG_WARN("warmer", summary);
    }
    return status;
}

void CacheWarmer::recordMaintenance(Clock::time_point started_at) {
    CacheEntry entry;
    entry.key = config_.maintenance_key;
    entry.value = std::chrono::duration_cast<std::chrono::milliseconds>(started_at.time_since_epoch()).count();
    entry.created_at = started_at;
    entry.ttl = config_.maintenance_ttl;
    entry.category = CacheCategory::GLOBAL;

    if (!wrapper_.storeEntry(entry, config_.maintenance_ttl)) {
        LOG_WARN("warmer", "Failed to record maintenance timestamp under " + config_.maintenance_key);
    }
}

void CacheWarmer::scheduleEssential(int interval_minutes) {
    if (interval_minutes <= 0) {
        throw std::invalid_argument("Warming interval must be positive");
    }
    scheduleEssential(std::chrono::milliseconds(static_cast<int64_t>(interval_minutes) * 60 * 1000));
}

void CacheWarmer::scheduleEssential(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("Warming interval must be positive");
    }
    if (shut_down_) {
        throw std::runtime_error("CacheWarmer is shut down");
    }

    stopSchedule();

    {
        std::lock_guard<std::mutex> lock(schedule_mutex_);
        stop_scheduler_ = false;
        scheduler_thread_ = std::make_unique<std::thread>(&CacheWarmer::schedulerLoop, this, interval);
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        job_.cadence_ms = interval.count();
    }
    scheduled_ = true;

    LOG_INFO("warmer", "Scheduled essential warming every " + std::to_string(interval.count()) + "ms");
}

void CacheWarmer::stopSchedule() {
    std::unique_ptr<std::thread> thread;
    {
        std::lock_guard<std::mutex> lock(schedule_mutex_);
        if (!scheduler_thread_) {
            return;
        }
        stop_scheduler_ = true;
        thread = std::move(scheduler_thread_);
    }
    schedule_condition_.notify_all();
    thread->join();
    scheduled_ = false;

    LOG_DEBUG("warmer", "Essential warming schedule stopped");
}

bool CacheWarmer::isScheduled() const {
    return scheduled_.load();
}

void CacheWarmer::schedulerLoop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(schedule_mutex_);
    while (!stop_scheduler_) {
        if (schedule_condition_.wait_for(lock, interval, [this] { return stop_scheduler_; })) {
            break;
        }
        lock.unlock();

        LOG_DEBUG("warmer", "Running scheduled essential warming");
        try {
            warmEssential();
        } catch (const std::exception& e) {
            LOG_ERROR("warmer", "Scheduled essential warming failed: " + std::string(e.what()));
        } catch (...) {
            LOG_ERROR("warmer", "Scheduled essential warming failed with a non-standard exception");
        }

        lock.lock();
    }
}

size_t CacheWarmer::warmTargets(const std::vector<WarmTarget>& targets, const std::string& label) {
    size_t warmed = 0;
    for (const auto& target : targets) {
        try {
            wrapper_.wrap(target.key, target.compute, target.options);
            warmed++;
        } catch (const std::exception& e) {
            LOG_WARN_META("warmer", "Failed to warm " + label + ": " + e.what(),
                          (std::unordered_map<std::string, std::string>{{"key", CacheKey::truncateForLog(target.key)}}));
        } catch (...) {
            LOG_WARN_META("warmer", "Failed to warm " + label + ": non-standard exception",
                          (std::unordered_map<std::string, std::string>{{"key", CacheKey::truncateForLog(target.key)}}));
        }
    }
    LOG_DEBUG("warmer", "Warmed " + std::to_string(warmed) + "/" + std::to_string(targets.size()) +
              " targets for " + label);
    return warmed;
}

void CacheWarmer::warmRelated(const std::string& id, const std::string& type) {
    RelatedTargetsResolver resolver;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        resolver = related_resolver_;
    }
    if (!resolver || !config_.enabled || !wrapper_.isEnabled()) {
        return;
    }

    const std::string label = "related " + type + " " + id;
    try {
        pool_->submitNamed("warm-related:" + type + ":" + id, TaskPriority::LOW,
            [this, resolver, id, type, label]() {
                try {
                    warmTargets(resolver(id, type), label);
                } catch (const std::exception& e) {
                    LOG_WARN("warmer", "Related warming failed for " + label + ": " + e.what());
                } catch (...) {
                    LOG_WARN("warmer", "Related warming failed for " + label + ": non-standard exception");
                }
            });
    } catch (const std::exception& e) {
        LOG_WARN("warmer", "Could not schedule " + label + " warming: " + e.what());
    }
}

void CacheWarmer::warmForUser(const std::string& user_uuid) {
    UserTargetsResolver resolver;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        resolver = user_resolver_;
    }
    if (!resolver || !config_provider_ || !config_.enabled || !wrapper_.isEnabled()) {
        return;
    }

    const std::string label = "user " + CacheKey::truncateForLog(user_uuid, 13);
    auto provider = config_provider_;
    try {
        pool_->submitNamed("warm-user", TaskPriority::LOW,
            [this, resolver, provider, user_uuid, label]() {
                try {
                    auto user_config = provider->loadUserConfig(user_uuid);
                    if (!user_config) {
                        LOG_DEBUG("warmer", "No configuration found for " + label + ", nothing to warm");
                        return;
                    }
                    warmTargets(resolver(user_uuid, *user_config), label);
                } catch (const std::exception& e) {
                    LOG_WARN("warmer", "User warming failed for " + label + ": " + e.what());
                } catch (...) {
                    LOG_WARN("warmer", "User warming failed for " + label + ": non-standard exception");
                }
            });
    } catch (const std::exception& e) {
        LOG_WARN("warmer", "Could not schedule warming for " + label + ": " + e.what());
    }
}

bool CacheWarmer::isInitialWarmingComplete() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.initial_warming_complete;
}

WarmingState CacheWarmer::getState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

WarmingJob CacheWarmer::getJob() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return job_;
}

void CacheWarmer::waitForBackgroundTasks() {
    pool_->waitForAll();
}

} // namespace MDC
