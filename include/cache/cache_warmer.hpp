#pragma once

#include "cache/cache_types.hpp"
#include "cache/cache_wrapper.hpp"
#include "cache/config_provider.hpp"
#include "infrastructure/threading/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace MDC {

enum class WarmingStatus {
    NEVER_RUN,
    SUCCESS,
    PARTIAL,   // EN: Some targets failed / FR: Certaines cibles ont échoué
    FAILED,    // EN: Every target failed / FR: Toutes les cibles ont échoué
    SKIPPED    // EN: Another pass was running, or warming is off / FR: Une autre passe tournait, ou warming désactivé
};

std::string warmingStatusToString(WarmingStatus status);

// EN: One entry to keep warm: the same key, compute and options a request would use.
// FR: Une entrée à garder chaude : mêmes clé, calcul et options qu'une requête.
struct WarmTarget {
    std::string key;
    ComputeFunction compute;
    WrapOptions options;
};

// EN: Bookkeeping of the essential warming job.
// FR: Suivi du job de warming essentiel.
struct WarmingJob {
    std::vector<std::string> target_keys;
    int64_t cadence_ms = 0;
    std::optional<Clock::time_point> last_run_at;
    WarmingStatus last_status = WarmingStatus::NEVER_RUN;
    bool in_progress = false;
    size_t last_computed = 0;
    size_t last_skipped = 0;
    size_t last_failed = 0;
};

// EN: State owned by the warmer; startup logic reads it through isInitialWarmingComplete().
// FR: État possédé par le warmer ; le démarrage le lit via isInitialWarmingComplete().
struct WarmingState {
    bool initial_warming_complete = false;
    size_t passes_completed = 0;
};

struct WarmerConfig {
    size_t max_concurrency = 4;
    bool enabled = true;
    std::string maintenance_key = "global:maintenance:last_cache_warming";
    std::chrono::seconds maintenance_ttl{7 * 24 * 3600};
};

using RelatedTargetsResolver =
    std::function<std::vector<WarmTarget>(const std::string& id, const std::string& type)>;
using UserTargetsResolver =
    std::function<std::vector<WarmTarget>(const std::string& user_uuid, const nlohmann::json& user_config)>;

// EN: Proactive population of cache entries. Essential warming runs on demand or on a timer;
//     related and per-user warming are detached best-effort tasks whose failures are only logged.
// FR: Remplissage proactif du cache. Le warming essentiel tourne à la demande ou par minuterie ;
//     le warming lié et par utilisateur sont des tâches détachées dont les échecs sont seulement loggés.
class CacheWarmer {
public:
    CacheWarmer(CacheWrapper& wrapper,
                std::vector<WarmTarget> essential_targets = {},
                const WarmerConfig& config = WarmerConfig{},
                std::shared_ptr<ConfigProvider> config_provider = nullptr);
    ~CacheWarmer();

    CacheWarmer(const CacheWarmer&) = delete;
    CacheWarmer& operator=(const CacheWarmer&) = delete;

    void setEssentialTargets(std::vector<WarmTarget> targets);
    void setRelatedResolver(RelatedTargetsResolver resolver);
    void setUserResolver(UserTargetsResolver resolver);

    // EN: Warm every essential target that is not fresh, with bounded concurrency. Never throws
    //     for target failures. Returns SKIPPED when a pass is already running.
    // FR: Réchauffe chaque cible essentielle non fraîche, avec concurrence bornée. Ne lève pas
    //     pour les échecs de cibles. Retourne SKIPPED si une passe tourne déjà.
    WarmingStatus warmEssential();

    // EN: Run warmEssential() every interval on a background thread. Replaces any previous schedule.
    // FR: Exécute warmEssential() à chaque intervalle sur un thread. Remplace toute planification précédente.
    void scheduleEssential(int interval_minutes);
    void scheduleEssential(std::chrono::milliseconds interval);
    void stopSchedule();
    bool isScheduled() const;

    void warmRelated(const std::string& id, const std::string& type);
    void warmForUser(const std::string& user_uuid);

    bool isInitialWarmingComplete() const;
    WarmingState getState() const;
    WarmingJob getJob() const;

    // EN: Block until every detached warming task has finished.
    // FR: Bloque jusqu'à la fin de toutes les tâches de warming détachées.
    void waitForBackgroundTasks();

    void shutdown();

private:
    void schedulerLoop(std::chrono::milliseconds interval);

    // EN: Wrap each target sequentially; used inside detached tasks.
    // FR: Wrap chaque cible séquentiellement ; utilisé dans les tâches détachées.
    size_t warmTargets(const std::vector<WarmTarget>& targets, const std::string& label);

    void recordMaintenance(Clock::time_point started_at);

    CacheWrapper& wrapper_;
    WarmerConfig config_;
    std::shared_ptr<ConfigProvider> config_provider_;
    std::unique_ptr<ThreadPool> pool_;

    mutable std::mutex state_mutex_;
    std::vector<WarmTarget> essential_targets_;
    RelatedTargetsResolver related_resolver_;
    UserTargetsResolver user_resolver_;
    WarmingJob job_;
    WarmingState state_;

    std::mutex schedule_mutex_;
    std::condition_variable schedule_condition_;
    std::unique_ptr<std::thread> scheduler_thread_;
    bool stop_scheduler_ = false;
    std::atomic<bool> scheduled_{false};
    std::atomic<bool> shut_down_{false};
};

} // namespace MDC
