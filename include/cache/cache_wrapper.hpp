#pragma once

#include "cache/cache_store.hpp"
#include "cache/cache_types.hpp"
#include "cache/health_monitor.hpp"
#include "infrastructure/threading/thread_pool.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace MDC {

// EN: Process-wide settings of the wrapper.
// FR: Paramètres globaux du wrapper.
struct WrapperConfig {
    std::string software_version = "1.0.0";

    // EN: When false, wrap() calls compute directly and touches neither store nor health.
    // FR: Si faux, wrap() appelle directement le calcul sans toucher au stockage ni à la santé.
    bool enabled = true;

    // EN: In-flight slots older than this are dropped by the sweep.
    // FR: Les slots en cours plus vieux que ceci sont supprimés par le balayage.
    std::chrono::seconds inflight_timeout{120};

    // EN: Period of the maintenance thread; zero disables it.
    // FR: Période du thread de maintenance ; zéro le désactive.
    std::chrono::seconds sweep_interval{60};

    // EN: Period of the health summary log line; zero disables it.
    // FR: Période du log de résumé de santé ; zéro le désactive.
    std::chrono::seconds health_log_interval{300};

    // EN: Workers running stale-while-revalidate refreshes.
    // FR: Workers exécutant les rafraîchissements stale-while-revalidate.
    size_t refresh_threads = 2;
};

// EN: Outcome of a content check over stored entries.
// FR: Résultat d'une vérification de contenu des entrées stockées.
struct PurgeReport {
    size_t checked = 0;
    size_t removed = 0;
};

using KeyFilter = std::function<bool(const std::string&)>;

// EN: Compute-or-fetch primitive. Adds single-flight de-duplication, stale-while-revalidate,
//     bounded error caching and write ordering by creation time on top of a CacheStore.
// FR: Primitive calcul-ou-lecture. Ajoute la déduplication single-flight, le stale-while-revalidate,
//     la mise en cache bornée des erreurs et l'ordre d'écriture par date de création sur un CacheStore.
class CacheWrapper {
public:
    CacheWrapper(std::shared_ptr<CacheStore> store,
                 std::shared_ptr<HealthMonitor> health,
                 const WrapperConfig& config = WrapperConfig{},
                 TimeSource time_source = systemTimeSource());
    ~CacheWrapper();

    CacheWrapper(const CacheWrapper&) = delete;
    CacheWrapper& operator=(const CacheWrapper&) = delete;

    // EN: Return the cached value for key, join the in-flight computation, or run compute.
    //     Failures are rethrown to every waiter; cached failures are flagged servedFromCache().
    //     compute is copied and may run on a refresh worker after wrap() has returned (stale
    //     entries): it must capture by value or through owning pointers, never the caller's locals
    //     by reference.
    // FR: Retourne la valeur en cache, rejoint le calcul en cours ou exécute le calcul.
    //     Les échecs sont relancés à tous les appelants ; ceux venant du cache sont marqués servedFromCache().
    //     compute est copié et peut tourner sur un worker de rafraîchissement après le retour de wrap()
    //     (entrées stale) : il doit capturer par valeur ou via des pointeurs possédants, jamais les
    //     variables locales de l'appelant par référence.
    nlohmann::json wrap(const std::string& key, ComputeFunction compute,
                        const WrapOptions& options = WrapOptions{});

    // EN: Read an entry without computing and without health effects (except corruption).
    // FR: Lit une entrée sans calcul ni effet sur la santé (sauf corruption).
    std::optional<CacheEntry> peek(const std::string& key);

    EntryState inspect(const std::string& key);

    // EN: Write an entry unless the store already holds a value created later.
    //     Returns true when written. Store failures are logged, counted and reported as false.
    // FR: Écrit une entrée sauf si le stockage contient une valeur créée plus tard.
    //     Retourne vrai si écrite. Les échecs du stockage sont loggés, comptés et donnent faux.
    bool storeEntry(const CacheEntry& entry, std::chrono::seconds store_ttl);

    // EN: Store a computed value with the TTL policy of options.
    // FR: Stocke une valeur calculée avec la politique TTL des options.
    bool storeValue(const std::string& key, const nlohmann::json& value,
                    const WrapOptions& options, Clock::time_point created_at);

    // EN: Delete every key matching the glob pattern. Store failures propagate.
    // FR: Supprime toutes les clés correspondant au motif glob. Les échecs du stockage remontent.
    size_t invalidate(const std::string& pattern);

    // EN: Run validator over every stored value matching pattern (and include, when set) and delete
    //     the values it rejects. Corrupted envelopes are deleted too; error markers are left alone.
    // FR: Applique validator à chaque valeur stockée correspondant au motif (et à include s'il est
    //     fourni) et supprime celles rejetées. Les enveloppes corrompues aussi ; les marqueurs restent.
    PurgeReport purgeInvalid(const std::string& pattern, const PayloadValidator& validator,
                             const KeyFilter& include = KeyFilter{});

    // EN: Drop in-flight slots older than the configured timeout.
    // FR: Supprime les slots en cours plus vieux que le timeout configuré.
    size_t sweepInFlight();

    size_t inFlightCount() const;

    // EN: Block until every scheduled background refresh has finished.
    // FR: Bloque jusqu'à la fin de tous les rafraîchissements en arrière-plan.
    void waitForRefreshes();

    // EN: Stop maintenance and drain refreshes. Idempotent.
    // FR: Arrête la maintenance et vide les rafraîchissements. Idempotent.
    void shutdown();

    bool isEnabled() const { return enabled_.load(); }
    void setEnabled(bool enabled);

    Clock::time_point now() const { return now_(); }
    CacheStore& store() { return *store_; }
    HealthMonitor& health() { return *health_; }
    const WrapperConfig& getConfig() const { return config_; }

private:
    struct InFlight {
        std::shared_future<nlohmann::json> result;
        Clock::time_point started_at;
        uint64_t token;
    };

    struct Slot {
        std::shared_ptr<std::promise<nlohmann::json>> promise;
        uint64_t token = 0;
    };

    static constexpr size_t kWriteStripes = 16;

    static void validateOptions(const WrapOptions& options);

    // EN: Read and decode an entry. Corrupted entries are deleted and reported as missing.
    // FR: Lit et décode une entrée. Les entrées corrompues sont supprimées et vues comme absentes.
    std::optional<CacheEntry> readEntry(const std::string& key, CacheCategory category);

    // EN: Serve from an entry when possible. Throws the cached failure for error markers.
    // FR: Sert depuis une entrée si possible. Lance l'échec en cache pour les marqueurs d'erreur.
    std::optional<nlohmann::json> serveEntry(const std::string& key, const CacheEntry& entry,
                                             const ComputeFunction& compute, const WrapOptions& options,
                                             bool allow_stale);

    Slot claimSlotLocked(const std::string& key);
    void releaseSlot(const std::string& key, uint64_t token);

    nlohmann::json computeAsLeader(const std::string& key, const ComputeFunction& compute,
                                   const WrapOptions& options, int prior_retries,
                                   const Slot& slot, bool background);

    void recordFailure(const std::string& key, const std::exception_ptr& error,
                       const WrapOptions& options, int prior_retries,
                       Clock::time_point started_at, bool background);

    // EN: Drop a leftover error marker once a composite computed without storing the whole value.
    // FR: Supprime un marqueur d'erreur résiduel quand un composite est calculé sans être stocké entier.
    void clearMarker(const std::string& key, CacheCategory category);

    void scheduleRefresh(const std::string& key, const ComputeFunction& compute, const WrapOptions& options);

    std::mutex& writeStripe(const std::string& key);

    void maintenanceLoop();

    std::shared_ptr<CacheStore> store_;
    std::shared_ptr<HealthMonitor> health_;
    WrapperConfig config_;
    TimeSource now_;
    std::atomic<bool> enabled_;

    mutable std::mutex inflight_mutex_;
    std::unordered_map<std::string, InFlight> inflight_;
    uint64_t next_token_ = 1;

    std::array<std::mutex, kWriteStripes> write_mutexes_;

    std::unique_ptr<ThreadPool> refresh_pool_;

    std::unique_ptr<std::thread> maintenance_thread_;
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_condition_;
    bool stop_maintenance_ = false;
    std::atomic<bool> shut_down_{false};
};

} // namespace MDC
