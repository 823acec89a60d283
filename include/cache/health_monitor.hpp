#pragma once

#include "cache/cache_types.hpp"

#include <map>
#include <mutex>
#include <string>

namespace MDC {

// EN: Counters of one category. Stale, error-cache and partial hits are sub-counts of hits.
// FR: Compteurs d'une catégorie. Les hits stale, erreur et partiels sont des sous-comptes des hits.
struct HealthCounters {
    size_t hits = 0;
    size_t misses = 0;
    size_t errors = 0;
    size_t stale_hits = 0;
    size_t error_hits = 0;
    size_t partial_hits = 0;

    size_t requests() const { return hits + misses; }
    double hitRate() const;
    double errorRate() const;

    HealthCounters& operator+=(const HealthCounters& other);
};

struct HealthSnapshot {
    std::map<CacheCategory, HealthCounters> categories;
    Clock::time_point since;

    HealthCounters totals() const;
    HealthCounters forCategory(CacheCategory category) const;
};

// EN: Thread-safe cache outcome counters. Recording never throws and never affects caching.
// FR: Compteurs thread-safe des résultats du cache. L'enregistrement ne lève jamais d'exception.
class HealthMonitor {
public:
    explicit HealthMonitor(TimeSource time_source = systemTimeSource());

    void recordHit(CacheCategory category) noexcept;
    void recordMiss(CacheCategory category) noexcept;
    void recordError(CacheCategory category) noexcept;

    // EN: Each of these also counts a hit.
    // FR: Chacun compte aussi un hit.
    void recordStaleHit(CacheCategory category) noexcept;
    void recordErrorHit(CacheCategory category) noexcept;
    void recordPartialHit(CacheCategory category) noexcept;

    HealthSnapshot snapshot() const;

    // EN: Zero every counter and move the "since" mark to now.
    // FR: Remet tous les compteurs à zéro et déplace la marque "since" à maintenant.
    void reset();

    // EN: One-line human readable summary, e.g. for periodic logs.
    // FR: Résumé lisible sur une ligne, par ex. pour les logs périodiques.
    std::string describe() const;

private:
    using Counter = size_t HealthCounters::*;

    void record(CacheCategory category, Counter primary, Counter secondary) noexcept;

    TimeSource now_;
    mutable std::mutex mutex_;
    std::map<CacheCategory, HealthCounters> counters_;
    Clock::time_point since_;
};

} // namespace MDC
