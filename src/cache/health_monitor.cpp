// EN: Cache health counters and their human readable summary.
// FR: Compteurs de santé du cache et leur résumé lisible.

#include "cache/health_monitor.hpp"
#include "infrastructure/logging/logger.hpp"

#include <iomanip>
#include <sstream>

namespace MDC {

double HealthCounters::hitRate() const {
    const size_t total = requests();
    return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
}

double HealthCounters::errorRate() const {
    const size_t total = requests();
    return total > 0 ? static_cast<double>(errors) / static_cast<double>(total) : 0.0;
}

HealthCounters& HealthCounters::operator+=(const HealthCounters& other) {
    hits += other.hits;
    misses += other.misses;
    errors += other.errors;
    stale_hits += other.stale_hits;
    error_hits += other.error_hits;
    partial_hits += other.partial_hits;
    return *this;
}

HealthCounters HealthSnapshot::totals() const {
    HealthCounters total;
    for (const auto& [category, counters] : categories) {
        total += counters;
    }
    return total;
}

HealthCounters HealthSnapshot::forCategory(CacheCategory category) const {
    auto it = categories.find(category);
    return it != categories.end() ? it->second : HealthCounters{};
}

HealthMonitor::HealthMonitor(TimeSource time_source) : now_(std::move(time_source)) {
    if (!now_) {
        now_ = systemTimeSource();
    }
    since_ = now_();
}

void HealthMonitor::recordHit(CacheCategory category) noexcept {
    record(category, &HealthCounters::hits, nullptr);
}

void HealthMonitor::recordMiss(CacheCategory category) noexcept {
    record(category, &HealthCounters::misses, nullptr);
}

void HealthMonitor::recordError(CacheCategory category) noexcept {
    record(category, &HealthCounters::errors, nullptr);
}

void HealthMonitor::recordStaleHit(CacheCategory category) noexcept {
    record(category, &HealthCounters::hits, &HealthCounters::stale_hits);
}

void HealthMonitor::recordErrorHit(CacheCategory category) noexcept {
    record(category, &HealthCounters::hits, &HealthCounters::error_hits);
}

void HealthMonitor::recordPartialHit(CacheCategory category) noexcept {
    record(category, &HealthCounters::hits, &HealthCounters::partial_hits);
}

void HealthMonitor::record(CacheCategory category, Counter primary, Counter secondary) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        HealthCounters& counters = counters_[category];
        ++(counters.*primary);
        if (secondary) {
            ++(counters.*secondary);
        }
    } catch (const std::exception& e) {
        try {
            LOG_WARN("health", "Failed to record cache outcome: " + std::string(e.what()));
        } catch (const std::exception&) {
            // EN: Logging itself failed; counting stays best-effort.
            // FR: Le log lui-même a échoué ; le comptage reste best-effort.
        }
    }
}

HealthSnapshot HealthMonitor::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    HealthSnapshot snapshot;
    snapshot.categories = counters_;
    snapshot.since = since_;
    return snapshot;
}

void HealthMonitor::reset() {
    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    since_ = now;
}

std::string HealthMonitor::describe() const {
    const HealthSnapshot current = snapshot();
    const HealthCounters total = current.totals();
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now_() - current.since);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << "cache health: hit rate " << total.hitRate() * 100.0 << "%"
        << ", error rate " << total.errorRate() * 100.0 << "%"
        << " (" << total.hits << " hits, " << total.misses << " misses, " << total.errors << " errors"
        << ", " << total.stale_hits << " stale, " << total.partial_hits << " partial"
        << ") over " << uptime.count() << "s";

    for (const auto& [category, counters] : current.categories) {
        oss << "; " << categoryToString(category) << " " << counters.hits << "/" << counters.requests();
    }
    return oss.str();
}

} // namespace MDC
