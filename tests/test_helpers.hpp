// EN: Shared fixtures for the cache tests - manual clock and mock store
// FR: Fixtures partagées pour les tests du cache - horloge manuelle et stockage mock

#pragma once

#include <gmock/gmock.h>

#include "cache/cache_store.hpp"
#include "cache/cache_types.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace MDC {
namespace testing_support {

// EN: Clock advanced explicitly by the test; shared by every component under test
// FR: Horloge avancée explicitement par le test ; partagée par tous les composants testés
class ManualClock {
public:
    ManualClock() : now_(Clock::time_point(std::chrono::hours(24 * 365 * 50))) {}

    Clock::time_point now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(Clock::duration delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

    TimeSource source() {
        return [this] { return now(); };
    }

private:
    mutable std::mutex mutex_;
    Clock::time_point now_;
};

class MockCacheStore : public CacheStore {
public:
    MOCK_METHOD(std::optional<std::string>, get, (const std::string& key), (override));
    MOCK_METHOD(void, set, (const std::string& key, const std::string& value, std::chrono::seconds ttl), (override));
    MOCK_METHOD(bool, remove, (const std::string& key), (override));
    MOCK_METHOD(bool, exists, (const std::string& key), (override));
    MOCK_METHOD(std::vector<std::string>, keysMatching, (const std::string& pattern), (override));
};

} // namespace testing_support
} // namespace MDC
