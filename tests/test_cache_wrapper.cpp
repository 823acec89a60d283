// EN: Unit tests for CacheWrapper - hits, single-flight, stale-while-revalidate, error caching
// FR: Tests unitaires pour CacheWrapper - hits, single-flight, stale-while-revalidate, cache d'erreurs

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "cache/cache_key.hpp"
#include "cache/cache_wrapper.hpp"
#include "cache/memory_cache_store.hpp"
#include "infrastructure/logging/logger.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace MDC;
using namespace MDC::testing_support;
using namespace std::chrono_literals;

// EN: Test fixture wiring a memory store, a health monitor and a wrapper on a manual clock
// FR: Fixture reliant un stockage mémoire, un moniteur de santé et un wrapper sur une horloge manuelle
class CacheWrapperTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);

        MemoryStoreConfig store_config;
        store_config.cleanup_interval = 0s;
        store_ = std::make_shared<MemoryCacheStore>(store_config, clock_.source());
        health_ = std::make_shared<HealthMonitor>(clock_.source());

        WrapperConfig config;
        config.software_version = "v1.0";
        config.sweep_interval = 0s;
        wrapper_ = std::make_unique<CacheWrapper>(store_, health_, config, clock_.source());
    }

    void TearDown() override {
        wrapper_->shutdown();
    }

    static WrapOptions makeOptions(CacheCategory category, std::chrono::seconds ttl,
                                   std::chrono::seconds stale_window = 0s) {
        WrapOptions options;
        options.category = category;
        options.ttl = ttl;
        options.stale_window = stale_window;
        return options;
    }

    ManualClock clock_;
    std::shared_ptr<MemoryCacheStore> store_;
    std::shared_ptr<HealthMonitor> health_;
    std::unique_ptr<CacheWrapper> wrapper_;
};

// EN: A second call inside the TTL is served from cache
// FR: Un second appel dans le TTL est servi depuis le cache
TEST_F(CacheWrapperTest, FreshEntry_ShouldBeServedWithoutRecomputing) {
    const std::string key = "global:v1.0:provider:anime-genres";
    std::atomic<int> calls{0};
    auto compute = [&calls]() {
        calls++;
        return nlohmann::json::array({"Action", "Comedy", "Drama", "Fantasy", "Romance"});
    };
    const auto options = makeOptions(CacheCategory::PROVIDER, 3600s);

    const auto first = wrapper_->wrap(key, compute, options);
    clock_.advance(3599s);
    const auto second = wrapper_->wrap(key, compute, options);

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(first.size(), 5u);
    EXPECT_EQ(first, second);

    const auto counters = health_->snapshot().forCategory(CacheCategory::PROVIDER);
    EXPECT_EQ(counters.hits, 1u);
    EXPECT_EQ(counters.misses, 1u);
    EXPECT_EQ(counters.errors, 0u);
}

// EN: Concurrent callers for one key share a single computation
// FR: Des appelants concurrents pour une clé partagent un seul calcul
TEST_F(CacheWrapperTest, ConcurrentCallers_ShouldShareOneComputation) {
    const std::string key = "global:v1.0:meta:tt0111161";
    std::atomic<int> calls{0};
    auto compute = [&calls]() {
        calls++;
        std::this_thread::sleep_for(100ms);
        return nlohmann::json{{"id", "tt0111161"}, {"name", "The Shawshank Redemption"}};
    };
    const auto options = makeOptions(CacheCategory::META, 3600s);

    constexpr int kCallers = 8;
    std::vector<std::future<nlohmann::json>> results;
    for (int i = 0; i < kCallers; ++i) {
        results.push_back(std::async(std::launch::async, [&]() {
            return wrapper_->wrap(key, compute, options);
        }));
    }

    std::vector<nlohmann::json> values;
    for (auto& result : results) {
        values.push_back(result.get());
    }

    EXPECT_EQ(calls.load(), 1);
    for (const auto& value : values) {
        EXPECT_EQ(value, values.front());
    }
    EXPECT_EQ(wrapper_->inFlightCount(), 0u);
}

// EN: Failures reach every waiter of the shared computation
// FR: Les échecs atteignent chaque appelant du calcul partagé
TEST_F(CacheWrapperTest, ConcurrentCallers_ShouldAllReceiveTheFailure) {
    const std::string key = "global:v1.0:catalog:broken";
    std::atomic<int> calls{0};
    auto compute = [&calls]() -> nlohmann::json {
        calls++;
        std::this_thread::sleep_for(100ms);
        throw std::logic_error("mapping table missing");
    };
    const auto options = makeOptions(CacheCategory::CATALOG, 3600s);

    std::vector<std::future<nlohmann::json>> results;
    for (int i = 0; i < 4; ++i) {
        results.push_back(std::async(std::launch::async, [&]() {
            return wrapper_->wrap(key, compute, options);
        }));
    }

    for (auto& result : results) {
        EXPECT_THROW(result.get(), std::logic_error);
    }
    EXPECT_LE(calls.load(), 4);
    EXPECT_EQ(wrapper_->inFlightCount(), 0u);
}

// EN: Values are fresh until the TTL and recomputed synchronously after the stale window
// FR: Les valeurs sont fraîches jusqu'au TTL et recalculées en synchrone après la fenêtre stale
TEST_F(CacheWrapperTest, TtlBoundary_ShouldSwitchFromFreshToSynchronousRecompute) {
    const std::string key = "global:v1.0:catalog:tmdb.top";
    std::atomic<int> calls{0};
    auto compute = [&calls]() {
        const int version = ++calls;
        return nlohmann::json{{"version", version}};
    };
    const auto options = makeOptions(CacheCategory::CATALOG, 100s, 50s);

    wrapper_->wrap(key, compute, options);

    clock_.advance(99s);
    const auto fresh = wrapper_->wrap(key, compute, options);
    EXPECT_EQ(fresh["version"], 1);
    EXPECT_EQ(wrapper_->inFlightCount(), 0u);
    EXPECT_EQ(health_->snapshot().forCategory(CacheCategory::CATALOG).stale_hits, 0u);

    clock_.advance(52s);
    EXPECT_EQ(wrapper_->inspect(key), EntryState::EMPTY);
    const auto recomputed = wrapper_->wrap(key, compute, options);
    EXPECT_EQ(recomputed["version"], 2);
    EXPECT_EQ(calls.load(), 2);
}

// EN: Stale values are served immediately while exactly one refresh runs
// FR: Les valeurs stale sont servies immédiatement pendant qu'un seul rafraîchissement tourne
TEST_F(CacheWrapperTest, StaleEntry_ShouldServeStaleAndRefreshOnce) {
    const std::string key = "global:v1.0:catalog:trending";
    std::atomic<int> calls{0};
    std::promise<void> gate;
    std::shared_future<void> gate_open = gate.get_future().share();

    auto compute = [&calls, gate_open]() {
        const int version = ++calls;
        if (version > 1) {
            gate_open.wait();
        }
        return nlohmann::json{{"version", version}};
    };
    const auto options = makeOptions(CacheCategory::CATALOG, 100s, 50s);

    wrapper_->wrap(key, compute, options);
    clock_.advance(120s);
    EXPECT_EQ(wrapper_->inspect(key), EntryState::STALE);

    for (int i = 0; i < 3; ++i) {
        const auto stale = wrapper_->wrap(key, compute, options);
        EXPECT_EQ(stale["version"], 1);
    }

    gate.set_value();
    wrapper_->waitForRefreshes();

    EXPECT_EQ(calls.load(), 2);
    const auto refreshed = wrapper_->wrap(key, compute, options);
    EXPECT_EQ(refreshed["version"], 2);
    EXPECT_EQ(health_->snapshot().forCategory(CacheCategory::CATALOG).stale_hits, 3u);
}

// EN: A failing refresh keeps the stale value instead of caching an error
// FR: Un rafraîchissement en échec garde la valeur stale au lieu de mettre une erreur en cache
TEST_F(CacheWrapperTest, FailedRefresh_ShouldKeepStaleValue) {
    const std::string key = "global:v1.0:meta:tt0068646";
    std::atomic<int> calls{0};
    auto compute = [&calls]() -> nlohmann::json {
        if (++calls > 1) {
            throw UpstreamError("upstream unavailable", 503);
        }
        return nlohmann::json{{"id", "tt0068646"}};
    };
    const auto options = makeOptions(CacheCategory::META, 100s, 50s);

    wrapper_->wrap(key, compute, options);
    clock_.advance(110s);

    EXPECT_EQ(wrapper_->wrap(key, compute, options)["id"], "tt0068646");
    wrapper_->waitForRefreshes();

    auto entry = wrapper_->peek(key);
    ASSERT_TRUE(entry.has_value());
    EXPECT_FALSE(entry->is_error_marker);
    EXPECT_EQ(wrapper_->inspect(key), EntryState::STALE);
}

// EN: An always-failing compute is retried a bounded number of times across error windows
// FR: Un calcul toujours en échec est retenté un nombre borné de fois à travers les fenêtres d'erreur
TEST_F(CacheWrapperTest, TransientFailures_ShouldBeCachedWithBoundedRetries) {
    const std::string key = "global:v1.0:provider:mal-studios";
    std::atomic<int> calls{0};
    auto compute = [&calls]() -> nlohmann::json {
        calls++;
        throw UpstreamError("server error", 503);
    };
    auto options = makeOptions(CacheCategory::PROVIDER, 3600s);
    options.max_retries = 2;
    options.error_ttl = 60s;

    try {
        wrapper_->wrap(key, compute, options);
        FAIL() << "Expected UpstreamError";
    } catch (const UpstreamError& e) {
        EXPECT_FALSE(e.servedFromCache());
    }

    for (int i = 0; i < 5; ++i) {
        try {
            wrapper_->wrap(key, compute, options);
            FAIL() << "Expected cached UpstreamError";
        } catch (const UpstreamError& e) {
            EXPECT_TRUE(e.servedFromCache());
        }
    }
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(wrapper_->inspect(key), EntryState::ERROR_CACHED);

    clock_.advance(61s);
    EXPECT_THROW(wrapper_->wrap(key, compute, options), UpstreamError);
    EXPECT_EQ(calls.load(), 2);
    auto marker = wrapper_->peek(key);
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(marker->retry_count, 2);

    // EN: The retry budget is exhausted: the failure is raised and nothing stays cached
    // FR: Le budget de retries est épuisé : l'échec remonte et rien ne reste en cache
    clock_.advance(61s);
    EXPECT_THROW(wrapper_->wrap(key, compute, options), UpstreamError);
    EXPECT_EQ(calls.load(), 3);
    EXPECT_EQ(wrapper_->inspect(key), EntryState::EMPTY);

    const auto counters = health_->snapshot().forCategory(CacheCategory::PROVIDER);
    EXPECT_EQ(counters.error_hits, 5u);
    EXPECT_EQ(counters.errors, 3u);
}

// EN: Not-found results are cached with their own TTL and no retry counter
// FR: Les résultats introuvables sont mis en cache avec leur propre TTL et sans compteur
TEST_F(CacheWrapperTest, NotFound_ShouldBeCachedAsNegativeResult) {
    const std::string key = "global:v1.0:meta:tt9999999";
    std::atomic<int> calls{0};
    auto compute = [&calls]() -> nlohmann::json {
        calls++;
        throwForHttpStatus(404, "title not found");
    };
    auto options = makeOptions(CacheCategory::META, 3600s);
    options.not_found_ttl = 600s;

    EXPECT_THROW(wrapper_->wrap(key, compute, options), NotFoundError);
    try {
        wrapper_->wrap(key, compute, options);
        FAIL() << "Expected cached NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_TRUE(e.servedFromCache());
    }
    EXPECT_EQ(calls.load(), 1);

    auto marker = wrapper_->peek(key);
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(marker->error_kind, FailureKind::NOT_FOUND);
    EXPECT_EQ(marker->retry_count, 0);

    clock_.advance(601s);
    EXPECT_THROW(wrapper_->wrap(key, compute, options), NotFoundError);
    EXPECT_EQ(calls.load(), 2);
}

// EN: Internal compute errors are surfaced and never cached
// FR: Les erreurs internes de calcul remontent et ne sont jamais mises en cache
TEST_F(CacheWrapperTest, InternalError_ShouldNeverBeCached) {
    const std::string key = "global:v1.0:catalog:bad-mapping";
    std::atomic<int> calls{0};
    auto compute = [&calls]() -> nlohmann::json {
        calls++;
        throw std::out_of_range("genre index");
    };
    const auto options = makeOptions(CacheCategory::CATALOG, 3600s);

    EXPECT_THROW(wrapper_->wrap(key, compute, options), std::out_of_range);
    EXPECT_THROW(wrapper_->wrap(key, compute, options), std::out_of_range);

    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(wrapper_->inspect(key), EntryState::EMPTY);
    EXPECT_EQ(health_->snapshot().forCategory(CacheCategory::CATALOG).errors, 2u);
}

// EN: Error caching can be switched off per call
// FR: Le cache d'erreurs peut être désactivé par appel
TEST_F(CacheWrapperTest, ErrorCachingDisabled_ShouldRecomputeEveryTime) {
    const std::string key = "global:v1.0:search:naruto";
    std::atomic<int> calls{0};
    auto compute = [&calls]() -> nlohmann::json {
        calls++;
        throw UpstreamError("timeout", 504);
    };
    auto options = makeOptions(CacheCategory::SEARCH, 600s);
    options.error_caching = false;

    EXPECT_THROW(wrapper_->wrap(key, compute, options), UpstreamError);
    EXPECT_THROW(wrapper_->wrap(key, compute, options), UpstreamError);
    EXPECT_EQ(calls.load(), 2);
}

// EN: Empty results are not cached unless allowed
// FR: Les résultats vides ne sont pas mis en cache sauf autorisation
TEST_F(CacheWrapperTest, EmptyResult_ShouldNotBeCachedByDefault) {
    std::atomic<int> calls{0};
    auto compute = [&calls]() {
        calls++;
        return nlohmann::json::array();
    };
    auto options = makeOptions(CacheCategory::CATALOG, 3600s);

    wrapper_->wrap("global:v1.0:catalog:empty", compute, options);
    wrapper_->wrap("global:v1.0:catalog:empty", compute, options);
    EXPECT_EQ(calls.load(), 2);

    options.allow_empty = true;
    wrapper_->wrap("global:v1.0:catalog:empty-allowed", compute, options);
    wrapper_->wrap("global:v1.0:catalog:empty-allowed", compute, options);
    EXPECT_EQ(calls.load(), 3);
}

// EN: A rejected payload surfaces as an internal error and is not stored
// FR: Un contenu rejeté remonte comme erreur interne et n'est pas stocké
TEST_F(CacheWrapperTest, ValidatorRejection_ShouldRaiseInternalError) {
    const std::string key = "global:v1.0:meta:tt0000001";
    auto options = makeOptions(CacheCategory::META, 3600s);
    options.validator = [](const nlohmann::json& value) {
        std::vector<std::string> issues;
        if (!value.contains("id")) {
            issues.push_back("missing id");
        }
        return issues;
    };

    EXPECT_THROW(wrapper_->wrap(key, [] { return nlohmann::json{{"name", "Untitled"}}; }, options),
                 InternalComputeError);
    EXPECT_EQ(wrapper_->inspect(key), EntryState::EMPTY);

    const auto value = wrapper_->wrap(key, [] { return nlohmann::json{{"id", "tt0000001"}}; }, options);
    EXPECT_EQ(value["id"], "tt0000001");
}

// EN: An older computation never overwrites a newer stored value
// FR: Un calcul plus ancien n'écrase jamais une valeur stockée plus récente
TEST_F(CacheWrapperTest, OlderResult_ShouldNotOverwriteNewerValue) {
    const std::string key = "global:v1.0:meta:tt0133093";
    const auto options = makeOptions(CacheCategory::META, 3600s);
    const auto now = clock_.now();

    EXPECT_TRUE(wrapper_->storeValue(key, {{"revision", "new"}}, options, now));
    EXPECT_FALSE(wrapper_->storeValue(key, {{"revision", "old"}}, options, now - 10s));

    auto entry = wrapper_->peek(key);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->value["revision"], "new");

    EXPECT_TRUE(wrapper_->storeValue(key, {{"revision", "newer"}}, options, now + 5s));
    EXPECT_EQ(wrapper_->peek(key)->value["revision"], "newer");
}

// EN: Corrupted entries are deleted, counted and recomputed
// FR: Les entrées corrompues sont supprimées, comptées et recalculées
TEST_F(CacheWrapperTest, CorruptedEntry_ShouldSelfHeal) {
    const std::string key = "global:v1.0:catalog:corrupted";
    store_->set(key, "{not-json", 0s);

    std::atomic<int> calls{0};
    auto compute = [&calls]() {
        calls++;
        return nlohmann::json{{"items", 3}};
    };
    const auto options = makeOptions(CacheCategory::CATALOG, 3600s);

    EXPECT_EQ(wrapper_->wrap(key, compute, options)["items"], 3);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(health_->snapshot().forCategory(CacheCategory::CATALOG).errors, 1u);

    EXPECT_EQ(wrapper_->wrap(key, compute, options)["items"], 3);
    EXPECT_EQ(calls.load(), 1);
}

// EN: A failing store write is counted but the computed value is still returned
// FR: Une écriture en échec est comptée mais la valeur calculée est quand même retournée
TEST_F(CacheWrapperTest, StoreWriteFailure_ShouldStillReturnComputedValue) {
    auto mock_store = std::make_shared<::testing::NiceMock<MockCacheStore>>();
    EXPECT_CALL(*mock_store, get(::testing::_)).WillRepeatedly(::testing::Return(std::nullopt));
    EXPECT_CALL(*mock_store, set(::testing::_, ::testing::_, ::testing::_))
        .WillOnce(::testing::Throw(StoreError("connection reset")));

    auto health = std::make_shared<HealthMonitor>(clock_.source());
    WrapperConfig config;
    config.sweep_interval = 0s;
    CacheWrapper wrapper(mock_store, health, config, clock_.source());

    const auto value = wrapper.wrap("global:v1.0:meta:tt1",
                                    [] { return nlohmann::json{{"id", "tt1"}}; },
                                    makeOptions(CacheCategory::META, 3600s));

    EXPECT_EQ(value["id"], "tt1");
    const auto counters = health->snapshot().forCategory(CacheCategory::META);
    EXPECT_EQ(counters.misses, 1u);
    EXPECT_EQ(counters.errors, 1u);
}

// EN: A failing store read is treated as a miss
// FR: Une lecture en échec est traitée comme un miss
TEST_F(CacheWrapperTest, StoreReadFailure_ShouldBeTreatedAsMiss) {
    auto mock_store = std::make_shared<::testing::NiceMock<MockCacheStore>>();
    EXPECT_CALL(*mock_store, get(::testing::_))
        .WillRepeatedly(::testing::Throw(StoreError("read timeout")));

    auto health = std::make_shared<HealthMonitor>(clock_.source());
    WrapperConfig config;
    config.sweep_interval = 0s;
    CacheWrapper wrapper(mock_store, health, config, clock_.source());

    std::atomic<int> calls{0};
    const auto value = wrapper.wrap("global:v1.0:catalog:top", [&calls] {
        calls++;
        return nlohmann::json::array({1, 2, 3});
    }, makeOptions(CacheCategory::CATALOG, 3600s));

    EXPECT_EQ(value.size(), 3u);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_GE(health->snapshot().forCategory(CacheCategory::CATALOG).errors, 1u);
}

// EN: Pattern invalidation only removes the matching scope
// FR: L'invalidation par motif ne supprime que le scope correspondant
TEST_F(CacheWrapperTest, Invalidate_ShouldRemoveOnlyMatchingKeys) {
    const auto options = makeOptions(CacheCategory::META, 3600s);
    auto compute = [] { return nlohmann::json{{"ok", true}}; };

    const std::string a_meta = CacheKey::build("user-a", "v1.0", CacheCategory::META, {"tt1"});
    const std::string a_catalog = CacheKey::build("user-a", "v1.0", CacheCategory::CATALOG, {"top"});
    const std::string b_meta = CacheKey::build("user-b", "v1.0", CacheCategory::META, {"tt1"});
    wrapper_->wrap(a_meta, compute, options);
    wrapper_->wrap(a_catalog, compute, options);
    wrapper_->wrap(b_meta, compute, options);

    EXPECT_EQ(wrapper_->invalidate(CacheKey::scopePattern("user-a")), 2u);
    EXPECT_EQ(wrapper_->inspect(a_meta), EntryState::EMPTY);
    EXPECT_EQ(wrapper_->inspect(a_catalog), EntryState::EMPTY);
    EXPECT_EQ(wrapper_->inspect(b_meta), EntryState::FRESH);
}

// EN: With caching disabled, compute runs every time and nothing is recorded
// FR: Cache désactivé : le calcul s'exécute à chaque fois et rien n'est enregistré
TEST_F(CacheWrapperTest, DisabledCache_ShouldBypassStoreAndHealth) {
    wrapper_->setEnabled(false);

    std::atomic<int> calls{0};
    auto compute = [&calls]() {
        calls++;
        return nlohmann::json{{"value", 1}};
    };
    const auto options = makeOptions(CacheCategory::GLOBAL, 3600s);

    wrapper_->wrap("global:v1.0:global:bypass", compute, options);
    wrapper_->wrap("global:v1.0:global:bypass", compute, options);

    EXPECT_EQ(calls.load(), 2);
    EXPECT_FALSE(store_->exists("global:v1.0:global:bypass"));
    EXPECT_EQ(health_->snapshot().totals().requests(), 0u);
}

// EN: Slow upstream calls become transient timeouts
// FR: Les appels amont lents deviennent des timeouts transitoires
TEST_F(CacheWrapperTest, UpstreamDeadline_ShouldBeCachedAsTransientFailure) {
    const std::string key = "global:v1.0:provider:slow";
    auto compute = []() -> nlohmann::json {
        return runWithDeadline([] {
            std::this_thread::sleep_for(200ms);
            return nlohmann::json{{"late", true}};
        }, 20ms, "slow-provider");
    };

    try {
        wrapper_->wrap(key, compute, makeOptions(CacheCategory::PROVIDER, 3600s));
        FAIL() << "Expected UpstreamTimeoutError";
    } catch (const UpstreamTimeoutError& e) {
        EXPECT_EQ(e.statusCode(), 408);
    }

    auto marker = wrapper_->peek(key);
    ASSERT_TRUE(marker.has_value());
    EXPECT_TRUE(marker->is_error_marker);
    EXPECT_EQ(marker->error_kind, FailureKind::TRANSIENT);
}

// EN: The sweep drops slots whose computation outlived the timeout
// FR: Le balayage supprime les slots dont le calcul a dépassé le timeout
TEST_F(CacheWrapperTest, SweepInFlight_ShouldDropStuckSlots) {
    std::promise<void> gate;
    std::shared_future<void> gate_open = gate.get_future().share();
    std::atomic<bool> started{false};

    auto leader = std::async(std::launch::async, [&]() {
        return wrapper_->wrap("global:v1.0:catalog:stuck", [&started, gate_open] {
            started = true;
            gate_open.wait();
            return nlohmann::json{{"done", true}};
        }, makeOptions(CacheCategory::CATALOG, 3600s));
    });

    while (!started) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(wrapper_->inFlightCount(), 1u);
    EXPECT_EQ(wrapper_->sweepInFlight(), 0u);

    clock_.advance(121s);
    EXPECT_EQ(wrapper_->sweepInFlight(), 1u);
    EXPECT_EQ(wrapper_->inFlightCount(), 0u);

    gate.set_value();
    EXPECT_EQ(leader.get()["done"], true);
}

// EN: Invalid options are rejected before anything runs
// FR: Les options invalides sont rejetées avant toute exécution
TEST_F(CacheWrapperTest, InvalidArguments_ShouldThrow) {
    auto options = makeOptions(CacheCategory::GLOBAL, 3600s);
    EXPECT_THROW(wrapper_->wrap("global:v1.0:global:x", nullptr, options), std::invalid_argument);

    options.max_retries = -1;
    EXPECT_THROW(wrapper_->wrap("global:v1.0:global:x", [] { return nlohmann::json(1); }, options),
                 std::invalid_argument);

    EXPECT_THROW({ CacheWrapper wrapper(nullptr, health_); }, std::invalid_argument);
}

// EN: A failure marker never outlives the success TTL of its category
// FR: Un marqueur d'échec ne survit jamais au TTL de succès de sa catégorie
TEST_F(CacheWrapperTest, ShortTtl_ShouldClampFailureMarkerBelowIt) {
    const std::string key = "global:v1.0:search:short-ttl";
    std::atomic<int> calls{0};
    auto compute = [&calls]() -> nlohmann::json {
        calls++;
        throw UpstreamError("server error", 503);
    };
    const auto options = makeOptions(CacheCategory::SEARCH, 60s);
    ASSERT_EQ(options.error_ttl, 120s);

    EXPECT_THROW(wrapper_->wrap(key, compute, options), UpstreamError);
    auto marker = wrapper_->peek(key);
    ASSERT_TRUE(marker.has_value());
    EXPECT_TRUE(marker->is_error_marker);
    EXPECT_LT(marker->ttl, 60s);

    clock_.advance(60s);
    EXPECT_NE(wrapper_->inspect(key), EntryState::ERROR_CACHED);
    EXPECT_THROW(wrapper_->wrap(key, compute, options), UpstreamError);
    EXPECT_EQ(calls.load(), 2);
}

// EN: A one-second TTL leaves no room for a marker, so failures are not cached
// FR: Un TTL d'une seconde ne laisse pas de place au marqueur, les échecs ne sont pas mis en cache
TEST_F(CacheWrapperTest, OneSecondTtl_ShouldNotCacheFailures) {
    const std::string key = "global:v1.0:search:one-second";
    std::atomic<int> calls{0};
    auto compute = [&calls]() -> nlohmann::json {
        calls++;
        throw UpstreamError("server error", 502);
    };
    const auto options = makeOptions(CacheCategory::SEARCH, 1s);

    EXPECT_THROW(wrapper_->wrap(key, compute, options), UpstreamError);
    EXPECT_THROW(wrapper_->wrap(key, compute, options), UpstreamError);
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(wrapper_->inspect(key), EntryState::EMPTY);
}

// EN: An envelope whose fields have the wrong JSON type is treated as corruption
// FR: Une enveloppe dont les champs ont le mauvais type JSON est traitée comme corrompue
TEST_F(CacheWrapperTest, CorruptedEntry_WithWrongFieldTypes_ShouldSelfHeal) {
    const std::string key = "global:v1.0:catalog:wrong-types";
    store_->set(key, R"({"format":"1","created_at":0,"ttl":10,"value":1})", 0s);

    std::atomic<int> calls{0};
    auto compute = [&calls]() {
        calls++;
        return nlohmann::json{{"items", 7}};
    };
    const auto options = makeOptions(CacheCategory::CATALOG, 3600s);

    nlohmann::json value;
    EXPECT_NO_THROW(value = wrapper_->wrap(key, compute, options));
    EXPECT_EQ(value["items"], 7);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(health_->snapshot().forCategory(CacheCategory::CATALOG).errors, 1u);
    EXPECT_EQ(wrapper_->inspect(key), EntryState::FRESH);
}

// EN: Rate limiting is cached with its own TTL and replayed with its status code
// FR: La limitation de débit est mise en cache avec son propre TTL et rejouée avec son code
TEST_F(CacheWrapperTest, RateLimited_ShouldUseItsOwnTtlAndKeepStatus) {
    const std::string key = "global:v1.0:provider:rate-limited";
    std::atomic<int> calls{0};
    auto compute = [&calls]() -> nlohmann::json {
        calls++;
        throw UpstreamError("too many requests", 429);
    };
    auto options = makeOptions(CacheCategory::PROVIDER, 3600s);
    options.error_ttl = 60s;
    options.rate_limited_ttl = 900s;

    EXPECT_THROW(wrapper_->wrap(key, compute, options), UpstreamError);
    auto marker = wrapper_->peek(key);
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(marker->ttl, 900s);
    EXPECT_EQ(marker->error_status, 429);

    clock_.advance(61s);
    try {
        wrapper_->wrap(key, compute, options);
        FAIL() << "Expected cached UpstreamError";
    } catch (const UpstreamError& e) {
        EXPECT_TRUE(e.servedFromCache());
        EXPECT_EQ(e.statusCode(), 429);
    }
    EXPECT_EQ(calls.load(), 1);

    clock_.advance(840s);
    EXPECT_THROW(wrapper_->wrap(key, compute, options), UpstreamError);
    EXPECT_EQ(calls.load(), 2);
}

// EN: Permanent client errors use the rejected TTL
// FR: Les erreurs client permanentes utilisent le TTL de rejet
TEST_F(CacheWrapperTest, RejectedRequest_ShouldUseRejectedTtl) {
    const std::string key = "global:v1.0:meta:forbidden";
    auto compute = []() -> nlohmann::json {
        throwForHttpStatus(403, "api key refused");
    };
    auto options = makeOptions(CacheCategory::META, 7200s);
    options.rejected_ttl = 1800s;

    EXPECT_THROW(wrapper_->wrap(key, compute, options), UpstreamError);
    auto marker = wrapper_->peek(key);
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(marker->error_kind, FailureKind::TRANSIENT);
    EXPECT_EQ(marker->ttl, 1800s);
    EXPECT_EQ(marker->error_status, 403);
}

// EN: Stored values rejected by the validator are deleted; valid values and markers stay
// FR: Les valeurs stockées rejetées par le validateur sont supprimées ; les valides et les marqueurs restent
TEST_F(CacheWrapperTest, PurgeInvalid_ShouldRemoveRejectedValuesOnly) {
    const auto options = makeOptions(CacheCategory::META, 3600s);
    const auto now = clock_.now();
    ASSERT_TRUE(wrapper_->storeValue("global:v1.0:meta:good", {{"id", "tt1"}}, options, now));
    ASSERT_TRUE(wrapper_->storeValue("global:v1.0:meta:bad", {{"id", "undefined"}}, options, now));
    ASSERT_TRUE(wrapper_->storeValue("global:v1.0:meta:skipped", {{"id", "undefined"}}, options, now));
    store_->set("global:v1.0:meta:broken", "{not-json", 0s);
    EXPECT_THROW(wrapper_->wrap("global:v1.0:meta:missing",
                                []() -> nlohmann::json { throwForHttpStatus(404, "gone"); }, options),
                 NotFoundError);
    store_->set("global:v1.0:catalog:bad", "{}", 0s);

    const PayloadValidator validator = [](const nlohmann::json& value) {
        std::vector<std::string> issues;
        if (value.value("id", "") == "undefined") {
            issues.push_back("bad id");
        }
        return issues;
    };
    const KeyFilter include = [](const std::string& key) { return key != "global:v1.0:meta:skipped"; };

    const PurgeReport report = wrapper_->purgeInvalid("global:v1.0:meta:*", validator, include);

    EXPECT_EQ(report.checked, 4u);
    EXPECT_EQ(report.removed, 2u);
    EXPECT_TRUE(store_->exists("global:v1.0:meta:good"));
    EXPECT_FALSE(store_->exists("global:v1.0:meta:bad"));
    EXPECT_FALSE(store_->exists("global:v1.0:meta:broken"));
    EXPECT_TRUE(store_->exists("global:v1.0:meta:skipped"));
    EXPECT_TRUE(store_->exists("global:v1.0:meta:missing"));
    EXPECT_TRUE(store_->exists("global:v1.0:catalog:bad"));

    EXPECT_THROW(wrapper_->purgeInvalid("*", PayloadValidator{}), std::invalid_argument);
}

// EN: A compute owning its captures keeps working when the refresh runs after the caller returned
// FR: Un calcul possédant ses captures fonctionne quand le rafraîchissement tourne après le retour de l'appelant
TEST_F(CacheWrapperTest, StaleRefresh_ShouldRunAfterCallerScopeEnds) {
    const std::string key = "global:v1.0:catalog:owned-captures";
    const auto options = makeOptions(CacheCategory::CATALOG, 100s, 50s);
    auto calls = std::make_shared<std::atomic<int>>(0);

    auto call_from_scope = [this, &key, &options, calls]() {
        auto label = std::make_shared<std::string>("popular");
        return wrapper_->wrap(key, [calls, label]() {
            const int version = ++*calls;
            return nlohmann::json{{"label", *label}, {"version", version}};
        }, options);
    };

    EXPECT_EQ(call_from_scope()["version"], 1);
    clock_.advance(120s);
    EXPECT_EQ(call_from_scope()["version"], 1);
    wrapper_->waitForRefreshes();

    EXPECT_EQ(calls->load(), 2);
    const auto entry = wrapper_->peek(key);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->value["label"], "popular");
    EXPECT_EQ(entry->value["version"], 2);
}
