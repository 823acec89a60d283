// EN: Unit tests for CacheService - startup sequence, key helpers and invalidation
// FR: Tests unitaires pour CacheService - séquence de démarrage, aides de clés et invalidation

#include <gtest/gtest.h>

#include "cache/cache_key.hpp"
#include "cache/cache_service.hpp"
#include "infrastructure/logging/logger.hpp"
#include "test_helpers.hpp"

#include <atomic>

using namespace MDC;
using namespace MDC::testing_support;
using namespace std::chrono_literals;

class CacheServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);

        settings_ = CacheSettings::defaults();
        settings_.wrapper.software_version = "v1.0";
        settings_.wrapper.sweep_interval = 0s;
        settings_.store.cleanup_interval = 0s;
    }

    std::unique_ptr<CacheService> makeService() {
        return std::make_unique<CacheService>(settings_, nullptr, nullptr, clock_.source());
    }

    WarmTarget providerTarget(CacheService& service, const std::string& name) {
        WarmTarget target;
        target.key = service.globalKey(CacheCategory::PROVIDER, {name});
        target.options = service.optionsFor(CacheCategory::PROVIDER);
        target.compute = [this, name]() {
            computations_++;
            return nlohmann::json{{"provider", name}, {"genres", nlohmann::json::array({"Drama"})}};
        };
        return target;
    }

    ManualClock clock_;
    CacheSettings settings_;
    std::atomic<int> computations_{0};
};

// EN: Startup warms the essential targets before scheduling further passes
// FR: Le démarrage réchauffe les cibles essentielles avant de planifier les passes suivantes
TEST_F(CacheServiceTest, Start_ShouldWarmEssentialTargetsAndSchedule) {
    auto service = makeService();
    service->warmer().setEssentialTargets({providerTarget(*service, "tmdb-genres"),
                                           providerTarget(*service, "tvdb-genres")});

    service->start();
    EXPECT_TRUE(service->warmer().isInitialWarmingComplete());
    EXPECT_TRUE(service->warmer().isScheduled());
    EXPECT_EQ(computations_.load(), 2);
    EXPECT_EQ(service->wrapper().inspect("global:v1.0:provider:tmdb-genres"), EntryState::FRESH);

    service->start();
    EXPECT_EQ(computations_.load(), 2);

    service->shutdown();
    EXPECT_FALSE(service->warmer().isScheduled());
}

TEST_F(CacheServiceTest, Start_ShouldSkipWarmingWhenDisabled) {
    settings_.warmer.enabled = false;
    auto service = makeService();
    service->warmer().setEssentialTargets({providerTarget(*service, "tmdb-genres")});

    service->start();
    EXPECT_EQ(computations_.load(), 0);
    EXPECT_FALSE(service->warmer().isScheduled());
}

// EN: A failing essential target never blocks startup
// FR: Une cible essentielle en échec ne bloque jamais le démarrage
TEST_F(CacheServiceTest, Start_ShouldContinueWhenWarmingFails) {
    auto service = makeService();
    WarmTarget broken = providerTarget(*service, "broken");
    broken.compute = []() -> nlohmann::json { throw UpstreamError("provider offline", 503); };
    service->warmer().setEssentialTargets({broken});

    EXPECT_NO_THROW(service->start());
    EXPECT_TRUE(service->warmer().isInitialWarmingComplete());
    EXPECT_EQ(service->warmer().getJob().last_status, WarmingStatus::FAILED);
}

// EN: Startup survives a warming target throwing a non-standard exception
// FR: Le démarrage survit à une cible de warming lançant une exception non standard
TEST_F(CacheServiceTest, Start_ShouldContinueWhenWarmingThrowsNonStandardException) {
    auto service = makeService();
    WarmTarget odd = providerTarget(*service, "odd");
    odd.compute = []() -> nlohmann::json { throw 42; };
    service->warmer().setEssentialTargets({odd, providerTarget(*service, "tmdb-genres")});

    EXPECT_NO_THROW(service->start());
    EXPECT_TRUE(service->warmer().isInitialWarmingComplete());
    EXPECT_TRUE(service->warmer().isScheduled());
    EXPECT_EQ(service->warmer().getJob().last_status, WarmingStatus::PARTIAL);
    EXPECT_EQ(computations_.load(), 1);
    service->shutdown();
}

TEST_F(CacheServiceTest, Keys_ShouldCarrySoftwareVersion) {
    auto service = makeService();

    EXPECT_EQ(service->globalKey(CacheCategory::META, {"tt0903747"}), "global:v1.0:meta:tt0903747");
    EXPECT_EQ(service->userKey("3f2c9a10", CacheCategory::CATALOG, {"tmdb.top"}),
              "3f2c9a10:v1.0:catalog:tmdb.top");
    EXPECT_THROW(service->userKey("", CacheCategory::CATALOG, {"tmdb.top"}), std::invalid_argument);

    const nlohmann::json alice = {{"language", "fr-FR"}, {"catalogs", nlohmann::json::array({"a"})}};
    const nlohmann::json bob = {{"language", "fr-FR"}, {"catalogs", nlohmann::json::array({"b"})}};
    EXPECT_EQ(service->contextKey(RouteCategory::META, CacheCategory::META, alice, {"tt1"}),
              service->contextKey(RouteCategory::META, CacheCategory::META, bob, {"tt1"}));
}

// EN: Invalidating a user removes every key that mentions them and nothing else
// FR: L'invalidation d'un utilisateur supprime toutes les clés le mentionnant et rien d'autre
TEST_F(CacheServiceTest, InvalidateUser_ShouldRemoveUserKeysOnly) {
    auto service = makeService();
    auto compute = []() {
        return nlohmann::json{{"metas", nlohmann::json::array({{{"id", "tmdb:1"}, {"name", "Heat"}, {"type", "movie"}}})}};
    };
    const auto options = service->optionsFor(CacheCategory::CATALOG);

    const auto own = service->userKey("3f2c9a10", CacheCategory::CATALOG, {"tmdb.top"});
    const auto mention = service->globalKey(CacheCategory::CATALOG, {"history", "3f2c9a10"});
    const auto other = service->userKey("77aa0b21", CacheCategory::CATALOG, {"tmdb.top"});
    for (const auto& key : {own, mention, other}) {
        service->wrapper().wrap(key, compute, options);
    }

    EXPECT_EQ(service->invalidateUser("3f2c9a10"), 2u);
    EXPECT_EQ(service->wrapper().inspect(own), EntryState::EMPTY);
    EXPECT_EQ(service->wrapper().inspect(mention), EntryState::EMPTY);
    EXPECT_EQ(service->wrapper().inspect(other), EntryState::FRESH);
    EXPECT_THROW(service->invalidateUser(""), std::invalid_argument);

    EXPECT_EQ(service->invalidate(CacheKey::scopePattern("77aa0b21")), 1u);
}

TEST_F(CacheServiceTest, ValidatorFor_ShouldUseSoftwareVersion) {
    auto service = makeService();
    const nlohmann::json payload = {{"meta", {{"id", "tt1"}}}};
    const nlohmann::json config = {{"language", "en-US"}};

    EXPECT_EQ(service->validatorFor(RouteCategory::META, payload, config),
              FingerprintGenerator::forRequest(RouteCategory::META, "v1.0", payload, config));
}

// EN: Settings flow into the components it builds
// FR: Les paramètres se propagent aux composants construits
TEST_F(CacheServiceTest, Construction_ShouldApplySettings) {
    settings_.wrapper.enabled = false;
    auto service = makeService();

    EXPECT_FALSE(service->wrapper().isEnabled());
    EXPECT_EQ(service->settings().wrapper.software_version, "v1.0");

    std::atomic<int> calls{0};
    auto compute = [&calls]() {
        calls++;
        return nlohmann::json{{"ok", true}};
    };
    const auto key = service->globalKey(CacheCategory::META, {"tt1"});
    service->wrapper().wrap(key, compute, service->optionsFor(CacheCategory::META));
    service->wrapper().wrap(key, compute, service->optionsFor(CacheCategory::META));
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(service->health().snapshot().totals().requests(), 0u);
}

// EN: Bad stored content is removed from checked categories; components and other categories stay
// FR: Le contenu stocké invalide est supprimé des catégories vérifiées ; composants et autres catégories restent
TEST_F(CacheServiceTest, PurgeInvalidEntries_ShouldRemoveBadContent) {
    auto service = makeService();
    auto& wrapper = service->wrapper();
    const auto now = clock_.now();

    const auto good_meta = service->globalKey(CacheCategory::META, {"tt0113277"});
    const auto bad_meta = service->globalKey(CacheCategory::META, {"tt0000002"});
    const auto component = bad_meta + ":component:videos";
    const auto bad_catalog = service->userKey("3f2c9a10", CacheCategory::CATALOG, {"tmdb.top"});
    const auto empty_search = service->globalKey(CacheCategory::SEARCH, {"heat"});
    const auto provider = service->globalKey(CacheCategory::PROVIDER, {"tmdb-genres"});

    const auto meta_options = service->optionsFor(CacheCategory::META);
    ASSERT_TRUE(wrapper.storeValue(good_meta, {{"meta", {{"id", "tt0113277"}, {"name", "Heat"}, {"type", "movie"}}}},
                                   meta_options, now));
    ASSERT_TRUE(wrapper.storeValue(bad_meta, {{"meta", {{"id", "tt0000002"}, {"name", "undefined"}, {"type", "movie"}}}},
                                   meta_options, now));
    ASSERT_TRUE(wrapper.storeValue(component, nlohmann::json::array({1, 2}), meta_options, now));
    ASSERT_TRUE(wrapper.storeValue(bad_catalog,
                                   {{"metas", nlohmann::json::array({{{"id", "tmdb:undefined"}, {"name", "X"}}})}},
                                   service->optionsFor(CacheCategory::CATALOG), now));
    ASSERT_TRUE(wrapper.storeValue(empty_search, {{"metas", nlohmann::json::array()}},
                                   service->optionsFor(CacheCategory::SEARCH), now));
    ASSERT_TRUE(wrapper.storeValue(provider, {{"error", "quota"}}, service->optionsFor(CacheCategory::PROVIDER), now));

    const PurgeReport report = service->purgeInvalidEntries();

    EXPECT_EQ(report.checked, 4u);
    EXPECT_EQ(report.removed, 2u);
    EXPECT_EQ(wrapper.inspect(good_meta), EntryState::FRESH);
    EXPECT_EQ(wrapper.inspect(bad_meta), EntryState::EMPTY);
    EXPECT_EQ(wrapper.inspect(component), EntryState::FRESH);
    EXPECT_EQ(wrapper.inspect(bad_catalog), EntryState::EMPTY);
    EXPECT_EQ(wrapper.inspect(empty_search), EntryState::FRESH);
    EXPECT_EQ(wrapper.inspect(provider), EntryState::FRESH);
}
