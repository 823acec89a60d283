// EN: Wiring of the cache subsystem and its startup sequence.
// FR: Assemblage du sous-système de cache et sa séquence de démarrage.

#include "cache/cache_service.hpp"
#include "cache/cache_key.hpp"
#include "cache/content_validator.hpp"
#include "cache/memory_cache_store.hpp"
#include "infrastructure/logging/logger.hpp"

#include <stdexcept>

namespace MDC {

CacheService::CacheService(const CacheSettings& settings,
                           std::shared_ptr<CacheStore> store,
                           std::shared_ptr<ConfigProvider> config_provider,
                           TimeSource time_source)
    : settings_(settings), store_(std::move(store)) {

    if (!time_source) {
        time_source = systemTimeSource();
    }
    if (!store_) {
        store_ = std::make_shared<MemoryCacheStore>(settings_.store, time_source);
    }

    health_ = std::make_shared<HealthMonitor>(time_source);
    wrapper_ = std::make_unique<CacheWrapper>(store_, health_, settings_.wrapper, time_source);
    components_ = std::make_unique<ComponentReconstructor>(*wrapper_, settings_.components);
    warmer_ = std::make_unique<CacheWarmer>(*wrapper_, std::vector<WarmTarget>{}, settings_.warmer,
                                            std::move(config_provider));

    LOG_INFO("service", "Cache service created (version " + settings_.wrapper.software_version + ")");
}

CacheService::~CacheService() {
    shutdown();
}

void CacheService::start() {
    if (started_) {
        return;
    }
    started_ = true;

    if (!settings_.warmer.enabled || !wrapper_->isEnabled()) {
        LOG_INFO("service", "Cache warming disabled, starting without initial warming");
        return;
    }

    LOG_INFO("service", "Running initial cache warming");
    try {
        const WarmingStatus status = warmer_->warmEssential();
        if (status != WarmingStatus::SUCCESS) {
            LOG_WARN("service", "Initial cache warming finished with status " + warmingStatusToString(status));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("service", "Initial cache warming failed, continuing startup: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("service", "Initial cache warming failed with a non-standard exception, continuing startup");
    }

    warmer_->scheduleEssential(settings_.warming_interval_minutes);
}

void CacheService::shutdown() {
    // EN: Warmer first: its tasks call into the wrapper.
    // FR: Le warmer d'abord : ses tâches appellent le wrapper.
    warmer_->shutdown();
    wrapper_->shutdown();
}

std::string CacheService::globalKey(CacheCategory category, const std::vector<std::string>& qualifiers) const {
    return CacheKey::global(settings_.wrapper.software_version, category, qualifiers);
}

std::string CacheService::userKey(const std::string& user_uuid, CacheCategory category,
                                  const std::vector<std::string>& qualifiers) const {
    if (user_uuid.empty()) {
        throw std::invalid_argument("User key requires a user identifier");
    }
    return CacheKey::build(user_uuid, settings_.wrapper.software_version, category, qualifiers);
}

std::string CacheService::contextKey(RouteCategory route, CacheCategory category,
                                     const nlohmann::json& user_config,
                                     const std::vector<std::string>& qualifiers) const {
    return CacheKey::forContext(settings_.wrapper.software_version, category,
                                FingerprintGenerator::selectConfigSubset(route, user_config), qualifiers);
}

size_t CacheService::invalidate(const std::string& pattern) {
    return wrapper_->invalidate(pattern);
}

size_t CacheService::invalidateUser(const std::string& user_uuid) {
    if (user_uuid.empty()) {
        throw std::invalid_argument("invalidateUser requires a user identifier");
    }
    const size_t removed = wrapper_->invalidate(CacheKey::containsPattern(user_uuid));
    LOG_INFO("service", "Invalidated " + std::to_string(removed) + " entries for user " +
             CacheKey::truncateForLog(user_uuid, 13));
    return removed;
}

PurgeReport CacheService::purgeInvalidEntries() {
    PurgeReport total;
    const KeyFilter skip_components = [](const std::string& key) {
        return !ComponentReconstructor::isComponentKey(key);
    };

    for (CacheCategory category : allCategories()) {
        const auto content_type = ContentValidator::forCategory(category);
        if (!content_type) {
            continue;
        }
        const PurgeReport report = wrapper_->purgeInvalid(
            CacheKey::categoryPattern(settings_.wrapper.software_version, category),
            ContentValidator::forType(*content_type), skip_components);
        total.checked += report.checked;
        total.removed += report.removed;
    }

    LOG_INFO("service", "Bad data cleanup: " + std::to_string(total.checked) + " checked, " +
             std::to_string(total.removed) + " removed");
    return total;
}

std::string CacheService::validatorFor(RouteCategory route, const nlohmann::json& payload,
                                       const nlohmann::json& user_config) const {
    return FingerprintGenerator::forRequest(route, settings_.wrapper.software_version, payload, user_config);
}

} // namespace MDC
