#pragma once

#include "cache/cache_settings.hpp"
#include "cache/cache_store.hpp"
#include "cache/cache_types.hpp"
#include "cache/cache_warmer.hpp"
#include "cache/cache_wrapper.hpp"
#include "cache/component_reconstructor.hpp"
#include "cache/config_provider.hpp"
#include "cache/fingerprint.hpp"
#include "cache/health_monitor.hpp"

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace MDC {

// EN: Owns and wires the cache subsystem: store, health, wrapper, components and warmer.
// FR: Possède et relie le sous-système de cache : stockage, santé, wrapper, composants et warmer.
class CacheService {
public:
    // EN: A null store selects a MemoryCacheStore configured from settings.store.
    // FR: Un stockage nul sélectionne un MemoryCacheStore configuré depuis settings.store.
    explicit CacheService(const CacheSettings& settings = CacheSettings::defaults(),
                          std::shared_ptr<CacheStore> store = nullptr,
                          std::shared_ptr<ConfigProvider> config_provider = nullptr,
                          TimeSource time_source = systemTimeSource());
    ~CacheService();

    CacheService(const CacheService&) = delete;
    CacheService& operator=(const CacheService&) = delete;

    // EN: Run the initial essential warming (failures are logged, never thrown), then start
    //     the periodic schedule. Does nothing for warming when warming or caching is off.
    // FR: Exécute le warming essentiel initial (échecs loggés, jamais levés), puis démarre
    //     la planification périodique. Rien pour le warming s'il ou le cache est désactivé.
    void start();
    void shutdown();

    CacheWrapper& wrapper() { return *wrapper_; }
    ComponentReconstructor& components() { return *components_; }
    CacheWarmer& warmer() { return *warmer_; }
    HealthMonitor& health() { return *health_; }
    CacheStore& store() { return *store_; }
    const CacheSettings& settings() const { return settings_; }

    WrapOptions optionsFor(CacheCategory category) const { return settings_.optionsFor(category); }

    std::string globalKey(CacheCategory category, const std::vector<std::string>& qualifiers) const;
    std::string userKey(const std::string& user_uuid, CacheCategory category,
                        const std::vector<std::string>& qualifiers) const;

    // EN: Shared key for a route whose output depends on a subset of the user configuration.
    // FR: Clé partagée pour une route dont le résultat dépend d'un sous-ensemble de la config.
    std::string contextKey(RouteCategory route, CacheCategory category, const nlohmann::json& user_config,
                           const std::vector<std::string>& qualifiers) const;

    size_t invalidate(const std::string& pattern);

    // EN: Remove every key mentioning the user identifier.
    // FR: Supprime toutes les clés mentionnant l'identifiant utilisateur.
    size_t invalidateUser(const std::string& user_uuid);

    // EN: Scan the meta, catalog and search entries of the current version and delete the ones
    //     failing their content check. Component slices are skipped.
    // FR: Parcourt les entrées meta, catalog et search de la version courante et supprime celles
    //     qui échouent leur vérification de contenu. Les composants sont ignorés.
    PurgeReport purgeInvalidEntries();

    std::string validatorFor(RouteCategory route, const nlohmann::json& payload,
                             const nlohmann::json& user_config) const;

private:
    CacheSettings settings_;
    std::shared_ptr<CacheStore> store_;
    std::shared_ptr<HealthMonitor> health_;
    std::unique_ptr<CacheWrapper> wrapper_;
    std::unique_ptr<ComponentReconstructor> components_;
    std::unique_ptr<CacheWarmer> warmer_;
    bool started_ = false;
};

} // namespace MDC
