#pragma once

#include "cache/cache_types.hpp"
#include "cache/cache_warmer.hpp"
#include "cache/cache_wrapper.hpp"
#include "cache/component_reconstructor.hpp"
#include "cache/memory_cache_store.hpp"
#include "infrastructure/config/config_manager.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace MDC {

// EN: Caching policy of one category.
// FR: Politique de cache d'une catégorie.
struct CategoryPolicy {
    std::chrono::seconds ttl{3600};
    std::chrono::seconds stale_window{0};
    bool error_caching = true;
    int max_retries = 2;
    std::chrono::seconds error_ttl{120};
    std::chrono::seconds rate_limited_ttl{900};
    std::chrono::seconds rejected_ttl{1800};
    std::chrono::seconds not_found_ttl{3600};
};

// EN: Typed settings of the whole cache subsystem, built from the ConfigManager.
// FR: Paramètres typés de tout le sous-système de cache, construits depuis le ConfigManager.
struct CacheSettings {
    WrapperConfig wrapper;
    MemoryStoreConfig store;
    WarmerConfig warmer;
    int warming_interval_minutes = 30;
    ComponentPolicy components;
    bool component_caching = true;
    // EN: Attach the content checks of the category (meta, catalog, search) to optionsFor().
    // FR: Attache les vérifications de contenu de la catégorie (meta, catalog, search) à optionsFor().
    bool content_validation = true;
    std::string log_level = "info";
    std::string log_file;
    std::map<CacheCategory, CategoryPolicy> categories;

    // EN: Defaults: meta 7d, catalog 1d, search 10m, provider 12h, global 30d.
    // FR: Valeurs par défaut : meta 7j, catalog 1j, search 10m, provider 12h, global 30j.
    static CacheSettings defaults();

    // EN: Read sections cache, store, warming, components, logging and one per category.
    //     Missing keys keep their defaults. Throws std::invalid_argument on out-of-range values,
    //     including a cached failure TTL that is not strictly shorter than the category ttl.
    // FR: Lit les sections cache, store, warming, components, logging et une par catégorie.
    //     Les clés absentes gardent leur défaut. Lance std::invalid_argument pour les valeurs hors bornes,
    //     y compris un TTL d'échec qui n'est pas strictement plus court que le ttl de la catégorie.
    static CacheSettings fromConfig(const ConfigManager& config);

    static std::vector<ConfigManager::ValidationRule> validationRules();

    const CategoryPolicy& policyFor(CacheCategory category) const;

    // EN: WrapOptions carrying the policy of a category, with its content check when enabled.
    // FR: WrapOptions portant la politique d'une catégorie, avec sa vérification de contenu si activée.
    WrapOptions optionsFor(CacheCategory category) const;
};

} // namespace MDC
