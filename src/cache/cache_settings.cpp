// EN: Conversion of the YAML/environment configuration into typed cache settings.
// FR: Conversion de la configuration YAML/environnement en paramètres de cache typés.

#include "cache/cache_settings.hpp"
#include "cache/content_validator.hpp"
#include "infrastructure/logging/logger.hpp"

#include <stdexcept>
#include <utility>

namespace MDC {

namespace {

constexpr int kMinute = 60;
constexpr int kHour = 60 * kMinute;
constexpr int kDay = 24 * kHour;

int readInt(const ConfigManager& config, const std::string& section, const std::string& key,
            int default_value) {
    const ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return default_value;
    }
    if (auto as_int = value.tryAs<int>()) {
        return *as_int;
    }
    if (auto as_double = value.tryAs<double>()) {
        return static_cast<int>(*as_double);
    }
    throw std::invalid_argument(section + "." + key + " must be an integer, got '" + value.toString() + "'");
}

bool readBool(const ConfigManager& config, const std::string& section, const std::string& key,
              bool default_value) {
    const ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return default_value;
    }
    if (auto as_bool = value.tryAs<bool>()) {
        return *as_bool;
    }
    throw std::invalid_argument(section + "." + key + " must be a boolean, got '" + value.toString() + "'");
}

std::string readString(const ConfigManager& config, const std::string& section, const std::string& key,
                       const std::string& default_value) {
    const ConfigValue value = config.get(section, key);
    return value.isValid() ? value.toString() : default_value;
}

std::chrono::seconds readSeconds(const ConfigManager& config, const std::string& section,
                                 const std::string& key, std::chrono::seconds default_value) {
    const int seconds = readInt(config, section, key, static_cast<int>(default_value.count()));
    if (seconds < 0) {
        throw std::invalid_argument(section + "." + key + " must not be negative");
    }
    return std::chrono::seconds(seconds);
}

CategoryPolicy makePolicy(int ttl, int stale_window) {
    CategoryPolicy policy;
    policy.ttl = std::chrono::seconds(ttl);
    policy.stale_window = std::chrono::seconds(stale_window);
    return policy;
}

// EN: A cached failure must expire strictly before a success stored under the same policy.
// FR: Un échec en cache doit expirer strictement avant un succès stocké avec la même politique.
void checkFailureTtls(const std::string& section, const CategoryPolicy& policy) {
    if (!policy.error_caching || policy.ttl.count() == 0) {
        return;
    }
    const std::pair<const char*, std::chrono::seconds> failure_ttls[] = {
        {"error_ttl_seconds", policy.error_ttl},
        {"rate_limited_ttl_seconds", policy.rate_limited_ttl},
        {"rejected_ttl_seconds", policy.rejected_ttl},
        {"not_found_ttl_seconds", policy.not_found_ttl}
    };
    for (const auto& [name, ttl] : failure_ttls) {
        if (ttl >= policy.ttl) {
            throw std::invalid_argument(section + "." + name + " (" + std::to_string(ttl.count()) +
                                        "s) must be shorter than " + section + ".ttl_seconds (" +
                                        std::to_string(policy.ttl.count()) + "s)");
        }
    }
}

} // namespace

CacheSettings CacheSettings::defaults() {
    CacheSettings settings;
    settings.categories[CacheCategory::META] = makePolicy(7 * kDay, kHour);
    settings.categories[CacheCategory::CATALOG] = makePolicy(kDay, kHour);
    settings.categories[CacheCategory::SEARCH] = makePolicy(10 * kMinute, 0);
    settings.categories[CacheCategory::PROVIDER] = makePolicy(12 * kHour, 0);
    settings.categories[CacheCategory::GLOBAL] = makePolicy(30 * kDay, kDay);

    // EN: Search results churn quickly; a failed search is retried sooner.
    // FR: Les résultats de recherche changent vite ; une recherche échouée est retentée plus tôt.
    CategoryPolicy& search = settings.categories[CacheCategory::SEARCH];
    search.error_ttl = std::chrono::seconds(30);
    search.rate_limited_ttl = std::chrono::seconds(2 * kMinute);
    search.rejected_ttl = std::chrono::seconds(2 * kMinute);
    search.not_found_ttl = std::chrono::seconds(2 * kMinute);
    return settings;
}

CacheSettings CacheSettings::fromConfig(const ConfigManager& config) {
    CacheSettings settings = defaults();

    settings.wrapper.enabled = readBool(config, "cache", "enabled", settings.wrapper.enabled);
    settings.wrapper.software_version = readString(config, "cache", "software_version",
                                                   settings.wrapper.software_version);
    settings.wrapper.inflight_timeout = readSeconds(config, "cache", "inflight_timeout_seconds",
                                                    settings.wrapper.inflight_timeout);
    settings.wrapper.sweep_interval = readSeconds(config, "cache", "sweep_interval_seconds",
                                                  settings.wrapper.sweep_interval);
    settings.wrapper.health_log_interval = readSeconds(config, "cache", "health_log_interval_seconds",
                                                       settings.wrapper.health_log_interval);
    const int refresh_threads = readInt(config, "cache", "refresh_threads",
                                        static_cast<int>(settings.wrapper.refresh_threads));
    if (refresh_threads < 1) {
        throw std::invalid_argument("cache.refresh_threads must be at least 1");
    }
    settings.wrapper.refresh_threads = static_cast<size_t>(refresh_threads);

    const int max_entries = readInt(config, "store", "max_entries", static_cast<int>(settings.store.max_entries));
    if (max_entries < 1) {
        throw std::invalid_argument("store.max_entries must be at least 1");
    }
    settings.store.max_entries = static_cast<size_t>(max_entries);
    settings.store.enable_compression = readBool(config, "store", "enable_compression",
                                                 settings.store.enable_compression);
    const int threshold = readInt(config, "store", "compression_threshold",
                                  static_cast<int>(settings.store.compression_threshold));
    if (threshold < 0) {
        throw std::invalid_argument("store.compression_threshold must not be negative");
    }
    settings.store.compression_threshold = static_cast<size_t>(threshold);
    settings.store.cleanup_interval = readSeconds(config, "store", "cleanup_interval_seconds",
                                                  settings.store.cleanup_interval);

    settings.warmer.enabled = readBool(config, "warming", "enabled", settings.warmer.enabled);
    settings.warming_interval_minutes = readInt(config, "warming", "interval_minutes",
                                                settings.warming_interval_minutes);
    if (settings.warming_interval_minutes < 1) {
        throw std::invalid_argument("warming.interval_minutes must be at least 1");
    }
    const int concurrency = readInt(config, "warming", "max_concurrency",
                                    static_cast<int>(settings.warmer.max_concurrency));
    if (concurrency < 1) {
        throw std::invalid_argument("warming.max_concurrency must be at least 1");
    }
    settings.warmer.max_concurrency = static_cast<size_t>(concurrency);

    settings.component_caching = readBool(config, "components", "enabled", settings.component_caching);
    settings.components.identity_ttl = readSeconds(config, "components", "identity_ttl_seconds",
                                                   settings.components.identity_ttl);
    settings.components.relational_ttl = readSeconds(config, "components", "relational_ttl_seconds",
                                                     settings.components.relational_ttl);
    settings.components.derived_ttl = readSeconds(config, "components", "derived_ttl_seconds",
                                                  settings.components.derived_ttl);

    settings.content_validation = readBool(config, "cache", "validate_content", settings.content_validation);

    settings.log_level = readString(config, "logging", "level", settings.log_level);
    settings.log_file = readString(config, "logging", "file", settings.log_file);

    // EN: cache.max_retries is the process-wide bound; a category section may override it.
    // FR: cache.max_retries est la borne globale ; une section de catégorie peut la surcharger.
    const ConfigValue global_retries = config.get("cache", "max_retries");

    for (CacheCategory category : allCategories()) {
        const std::string section = categoryToString(category);
        CategoryPolicy& policy = settings.categories[category];

        if (global_retries.isValid()) {
            policy.max_retries = readInt(config, "cache", "max_retries", policy.max_retries);
        }
        policy.ttl = readSeconds(config, section, "ttl_seconds", policy.ttl);
        policy.stale_window = readSeconds(config, section, "stale_window_seconds", policy.stale_window);
        policy.error_caching = readBool(config, section, "error_caching", policy.error_caching);
        policy.max_retries = readInt(config, section, "max_retries", policy.max_retries);
        policy.error_ttl = readSeconds(config, section, "error_ttl_seconds", policy.error_ttl);
        policy.rate_limited_ttl = readSeconds(config, section, "rate_limited_ttl_seconds", policy.rate_limited_ttl);
        policy.rejected_ttl = readSeconds(config, section, "rejected_ttl_seconds", policy.rejected_ttl);
        policy.not_found_ttl = readSeconds(config, section, "not_found_ttl_seconds", policy.not_found_ttl);

        if (policy.max_retries < 0) {
            throw std::invalid_argument(section + ".max_retries must not be negative");
        }
        checkFailureTtls(section, policy);
    }

    LOG_DEBUG("config", "Cache settings loaded (version " + settings.wrapper.software_version +
              ", caching " + (settings.wrapper.enabled ? "on" : "off") +
              ", warming " + (settings.warmer.enabled ? "on" : "off") + ")");
    return settings;
}

std::vector<ConfigManager::ValidationRule> CacheSettings::validationRules() {
    std::vector<ConfigManager::ValidationRule> rules;

    auto add = [&rules](const std::string& key, const std::string& type,
                        std::optional<double> min_value, std::optional<double> max_value,
                        const std::string& description) {
        ConfigManager::ValidationRule rule;
        rule.key = key;
        rule.type = type;
        rule.min_value = min_value;
        rule.max_value = max_value;
        rule.description = description;
        rules.push_back(rule);
    };

    add("cache.enabled", "bool", std::nullopt, std::nullopt, "Master switch of the cache");
    add("cache.software_version", "string", std::nullopt, std::nullopt, "Version segment of every key");
    add("cache.max_retries", "int", 0, 10, "Transient failures cached before giving up");
    add("cache.refresh_threads", "int", 1, 64, "Stale-while-revalidate workers");
    add("cache.validate_content", "bool", std::nullopt, std::nullopt, "Reject malformed payloads before caching");
    add("store.max_entries", "int", 1, std::nullopt, "Entries kept before LRU eviction");
    add("store.compression_threshold", "int", 0, std::nullopt, "Payload size that triggers deflate");
    add("warming.enabled", "bool", std::nullopt, std::nullopt, "Essential warming switch");
    add("warming.interval_minutes", "int", 1, 24 * 60, "Essential warming period");
    add("warming.max_concurrency", "int", 1, 64, "Parallel warming computations");

    for (CacheCategory category : allCategories()) {
        const std::string section = categoryToString(category);
        add(section + ".ttl_seconds", "int", 0, std::nullopt, "Freshness of " + section + " entries");
        add(section + ".stale_window_seconds", "int", 0, std::nullopt, "Grace period of " + section + " entries");
        add(section + ".error_ttl_seconds", "int", 0, std::nullopt, "Lifetime of cached " + section + " failures");
        add(section + ".rate_limited_ttl_seconds", "int", 0, std::nullopt, "Back-off after a rate-limited " + section + " call");
        add(section + ".rejected_ttl_seconds", "int", 0, std::nullopt, "Lifetime of rejected " + section + " requests");
    }

    ConfigManager::ValidationRule level;
    level.key = "logging.level";
    level.type = "string";
    level.allowed_values = {"debug", "info", "warn", "error", "DEBUG", "INFO", "WARN", "ERROR"};
    level.description = "Minimum log level";
    rules.push_back(level);

    return rules;
}

const CategoryPolicy& CacheSettings::policyFor(CacheCategory category) const {
    auto it = categories.find(category);
    if (it == categories.end()) {
        throw std::out_of_range("No policy for category " + categoryToString(category));
    }
    return it->second;
}

WrapOptions CacheSettings::optionsFor(CacheCategory category) const {
    const CategoryPolicy& policy = policyFor(category);

    WrapOptions options;
    options.category = category;
    options.ttl = policy.ttl;
    options.stale_window = policy.stale_window;
    options.error_caching = policy.error_caching;
    options.max_retries = policy.max_retries;
    options.error_ttl = policy.error_ttl;
    options.rate_limited_ttl = policy.rate_limited_ttl;
    options.rejected_ttl = policy.rejected_ttl;
    options.not_found_ttl = policy.not_found_ttl;

    if (content_validation) {
        if (auto content_type = ContentValidator::forCategory(category)) {
            options.validator = ContentValidator::forType(*content_type);
        }
    }
    return options;
}

} // namespace MDC
