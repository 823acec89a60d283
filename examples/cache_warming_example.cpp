#include "cache/cache_service.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// EN: Stand-in for a provider call; a real deployment performs the HTTP request here.
// FR: Remplace un appel fournisseur ; un vrai déploiement fait la requête HTTP ici.
nlohmann::json fetchGenres(const std::string& provider, const std::string& type) {
    if (provider == "offline") {
        MDC::throwForHttpStatus(503, provider + " genres");
    }
    return {{"provider", provider}, {"type", type},
            {"genres", nlohmann::json::array({"Action", "Drama", "Comedy"})}};
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "config/mdcache.yaml";

    auto& config = MDC::ConfigManager::getInstance();
    if (!config.loadFromFile(config_path)) {
        std::cerr << "Using built-in defaults, could not load " << config_path << std::endl;
    }
    config.loadEnvironmentOverrides();
    config.addValidationRules(MDC::CacheSettings::validationRules());

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            std::cerr << "Configuration error: " << error << std::endl;
        }
        return 1;
    }

    try {
        const MDC::CacheSettings settings = MDC::CacheSettings::fromConfig(config);

        auto& logger = MDC::Logger::getInstance();
        logger.setLogLevel(MDC::parseLogLevel(settings.log_level));
        if (!settings.log_file.empty()) {
            logger.setOutputFile(settings.log_file);
        }
        logger.setCorrelationId(logger.generateCorrelationId());

        MDC::CacheService service(settings);

        std::vector<MDC::WarmTarget> targets;
        for (const std::string provider : {"tmdb", "tvdb", "offline"}) {
            MDC::WarmTarget target;
            target.key = service.globalKey(MDC::CacheCategory::PROVIDER, {provider + "-genres", "series"});
            target.options = service.optionsFor(MDC::CacheCategory::PROVIDER);
            target.compute = [provider]() { return fetchGenres(provider, "series"); };
            targets.push_back(target);
        }
        service.warmer().setEssentialTargets(targets);
        service.start();

        const auto key = service.globalKey(MDC::CacheCategory::PROVIDER, {"tmdb-genres", "series"});
        const auto genres = service.wrapper().wrap(key, [] { return fetchGenres("tmdb", "series"); },
                                                   service.optionsFor(MDC::CacheCategory::PROVIDER));
        LOG_INFO("example", "Served " + std::to_string(genres["genres"].size()) + " genres from " + key);

        try {
            service.wrapper().wrap(service.globalKey(MDC::CacheCategory::PROVIDER, {"offline-genres", "series"}),
                                   [] { return fetchGenres("offline", "series"); },
                                   service.optionsFor(MDC::CacheCategory::PROVIDER));
        } catch (const MDC::UpstreamError& e) {
            LOG_WARN("example", std::string("Provider still failing (cached: ") +
                     (e.servedFromCache() ? "yes" : "no") + "): " + e.what());
        }

        LOG_INFO("example", service.health().describe());
        service.shutdown();
        logger.flush();

    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
