#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace MDC {

// EN: Route families that produce distinct validators.
// FR: Familles de routes produisant des validateurs distincts.
enum class RouteCategory {
    MANIFEST,
    CATALOG,
    META,
    SEARCH,
    OTHER
};

std::string routeCategoryToString(RouteCategory category);

// EN: Classify a request path ("/<uuid>/meta/series/tt123.json", ...).
// FR: Classe un chemin de requête ("/<uuid>/meta/series/tt123.json", ...).
RouteCategory routeCategoryFromPath(const std::string& path);

// EN: Deterministic weak validators (ETag) derived from payload, software version and the
//     route-relevant slice of the user configuration.
// FR: Validateurs faibles (ETag) déterministes dérivés du contenu, de la version logicielle
//     et de la partie de la configuration utilisateur pertinente pour la route.
class FingerprintGenerator {
public:
    // EN: Fields of the user configuration that influence each route family.
    // FR: Champs de la configuration utilisateur qui influencent chaque famille de routes.
    static const std::vector<std::string>& relevantFields(RouteCategory category);

    // EN: Project the user configuration on the fields relevant to the route. Missing fields
    //     become null. The manifest depends on the whole configuration.
    // FR: Projette la configuration utilisateur sur les champs pertinents pour la route.
    //     Les champs absents deviennent null. Le manifeste dépend de toute la configuration.
    static nlohmann::json selectConfigSubset(RouteCategory category, const nlohmann::json& user_config);

    // EN: Returns W/"<sha256 hex>".
    // FR: Retourne W/"<sha256 hex>".
    static std::string compute(RouteCategory category, const std::string& software_version,
                               const nlohmann::json& payload, const nlohmann::json& config_subset);

    // EN: selectConfigSubset followed by compute.
    // FR: selectConfigSubset suivi de compute.
    static std::string forRequest(RouteCategory category, const std::string& software_version,
                                  const nlohmann::json& payload, const nlohmann::json& user_config);

    // EN: Whether an If-None-Match header value matches the validator (list and "*" aware).
    // FR: Indique si un en-tête If-None-Match correspond au validateur (gère listes et "*").
    static bool matches(const std::string& if_none_match, const std::string& validator);

    // EN: Lowercase hex SHA-256 of the input. Throws std::runtime_error if the digest fails.
    // FR: SHA-256 hexadécimal minuscule de l'entrée. Lance std::runtime_error si le calcul échoue.
    static std::string sha256Hex(const std::string& input);
};

} // namespace MDC
