#pragma once

#include "cache/cache_types.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace MDC {

// EN: Kinds of payload the aggregator caches and knows how to check.
// FR: Types de contenu que l'agrégateur met en cache et sait vérifier.
enum class ContentType {
    META,
    CATALOG,
    SEARCH,
    GENRE
};

std::string contentTypeToString(ContentType type);

// EN: Detects payloads that must not be cached: error bodies, missing identity fields and the
//     "undefined"/"null" placeholders a broken upstream mapping leaves in ids, names and URLs.
//     Every check returns the list of problems found; an empty list means the payload is valid.
// FR: Détecte les contenus à ne pas mettre en cache : corps d'erreur, champs d'identité manquants
//     et valeurs "undefined"/"null" laissées par un mapping amont défaillant dans les ids, noms et URLs.
//     Chaque vérification retourne la liste des problèmes ; une liste vide signifie valide.
class ContentValidator {
public:
    // EN: Accepts a meta response {"meta": {...}} or a bare meta object.
    // FR: Accepte une réponse meta {"meta": {...}} ou un objet meta nu.
    static std::vector<std::string> validateMeta(const nlohmann::json& data);

    static std::vector<std::string> validateEpisodes(const nlohmann::json& episodes);

    // EN: {"metas": [...]}; an empty list is valid.
    // FR: {"metas": [...]} ; une liste vide est valide.
    static std::vector<std::string> validateCatalog(const nlohmann::json& data);

    static std::vector<std::string> validateSearch(const nlohmann::json& data);

    // EN: Array of {id, name}; an empty array is valid.
    // FR: Tableau de {id, name} ; un tableau vide est valide.
    static std::vector<std::string> validateGenres(const nlohmann::json& data);

    static std::vector<std::string> validate(ContentType type, const nlohmann::json& data);

    static PayloadValidator forType(ContentType type);

    // EN: Content type checked by default for a cache category, if any.
    // FR: Type de contenu vérifié par défaut pour une catégorie de cache, s'il existe.
    static std::optional<ContentType> forCategory(CacheCategory category);

    // EN: True when a colon-separated episode id has an "undefined" segment (e.g. "tt123:1:undefined").
    // FR: Vrai si un id d'épisode séparé par des deux-points a un segment "undefined" (ex. "tt123:1:undefined").
    static bool hasBadEpisodeId(const std::string& id);
};

} // namespace MDC
