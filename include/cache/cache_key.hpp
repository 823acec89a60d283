#pragma once

#include "cache/cache_types.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace MDC {

// EN: Builds namespaced keys of the form scope:version:category:qualifier[:qualifier...].
//     Every segment is escaped, so no qualifier can forge a separator or a glob metacharacter.
// FR: Construit des clés de la forme scope:version:category:qualifier[:qualifier...].
//     Chaque segment est échappé : aucun qualificatif ne peut forger un séparateur ou un joker.
class CacheKey {
public:
    static constexpr const char* kGlobalScope = "global";

    struct Parts {
        std::string scope;
        std::string version;
        CacheCategory category = CacheCategory::GLOBAL;
        std::vector<std::string> qualifiers;
    };

    static std::string build(const std::string& scope, const std::string& version,
                             CacheCategory category, const std::vector<std::string>& qualifiers);

    static std::string global(const std::string& version, CacheCategory category,
                              const std::vector<std::string>& qualifiers);

    // EN: Global key whose first qualifier is the fingerprint of a config subset, so users
    //     sharing the relevant settings share the entry.
    // FR: Clé globale dont le premier qualificatif est l'empreinte d'un sous-ensemble de config ;
    //     les utilisateurs partageant les réglages pertinents partagent l'entrée.
    static std::string forContext(const std::string& version, CacheCategory category,
                                  const nlohmann::json& config_subset,
                                  const std::vector<std::string>& qualifiers);

    // EN: Inverse of build. Returns nullopt for keys not produced by build.
    // FR: Inverse de build. Retourne nullopt pour les clés non produites par build.
    static std::optional<Parts> parse(const std::string& key);

    // EN: Pattern matching every key of a scope (e.g. one user).
    // FR: Motif correspondant à toutes les clés d'un scope (ex. un utilisateur).
    static std::string scopePattern(const std::string& scope);

    // EN: Pattern matching every key of one category and version, whatever the scope.
    // FR: Motif correspondant à toutes les clés d'une catégorie et d'une version, quel que soit le scope.
    static std::string categoryPattern(const std::string& version, CacheCategory category);

    // EN: Pattern matching every key that mentions the given token in any segment.
    // FR: Motif correspondant à toutes les clés mentionnant le jeton dans un segment.
    static std::string containsPattern(const std::string& token);

    // EN: Short stable fingerprint (16 hex chars of SHA-256) of a canonical JSON dump.
    // FR: Empreinte courte et stable (16 hex de SHA-256) d'un dump JSON canonique.
    static std::string paramFingerprint(const nlohmann::json& params);

    static std::string escapeSegment(const std::string& segment);
    static std::string unescapeSegment(const std::string& segment);

    // EN: Shorten long keys for log lines.
    // FR: Raccourcit les clés longues pour les logs.
    static std::string truncateForLog(const std::string& key, size_t max_length = 96);
};

} // namespace MDC
