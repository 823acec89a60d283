#pragma once

#include <chrono>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace MDC {

// EN: Key/value store with per-entry TTL, existence checks and glob enumeration.
//     Implementations report failures by throwing StoreError.
// FR: Stockage clé/valeur avec TTL par entrée, tests d'existence et énumération glob.
//     Les implémentations signalent les échecs en levant StoreError.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    // EN: Get the stored value, or nullopt when missing or expired.
    // FR: Obtient la valeur stockée, ou nullopt si absente ou expirée.
    virtual std::optional<std::string> get(const std::string& key) = 0;

    // EN: Store a value. A zero TTL means the entry never expires.
    // FR: Stocke une valeur. Un TTL nul signifie que l'entrée n'expire jamais.
    virtual void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;

    virtual bool remove(const std::string& key) = 0;

    virtual bool exists(const std::string& key) = 0;

    // EN: Keys matching a glob pattern (*, ? and [...] classes).
    //     A malformed class such as [z-a] throws std::invalid_argument.
    // FR: Clés correspondant à un motif glob (*, ? et classes [...]).
    //     Une classe invalide comme [z-a] lance std::invalid_argument.
    virtual std::vector<std::string> keysMatching(const std::string& pattern) = 0;

    // EN: Delete every key matching the pattern and return how many were removed.
    //     The default enumerates then removes; stores with an atomic primitive override it.
    // FR: Supprime toutes les clés correspondant au motif et retourne leur nombre.
    //     Par défaut énumère puis supprime ; les stockages atomiques la redéfinissent.
    virtual size_t removeMatching(const std::string& pattern);
};

// EN: Compile a glob pattern into a regex usable with std::regex_match.
//     Throws std::invalid_argument when the translated regex is rejected.
// FR: Compile un motif glob en regex utilisable avec std::regex_match.
//     Lance std::invalid_argument si la regex traduite est rejetée.
std::regex compileGlob(const std::string& pattern);

// EN: Glob matching shared by store implementations.
// FR: Correspondance glob partagée par les implémentations de stockage.
bool globMatch(const std::string& pattern, const std::string& text);

} // namespace MDC
