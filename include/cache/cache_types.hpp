#pragma once

#include "cache/cache_errors.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace MDC {

using Clock = std::chrono::system_clock;

// EN: Injectable clock. Every TTL decision goes through it.
// FR: Horloge injectable. Toutes les décisions de TTL passent par elle.
using TimeSource = std::function<Clock::time_point()>;

TimeSource systemTimeSource();

// EN: Cache categories, used for policies and health reporting.
// FR: Catégories de cache, utilisées pour les politiques et le suivi de santé.
enum class CacheCategory {
    CATALOG,
    META,
    SEARCH,
    PROVIDER,
    GLOBAL
};

const std::vector<CacheCategory>& allCategories();
std::string categoryToString(CacheCategory category);
std::optional<CacheCategory> categoryFromString(const std::string& value);

// EN: Lifecycle state of a key as observed by a reader.
// FR: État du cycle de vie d'une clé vu par un lecteur.
enum class EntryState {
    EMPTY,         // EN: Nothing stored / FR: Rien de stocké
    FRESH,         // EN: Value younger than its TTL / FR: Valeur plus jeune que son TTL
    STALE,         // EN: Past TTL, still inside the stale window / FR: TTL dépassé, encore dans la fenêtre stale
    ERROR_CACHED,  // EN: Error marker younger than its TTL / FR: Marqueur d'erreur plus jeune que son TTL
    EXPIRED        // EN: Present in the store but no longer usable / FR: Présent mais plus utilisable
};

std::string entryStateToString(EntryState state);

// EN: Envelope stored under each key. Error markers carry the failure instead of a value.
// FR: Enveloppe stockée sous chaque clé. Les marqueurs d'erreur portent l'échec au lieu d'une valeur.
struct CacheEntry {
    std::string key;
    nlohmann::json value;
    Clock::time_point created_at;
    std::chrono::seconds ttl{0};
    std::chrono::seconds stale_window{0};
    CacheCategory category = CacheCategory::GLOBAL;
    bool is_error_marker = false;
    FailureKind error_kind = FailureKind::TRANSIENT;
    std::string error_message;
    int error_status = 0;
    int retry_count = 0;

    // EN: State of this entry at the given instant.
    // FR: État de cette entrée à l'instant donné.
    EntryState stateAt(Clock::time_point now) const;
};

// EN: Serialize an entry to the string stored in the backing store.
// FR: Sérialise une entrée en chaîne stockée dans le stockage.
std::string serializeEntry(const CacheEntry& entry);

// EN: Parse a stored envelope. Throws std::invalid_argument when the payload is corrupted.
// FR: Analyse une enveloppe stockée. Lance std::invalid_argument si le contenu est corrompu.
CacheEntry parseEntry(const std::string& key, const std::string& raw);

// EN: null, false, "", [] and {} are considered empty and are not cached by default.
// FR: null, false, "", [] et {} sont considérés vides et ne sont pas mis en cache par défaut.
bool isEmptyPayload(const nlohmann::json& value);

using ComputeFunction = std::function<nlohmann::json()>;

// EN: Returns the list of problems found in a computed value; empty means valid.
// FR: Retourne la liste des problèmes d'une valeur calculée ; vide signifie valide.
using PayloadValidator = std::function<std::vector<std::string>(const nlohmann::json&)>;

// EN: Per-call policy for CacheWrapper::wrap. Policies are orthogonal.
// FR: Politique par appel pour CacheWrapper::wrap. Les politiques sont orthogonales.
struct WrapOptions {
    CacheCategory category = CacheCategory::GLOBAL;
    std::chrono::seconds ttl{3600};
    std::chrono::seconds stale_window{0};
    bool error_caching = true;
    int max_retries = 2;
    std::chrono::seconds error_ttl{120};
    // EN: Upstream answered 429; backing off longer than for other transient failures.
    // FR: L'amont a répondu 429 ; on recule plus longtemps que pour les autres échecs transitoires.
    std::chrono::seconds rate_limited_ttl{900};
    // EN: Upstream rejected the request (4xx other than 404, 408, 410, 429).
    // FR: L'amont a rejeté la requête (4xx hors 404, 408, 410, 429).
    std::chrono::seconds rejected_ttl{1800};
    std::chrono::seconds not_found_ttl{3600};
    bool allow_empty = false;
    // EN: False for composites that are stored as components instead of whole.
    // FR: Faux pour les composites stockés en composants plutôt qu'en entier.
    bool store_result = true;
    PayloadValidator validator;

    // EN: Lifetime of an error marker for a failure. Always strictly shorter than ttl;
    //     zero means the failure is not cached.
    // FR: Durée de vie d'un marqueur d'erreur pour un échec. Toujours strictement plus courte
    //     que ttl ; zéro signifie que l'échec n'est pas mis en cache.
    std::chrono::seconds markerTtl(FailureKind kind, int status_code) const;
};

} // namespace MDC
