#pragma once

#include "cache/cache_types.hpp"
#include "cache/cache_wrapper.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace MDC {

// EN: Volatility class of a component; selects its TTL.
// FR: Classe de volatilité d'un composant ; détermine son TTL.
enum class TtlClass {
    IDENTITY,    // EN: Titles, ids, descriptions / FR: Titres, ids, descriptions
    RELATIONAL,  // EN: Cast, episodes, links / FR: Casting, épisodes, liens
    DERIVED      // EN: Artwork / FR: Visuels
};

std::string ttlClassToString(TtlClass ttl_class);

struct ComponentPolicy {
    std::chrono::seconds identity_ttl{7 * 24 * 3600};
    std::chrono::seconds relational_ttl{12 * 3600};
    std::chrono::seconds derived_ttl{7 * 24 * 3600};

    std::chrono::seconds ttlFor(TtlClass ttl_class) const;
};

// EN: One independently cached slice of a composite metadata object.
// FR: Une tranche d'un objet de métadonnées composite, mise en cache indépendamment.
struct MetaComponent {
    std::string parent_key;
    std::string name;
    nlohmann::json value;
    TtlClass ttl_class = TtlClass::IDENTITY;
    std::chrono::seconds ttl{0};
};

// EN: Splits metadata objects into components with their own TTLs and reassembles them
//     from cache without recomputation.
// FR: Découpe les objets de métadonnées en composants à TTL propre et les réassemble
//     depuis le cache sans recalcul.
class ComponentReconstructor {
public:
    static constexpr const char* kCore = "core";
    static constexpr const char* kArtwork = "artwork";
    static constexpr const char* kEpisodes = "episodes";
    static constexpr const char* kCast = "cast";
    static constexpr const char* kLinks = "links";

    explicit ComponentReconstructor(CacheWrapper& wrapper, const ComponentPolicy& policy = ComponentPolicy{});

    // EN: Split value into disjoint components. Only components present in value are returned.
    //     Throws std::invalid_argument when value is not an object.
    // FR: Découpe la valeur en composants disjoints. Seuls les composants présents sont retournés.
    //     Lance std::invalid_argument si la valeur n'est pas un objet.
    std::vector<MetaComponent> decompose(const std::string& parent_key, const nlohmann::json& value) const;

    // EN: Store every component of value. Values missing id, name or type are not stored.
    //     Returns the number of components written.
    // FR: Stocke chaque composant de la valeur. Les valeurs sans id, name ou type ne sont pas stockées.
    //     Retourne le nombre de composants écrits.
    size_t storeComponents(const std::string& parent_key, const nlohmann::json& value,
                           Clock::time_point created_at, CacheCategory category = CacheCategory::META);

    // EN: Assemble the composite when every required component is present and fresh, otherwise nullopt.
    //     An empty list means {"core"}. Never triggers a computation.
    // FR: Assemble le composite si tous les composants requis sont présents et frais, sinon nullopt.
    //     Une liste vide signifie {"core"}. Ne déclenche jamais de calcul.
    std::optional<nlohmann::json> reconstruct(const std::string& parent_key,
                                              const std::vector<std::string>& required = {},
                                              CacheCategory category = CacheCategory::META);

    // EN: reconstruct() first; on a miss run compute through the wrapper's single-flight and
    //     store the result as components.
    // FR: reconstruct() d'abord ; en cas d'échec exécute le calcul via le single-flight du wrapper
    //     et stocke le résultat en composants.
    nlohmann::json wrapComposite(const std::string& parent_key, const std::vector<std::string>& required,
                                 ComputeFunction compute, const WrapOptions& options);

    static std::string componentKey(const std::string& parent_key, const std::string& name);
    static bool isComponentKey(const std::string& key);

    // EN: Top-level fields owned by a component; empty for "core", which owns every other field.
    // FR: Champs de premier niveau d'un composant ; vide pour "core", qui possède tous les autres.
    static const std::vector<std::string>& componentFields(const std::string& name);

    static TtlClass ttlClassFor(const std::string& name);

    const ComponentPolicy& getPolicy() const { return policy_; }

private:
    std::optional<nlohmann::json> tryAssemble(const std::string& parent_key,
                                              const std::vector<std::string>& required,
                                              CacheCategory category, bool record_miss);

    CacheWrapper& wrapper_;
    ComponentPolicy policy_;
};

} // namespace MDC
