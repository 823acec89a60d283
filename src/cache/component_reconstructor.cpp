// EN: Component caching of metadata objects - decomposition, storage and reassembly.
// FR: Mise en cache par composants des métadonnées - découpage, stockage et réassemblage.

#include "cache/component_reconstructor.hpp"
#include "cache/cache_key.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace MDC {

namespace {

const std::vector<std::string>& nonCoreComponents() {
    static const std::vector<std::string> names = {
        ComponentReconstructor::kArtwork,
        ComponentReconstructor::kEpisodes,
        ComponentReconstructor::kCast,
        ComponentReconstructor::kLinks
    };
    return names;
}

bool isKnownComponent(const std::string& name) {
    if (name == ComponentReconstructor::kCore) {
        return true;
    }
    const auto& names = nonCoreComponents();
    return std::find(names.begin(), names.end(), name) != names.end();
}

// EN: Fields owned by a non-core component; core gets whatever is left.
// FR: Champs possédés par un composant hors core ; core reçoit le reste.
const std::unordered_set<std::string>& nonCoreFields() {
    static const std::unordered_set<std::string> fields = [] {
        std::unordered_set<std::string> all;
        for (const auto& name : nonCoreComponents()) {
            const auto& owned = ComponentReconstructor::componentFields(name);
            all.insert(owned.begin(), owned.end());
        }
        return all;
    }();
    return fields;
}

bool hasIdentity(const nlohmann::json& value) {
    for (const char* field : {"id", "name", "type"}) {
        auto it = value.find(field);
        if (it == value.end() || it->is_null() || (it->is_string() && it->get_ref<const std::string&>().empty())) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string ttlClassToString(TtlClass ttl_class) {
    switch (ttl_class) {
        case TtlClass::IDENTITY:   return "identity";
        case TtlClass::RELATIONAL: return "relational";
        case TtlClass::DERIVED:    return "derived";
    }
    return "identity";
}

std::chrono::seconds ComponentPolicy::ttlFor(TtlClass ttl_class) const {
    switch (ttl_class) {
        case TtlClass::IDENTITY:   return identity_ttl;
        case TtlClass::RELATIONAL: return relational_ttl;
        case TtlClass::DERIVED:    return derived_ttl;
    }
    return identity_ttl;
}

ComponentReconstructor::ComponentReconstructor(CacheWrapper& wrapper, const ComponentPolicy& policy)
    : wrapper_(wrapper), policy_(policy) {
    if (policy_.identity_ttl.count() <= 0 || policy_.relational_ttl.count() <= 0 ||
        policy_.derived_ttl.count() <= 0) {
        throw std::invalid_argument("Component TTLs must be positive");
    }
}

std::string ComponentReconstructor::componentKey(const std::string& parent_key, const std::string& name) {
    return parent_key + ":component:" + name;
}

bool ComponentReconstructor::isComponentKey(const std::string& key) {
    return key.find(":component:") != std::string::npos;
}

const std::vector<std::string>& ComponentReconstructor::componentFields(const std::string& name) {
    static const std::vector<std::string> artwork = {"poster", "background", "logo"};
    static const std::vector<std::string> episodes = {"videos"};
    static const std::vector<std::string> cast = {"app_extras"};
    static const std::vector<std::string> links = {"links", "trailers", "trailerStreams"};
    static const std::vector<std::string> none;

    if (name == kArtwork) return artwork;
    if (name == kEpisodes) return episodes;
    if (name == kCast) return cast;
    if (name == kLinks) return links;
    return none;
}

TtlClass ComponentReconstructor::ttlClassFor(const std::string& name) {
    if (name == kArtwork) {
        return TtlClass::DERIVED;
    }
    if (name == kCast || name == kEpisodes || name == kLinks) {
        return TtlClass::RELATIONAL;
    }
    return TtlClass::IDENTITY;
}

std::vector<MetaComponent> ComponentReconstructor::decompose(const std::string& parent_key,
                                                             const nlohmann::json& value) const {
    if (!value.is_object()) {
        throw std::invalid_argument("Only JSON objects can be decomposed into components");
    }

    auto makeComponent = [&](const std::string& name, nlohmann::json slice) {
        MetaComponent component;
        component.parent_key = parent_key;
        component.name = name;
        component.value = std::move(slice);
        component.ttl_class = ttlClassFor(name);
        component.ttl = policy_.ttlFor(component.ttl_class);
        return component;
    };

    std::vector<MetaComponent> components;

    nlohmann::json core = nlohmann::json::object();
    const auto& owned_elsewhere = nonCoreFields();
    for (auto it = value.begin(); it != value.end(); ++it) {
        if (owned_elsewhere.count(it.key()) == 0) {
            core[it.key()] = it.value();
        }
    }
    if (!core.empty()) {
        components.push_back(makeComponent(kCore, std::move(core)));
    }

    for (const auto& name : nonCoreComponents()) {
        nlohmann::json slice = nlohmann::json::object();
        for (const auto& field : componentFields(name)) {
            auto it = value.find(field);
            if (it != value.end()) {
                slice[field] = *it;
            }
        }
        if (!slice.empty()) {
            components.push_back(makeComponent(name, std::move(slice)));
        }
    }

    return components;
}

size_t ComponentReconstructor::storeComponents(const std::string& parent_key, const nlohmann::json& value,
                                               Clock::time_point created_at, CacheCategory category) {
    if (!value.is_object() || !hasIdentity(value)) {
        LOG_WARN("components", "Not storing components of incomplete value for " +
                 CacheKey::truncateForLog(parent_key) + " (id, name and type are required)");
        return 0;
    }

    size_t written = 0;
    for (const auto& component : decompose(parent_key, value)) {
        CacheEntry entry;
        entry.key = componentKey(parent_key, component.name);
        entry.value = component.value;
        entry.created_at = created_at;
        entry.ttl = component.ttl;
        entry.category = category;

        if (wrapper_.storeEntry(entry, component.ttl)) {
            written++;
        }
    }

    LOG_DEBUG("components", "Stored " + std::to_string(written) + " components for " +
              CacheKey::truncateForLog(parent_key));
    return written;
}

std::optional<nlohmann::json> ComponentReconstructor::reconstruct(const std::string& parent_key,
                                                                  const std::vector<std::string>& required,
                                                                  CacheCategory category) {
    return tryAssemble(parent_key, required, category, true);
}

std::optional<nlohmann::json> ComponentReconstructor::tryAssemble(const std::string& parent_key,
                                                                  const std::vector<std::string>& required,
                                                                  CacheCategory category, bool record_miss) {
    const std::vector<std::string> names = required.empty() ? std::vector<std::string>{kCore} : required;
    for (const auto& name : names) {
        if (!isKnownComponent(name)) {
            throw std::invalid_argument("Unknown component: " + name);
        }
    }

    const auto now = wrapper_.now();
    nlohmann::json assembled = nlohmann::json::object();
    size_t found = 0;

    for (const auto& name : names) {
        auto entry = wrapper_.peek(componentKey(parent_key, name));
        if (!entry || entry->is_error_marker || entry->stateAt(now) != EntryState::FRESH ||
            !entry->value.is_object()) {
            continue;
        }
        for (auto it = entry->value.begin(); it != entry->value.end(); ++it) {
            assembled[it.key()] = it.value();
        }
        found++;
    }

    if (found == names.size()) {
        wrapper_.health().recordHit(category);
        LOG_DEBUG("components", "Reconstructed " + CacheKey::truncateForLog(parent_key) + " from " +
                  std::to_string(found) + " components");
        return assembled;
    }

    if (found > 0) {
        wrapper_.health().recordPartialHit(category);
        LOG_DEBUG("components", "Partial component hit for " + CacheKey::truncateForLog(parent_key) + " (" +
                  std::to_string(found) + "/" + std::to_string(names.size()) + ")");
    } else if (record_miss) {
        wrapper_.health().recordMiss(category);
    }
    return std::nullopt;
}

nlohmann::json ComponentReconstructor::wrapComposite(const std::string& parent_key,
                                                     const std::vector<std::string>& required,
                                                     ComputeFunction compute, const WrapOptions& options) {
    if (!compute) {
        throw std::invalid_argument("wrapComposite requires a compute function");
    }

    if (!wrapper_.isEnabled()) {
        return compute();
    }

    if (auto assembled = tryAssemble(parent_key, required, options.category, false)) {
        return *assembled;
    }

    // EN: The whole composite is never stored; the wrapper only provides single-flight and error caching.
    // FR: Le composite entier n'est jamais stocké ; le wrapper fournit seulement single-flight et cache d'erreurs.
    WrapOptions composite_options = options;
    composite_options.store_result = false;
    composite_options.validator = nullptr;

    const PayloadValidator validator = options.validator;
    const CacheCategory category = options.category;

    return wrapper_.wrap(parent_key,
        [this, parent_key, compute, validator, category]() {
            const auto started_at = wrapper_.now();
            nlohmann::json value = compute();

            if (validator) {
                const auto issues = validator(value);
                if (!issues.empty()) {
                    throw InternalComputeError("Computed value rejected: " + issues.front());
                }
            }

            storeComponents(parent_key, value, started_at, category);
            return value;
        },
        composite_options);
}

} // namespace MDC
