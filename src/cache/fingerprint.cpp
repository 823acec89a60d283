// EN: Validator generation with OpenSSL EVP digests.
// FR: Génération de validateurs avec les digests EVP d'OpenSSL.

#include "cache/fingerprint.hpp"

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>

namespace MDC {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string trim(const std::string& value) {
    const size_t first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const size_t last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

// EN: W/"abc" and "abc" compare equal under weak comparison.
// FR: W/"abc" et "abc" sont égaux en comparaison faible.
std::string opaqueTag(const std::string& tag) {
    std::string result = trim(tag);
    if (result.rfind("W/", 0) == 0) {
        result = result.substr(2);
    }
    return result;
}

} // namespace

std::string routeCategoryToString(RouteCategory category) {
    switch (category) {
        case RouteCategory::MANIFEST: return "manifest";
        case RouteCategory::CATALOG:  return "catalog";
        case RouteCategory::META:     return "meta";
        case RouteCategory::SEARCH:   return "search";
        case RouteCategory::OTHER:    return "other";
    }
    return "other";
}

RouteCategory routeCategoryFromPath(const std::string& path) {
    if (path.find("/manifest.json") != std::string::npos) {
        return RouteCategory::MANIFEST;
    }
    if (path.find("/catalog/") != std::string::npos) {
        return path.find("search=") != std::string::npos ? RouteCategory::SEARCH : RouteCategory::CATALOG;
    }
    if (path.find("/meta/") != std::string::npos) {
        return RouteCategory::META;
    }
    return RouteCategory::OTHER;
}

const std::vector<std::string>& FingerprintGenerator::relevantFields(RouteCategory category) {
    static const std::vector<std::string> catalog = {
        "language", "providers", "artProviders", "sfw", "includeAdult", "ageRating", "streaming", "mal"
    };
    static const std::vector<std::string> meta = {
        "language", "providers", "artProviders", "tvdbSeasonType", "castCount", "blurThumbs", "mal"
    };
    static const std::vector<std::string> search = {
        "language", "search", "sfw", "includeAdult", "ageRating", "providers", "artProviders", "blurThumbs"
    };
    static const std::vector<std::string> none;

    switch (category) {
        case RouteCategory::CATALOG: return catalog;
        case RouteCategory::META:    return meta;
        case RouteCategory::SEARCH:  return search;
        default:                     return none;
    }
}

nlohmann::json FingerprintGenerator::selectConfigSubset(RouteCategory category,
                                                        const nlohmann::json& user_config) {
    if (category == RouteCategory::MANIFEST) {
        return user_config.is_object() ? user_config : nlohmann::json::object();
    }

    nlohmann::json subset = nlohmann::json::object();
    const bool has_config = user_config.is_object();
    for (const auto& field : relevantFields(category)) {
        subset[field] = has_config && user_config.contains(field) ? user_config.at(field) : nlohmann::json();
    }

    // EN: Only artwork-provider keys affect meta output; other API keys never reach it.
    // FR: Seules les clés des fournisseurs d'artwork influencent les métas.
    if (category == RouteCategory::META) {
        nlohmann::json api_keys = nlohmann::json::object();
        const nlohmann::json* source = nullptr;
        if (has_config && user_config.contains("apiKeys") && user_config.at("apiKeys").is_object()) {
            source = &user_config.at("apiKeys");
        }
        for (const char* name : {"rpdb", "fanart", "mdblist"}) {
            api_keys[name] = source && source->contains(name) ? source->at(name) : nlohmann::json("");
        }
        subset["apiKeys"] = api_keys;
    }
    return subset;
}

std::string FingerprintGenerator::compute(RouteCategory category, const std::string& software_version,
                                          const nlohmann::json& payload, const nlohmann::json& config_subset) {
    // EN: nlohmann objects are key-ordered, so dump() is canonical.
    // FR: Les objets nlohmann sont ordonnés par clé, donc dump() est canonique.
    std::string material;
    material.reserve(256);
    material += software_version;
    material += '\n';
    material += routeCategoryToString(category);
    material += '\n';
    material += payload.dump();
    material += '\n';
    material += config_subset.dump();

    return "W/\"" + sha256Hex(material) + "\"";
}

std::string FingerprintGenerator::forRequest(RouteCategory category, const std::string& software_version,
                                             const nlohmann::json& payload, const nlohmann::json& user_config) {
    return compute(category, software_version, payload, selectConfigSubset(category, user_config));
}

bool FingerprintGenerator::matches(const std::string& if_none_match, const std::string& validator) {
    if (trim(if_none_match) == "*") {
        return true;
    }

    const std::string expected = opaqueTag(validator);
    std::stringstream ss(if_none_match);
    std::string candidate;
    while (std::getline(ss, candidate, ',')) {
        if (opaqueTag(candidate) == expected) {
            return true;
        }
    }
    return false;
}

std::string FingerprintGenerator::sha256Hex(const std::string& input) {
    DigestContext context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!context) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(context.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(context.get(), digest, &digest_length) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_length; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

} // namespace MDC
