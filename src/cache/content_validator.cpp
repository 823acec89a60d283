// EN: Content checks applied before caching and when scanning stored entries.
// FR: Vérifications de contenu appliquées avant la mise en cache et lors du parcours des entrées.

#include "cache/content_validator.hpp"

#include <sstream>

namespace MDC {

namespace {

const char* const kUndefined = "undefined";

bool isMissing(const nlohmann::json& object, const std::string& field) {
    if (!object.contains(field)) {
        return true;
    }
    const auto& value = object.at(field);
    if (value.is_null()) return true;
    if (value.is_string()) return value.get_ref<const std::string&>().empty();
    if (value.is_boolean()) return !value.get<bool>();
    return false;
}

bool isUndefinedString(const nlohmann::json& object, const std::string& field) {
    return object.contains(field) && object.at(field).is_string() &&
           object.at(field).get_ref<const std::string&>() == kUndefined;
}

bool containsUndefined(const nlohmann::json& object, const std::string& field) {
    return object.contains(field) && object.at(field).is_string() &&
           object.at(field).get_ref<const std::string&>().find(kUndefined) != std::string::npos;
}

bool isMalformedUrl(const nlohmann::json& object, const std::string& field) {
    if (!object.contains(field) || !object.at(field).is_string()) {
        return false;
    }
    const auto& url = object.at(field).get_ref<const std::string&>();
    return url.find(kUndefined) != std::string::npos || url == "null";
}

std::string errorMessageOf(const nlohmann::json& data) {
    if (data.contains("message") && data.at("message").is_string()) {
        return data.at("message").get<std::string>();
    }
    return "Unknown error";
}

bool isErrorBody(const nlohmann::json& data) {
    return data.is_object() && data.contains("error") && !data.at("error").is_null() &&
           !(data.at("error").is_boolean() && !data.at("error").get<bool>());
}

// EN: Shared checks of catalog and search listings.
// FR: Vérifications communes aux listes de catalogue et de recherche.
std::vector<std::string> validateListing(const nlohmann::json& data, const std::string& label,
                                         bool strict_items) {
    std::vector<std::string> issues;

    if (!data.is_object() || isMissing(data, "metas")) {
        issues.push_back(label + " response is missing or has no metas");
        return issues;
    }
    const auto& metas = data.at("metas");
    if (!metas.is_array()) {
        issues.push_back(label + " metas is not an array");
        return issues;
    }

    for (size_t i = 0; i < metas.size(); ++i) {
        const auto& item = metas[i];
        const std::string prefix = label + " item " + std::to_string(i + 1);
        if (!item.is_object()) {
            issues.push_back(prefix + " is not an object");
            continue;
        }
        if (containsUndefined(item, "id")) {
            issues.push_back(prefix + " has bad ID: " + item.at("id").get<std::string>());
        }
        if (isMissing(item, "name") || isUndefinedString(item, "name")) {
            issues.push_back(prefix + " has undefined name");
        }
        if (!strict_items) {
            continue;
        }
        if (isMissing(item, "type") || isUndefinedString(item, "type")) {
            issues.push_back(prefix + " has undefined type");
        }
        if (isMalformedUrl(item, "poster")) {
            issues.push_back(prefix + " has malformed poster URL");
        }
        if (isMalformedUrl(item, "background")) {
            issues.push_back(prefix + " has malformed background URL");
        }
    }
    return issues;
}

} // namespace

std::string contentTypeToString(ContentType type) {
    switch (type) {
        case ContentType::META:    return "meta";
        case ContentType::CATALOG: return "catalog";
        case ContentType::SEARCH:  return "search";
        case ContentType::GENRE:   return "genre";
    }
    return "meta";
}

bool ContentValidator::hasBadEpisodeId(const std::string& id) {
    std::istringstream stream(id);
    std::string segment;
    while (std::getline(stream, segment, ':')) {
        if (segment == kUndefined) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> ContentValidator::validateEpisodes(const nlohmann::json& episodes) {
    std::vector<std::string> issues;
    if (!episodes.is_array()) {
        issues.push_back("Episodes is not an array");
        return issues;
    }

    for (size_t i = 0; i < episodes.size(); ++i) {
        const auto& episode = episodes[i];
        const std::string prefix = "Episode " + std::to_string(i + 1);
        if (!episode.is_object()) {
            issues.push_back(prefix + " is not an object");
            continue;
        }
        if (episode.contains("id") && episode.at("id").is_string() &&
            hasBadEpisodeId(episode.at("id").get<std::string>())) {
            issues.push_back(prefix + " has bad ID pattern: " + episode.at("id").get<std::string>());
        }
        if (!episode.contains("title") || isUndefinedString(episode, "title")) {
            issues.push_back(prefix + " has undefined title");
        }
        if (!episode.contains("episode") || isUndefinedString(episode, "episode")) {
            issues.push_back(prefix + " has undefined episode number");
        }
        if (!episode.contains("season") || isUndefinedString(episode, "season")) {
            issues.push_back(prefix + " has undefined season number");
        }
    }
    return issues;
}

std::vector<std::string> ContentValidator::validateMeta(const nlohmann::json& data) {
    std::vector<std::string> issues;

    if (data.is_null()) {
        issues.push_back("Meta data is null");
        return issues;
    }
    if (!data.is_object()) {
        issues.push_back("Meta data is not an object");
        return issues;
    }
    if (isErrorBody(data)) {
        issues.push_back("Meta data contains error: " + errorMessageOf(data));
        return issues;
    }

    const bool is_response = data.contains("meta");
    if (is_response && (!data.at("meta").is_object() || data.at("meta").empty())) {
        issues.push_back("Meta response missing meta object");
        return issues;
    }
    const nlohmann::json& meta = is_response ? data.at("meta") : data;

    for (const char* field : {"id", "name", "type"}) {
        if (isMissing(meta, field)) {
            issues.push_back(std::string("Meta missing required field: ") + field);
        }
    }
    if (containsUndefined(meta, "id")) {
        issues.push_back("Meta ID contains undefined: " + meta.at("id").get<std::string>());
    }
    if (isUndefinedString(meta, "name")) {
        issues.push_back("Meta name is undefined string");
    }
    if (isUndefinedString(meta, "type")) {
        issues.push_back("Meta type is undefined string");
    }

    const bool is_series = meta.contains("type") && meta.at("type").is_string() &&
                           meta.at("type").get_ref<const std::string&>() == "series";
    if (is_series && meta.contains("videos")) {
        if (!meta.at("videos").is_array()) {
            issues.push_back("Series videos is not an array");
        } else {
            const auto episode_issues = validateEpisodes(meta.at("videos"));
            issues.insert(issues.end(), episode_issues.begin(), episode_issues.end());
        }
    }

    if (meta.contains("links") && !meta.at("links").is_array()) {
        issues.push_back("Meta links is not an array");
    }
    if (meta.contains("genres") && !meta.at("genres").is_array()) {
        issues.push_back("Meta genres is not an array");
    }
    if (isMalformedUrl(meta, "poster")) {
        issues.push_back("Meta poster URL contains undefined/null");
    }
    if (isMalformedUrl(meta, "background")) {
        issues.push_back("Meta background URL contains undefined/null");
    }
    return issues;
}

std::vector<std::string> ContentValidator::validateCatalog(const nlohmann::json& data) {
    return validateListing(data, "Catalog", false);
}

std::vector<std::string> ContentValidator::validateSearch(const nlohmann::json& data) {
    return validateListing(data, "Search", true);
}

std::vector<std::string> ContentValidator::validateGenres(const nlohmann::json& data) {
    std::vector<std::string> issues;

    if (data.is_null()) {
        issues.push_back("Genre data is null");
        return issues;
    }
    if (isErrorBody(data)) {
        issues.push_back("Genre data contains error: " + errorMessageOf(data));
        return issues;
    }
    if (!data.is_array()) {
        issues.push_back("Genre data is not an array");
        return issues;
    }

    for (size_t i = 0; i < data.size(); ++i) {
        const auto& genre = data[i];
        const std::string prefix = "Genre " + std::to_string(i);
        if (!genre.is_object()) {
            issues.push_back(prefix + " is not a valid object");
            continue;
        }

        if (isMissing(genre, "id")) {
            issues.push_back(prefix + " missing required field: id");
        } else if (!genre.at("id").is_number() && !genre.at("id").is_string()) {
            issues.push_back(prefix + " ID has invalid type");
        } else if (containsUndefined(genre, "id")) {
            issues.push_back(prefix + " ID contains undefined: " + genre.at("id").get<std::string>());
        }

        if (isMissing(genre, "name")) {
            issues.push_back(prefix + " missing required field: name");
        } else if (!genre.at("name").is_string()) {
            issues.push_back(prefix + " name has invalid type");
        } else if (isUndefinedString(genre, "name")) {
            issues.push_back(prefix + " name is undefined string");
        }
    }
    return issues;
}

std::vector<std::string> ContentValidator::validate(ContentType type, const nlohmann::json& data) {
    switch (type) {
        case ContentType::META:    return validateMeta(data);
        case ContentType::CATALOG: return validateCatalog(data);
        case ContentType::SEARCH:  return validateSearch(data);
        case ContentType::GENRE:   return validateGenres(data);
    }
    return {};
}

PayloadValidator ContentValidator::forType(ContentType type) {
    return [type](const nlohmann::json& data) { return validate(type, data); };
}

std::optional<ContentType> ContentValidator::forCategory(CacheCategory category) {
    switch (category) {
        case CacheCategory::META:    return ContentType::META;
        case CacheCategory::CATALOG: return ContentType::CATALOG;
        case CacheCategory::SEARCH:  return ContentType::SEARCH;
        case CacheCategory::PROVIDER:
        case CacheCategory::GLOBAL:
            break;
    }
    return std::nullopt;
}

} // namespace MDC
