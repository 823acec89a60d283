// EN: Cache key construction, parsing and invalidation patterns.
// FR: Construction, analyse des clés de cache et motifs d'invalidation.

#include "cache/cache_key.hpp"
#include "cache/fingerprint.hpp"

#include <cstdio>
#include <stdexcept>

namespace MDC {

namespace {

constexpr char kSeparator = ':';

bool needsEscape(char c) {
    return c == '%' || c == ':' || c == '*' || c == '?' || c == '[' || c == ']' || c == '\\';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::vector<std::string> splitRaw(const std::string& key) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        const size_t pos = key.find(kSeparator, start);
        if (pos == std::string::npos) {
            segments.push_back(key.substr(start));
            break;
        }
        segments.push_back(key.substr(start, pos - start));
        start = pos + 1;
    }
    return segments;
}

} // namespace

std::string CacheKey::escapeSegment(const std::string& segment) {
    std::string escaped;
    escaped.reserve(segment.size());
    for (char c : segment) {
        if (needsEscape(c)) {
            char buffer[4];
            std::snprintf(buffer, sizeof(buffer), "%%%02X", static_cast<unsigned char>(c));
            escaped += buffer;
        } else {
            escaped += c;
        }
    }
    return escaped;
}

std::string CacheKey::unescapeSegment(const std::string& segment) {
    std::string result;
    result.reserve(segment.size());
    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '%' && i + 2 < segment.size()) {
            const int high = hexValue(segment[i + 1]);
            const int low = hexValue(segment[i + 2]);
            if (high >= 0 && low >= 0) {
                result += static_cast<char>(high * 16 + low);
                i += 2;
                continue;
            }
        }
        result += segment[i];
    }
    return result;
}

std::string CacheKey::build(const std::string& scope, const std::string& version,
                            CacheCategory category, const std::vector<std::string>& qualifiers) {
    if (scope.empty()) {
        throw std::invalid_argument("Cache key scope must not be empty");
    }
    if (qualifiers.empty()) {
        throw std::invalid_argument("Cache key needs at least one qualifier");
    }

    std::string key = escapeSegment(scope);
    key += kSeparator;
    key += escapeSegment(version);
    key += kSeparator;
    key += categoryToString(category);
    for (const auto& qualifier : qualifiers) {
        key += kSeparator;
        key += escapeSegment(qualifier);
    }
    return key;
}

std::string CacheKey::global(const std::string& version, CacheCategory category,
                             const std::vector<std::string>& qualifiers) {
    return build(kGlobalScope, version, category, qualifiers);
}

std::string CacheKey::forContext(const std::string& version, CacheCategory category,
                                 const nlohmann::json& config_subset,
                                 const std::vector<std::string>& qualifiers) {
    std::vector<std::string> segments;
    segments.reserve(qualifiers.size() + 1);
    segments.push_back(paramFingerprint(config_subset));
    segments.insert(segments.end(), qualifiers.begin(), qualifiers.end());
    return build(kGlobalScope, version, category, segments);
}

std::optional<CacheKey::Parts> CacheKey::parse(const std::string& key) {
    const auto segments = splitRaw(key);
    if (segments.size() < 4 || segments[0].empty()) {
        return std::nullopt;
    }

    auto category = categoryFromString(segments[2]);
    if (!category) {
        return std::nullopt;
    }

    Parts parts;
    parts.scope = unescapeSegment(segments[0]);
    parts.version = unescapeSegment(segments[1]);
    parts.category = *category;
    for (size_t i = 3; i < segments.size(); ++i) {
        parts.qualifiers.push_back(unescapeSegment(segments[i]));
    }
    return parts;
}

std::string CacheKey::scopePattern(const std::string& scope) {
    return escapeSegment(scope) + kSeparator + "*";
}

std::string CacheKey::categoryPattern(const std::string& version, CacheCategory category) {
    return std::string("*") + kSeparator + escapeSegment(version) + kSeparator +
           escapeSegment(categoryToString(category)) + kSeparator + "*";
}

std::string CacheKey::containsPattern(const std::string& token) {
    return "*" + escapeSegment(token) + "*";
}

std::string CacheKey::paramFingerprint(const nlohmann::json& params) {
    return FingerprintGenerator::sha256Hex(params.dump()).substr(0, 16);
}

std::string CacheKey::truncateForLog(const std::string& key, size_t max_length) {
    if (key.size() <= max_length || max_length < 8) {
        return key;
    }
    const size_t keep = (max_length - 3) / 2;
    return key.substr(0, keep) + "..." + key.substr(key.size() - keep);
}

} // namespace MDC
