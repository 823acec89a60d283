// EN: Cache entry envelope, categories and state evaluation.
// FR: Enveloppe des entrées de cache, catégories et évaluation d'état.

#include "cache/cache_types.hpp"

#include <stdexcept>

namespace MDC {

namespace {

constexpr int kEnvelopeFormat = 1;

int64_t toEpochMillis(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::time_point fromEpochMillis(int64_t millis) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

} // namespace

TimeSource systemTimeSource() {
    return [] { return Clock::now(); };
}

const std::vector<CacheCategory>& allCategories() {
    static const std::vector<CacheCategory> categories = {
        CacheCategory::CATALOG, CacheCategory::META, CacheCategory::SEARCH,
        CacheCategory::PROVIDER, CacheCategory::GLOBAL
    };
    return categories;
}

std::string categoryToString(CacheCategory category) {
    switch (category) {
        case CacheCategory::CATALOG:  return "catalog";
        case CacheCategory::META:     return "meta";
        case CacheCategory::SEARCH:   return "search";
        case CacheCategory::PROVIDER: return "provider";
        case CacheCategory::GLOBAL:   return "global";
    }
    return "global";
}

std::optional<CacheCategory> categoryFromString(const std::string& value) {
    for (CacheCategory category : allCategories()) {
        if (categoryToString(category) == value) {
            return category;
        }
    }
    return std::nullopt;
}

std::string entryStateToString(EntryState state) {
    switch (state) {
        case EntryState::EMPTY:        return "empty";
        case EntryState::FRESH:        return "fresh";
        case EntryState::STALE:        return "stale";
        case EntryState::ERROR_CACHED: return "error_cached";
        case EntryState::EXPIRED:      return "expired";
    }
    return "empty";
}

EntryState CacheEntry::stateAt(Clock::time_point now) const {
    const auto age = now - created_at;

    if (is_error_marker) {
        return age < ttl ? EntryState::ERROR_CACHED : EntryState::EXPIRED;
    }
    if (age < ttl) {
        return EntryState::FRESH;
    }
    if (stale_window.count() > 0 && age < ttl + stale_window) {
        return EntryState::STALE;
    }
    return EntryState::EXPIRED;
}

std::string serializeEntry(const CacheEntry& entry) {
    nlohmann::json envelope = {
        {"format", kEnvelopeFormat},
        {"created_at", toEpochMillis(entry.created_at)},
        {"ttl", entry.ttl.count()},
        {"stale", entry.stale_window.count()},
        {"category", categoryToString(entry.category)}
    };

    if (entry.is_error_marker) {
        envelope["error"] = {
            {"kind", failureKindToString(entry.error_kind)},
            {"message", entry.error_message},
            {"status", entry.error_status},
            {"retries", entry.retry_count}
        };
    } else {
        envelope["value"] = entry.value;
    }
    return envelope.dump();
}

CacheEntry parseEntry(const std::string& key, const std::string& raw) {
    nlohmann::json envelope;
    try {
        envelope = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Unparseable cache entry: " + std::string(e.what()));
    }

    CacheEntry entry;
    entry.key = key;
    try {
        if (!envelope.is_object() || envelope.value("format", 0) != kEnvelopeFormat ||
            !envelope.contains("created_at") || !envelope.contains("ttl")) {
            throw std::invalid_argument("Cache entry envelope is malformed");
        }

        entry.created_at = fromEpochMillis(envelope.at("created_at").get<int64_t>());
        entry.ttl = std::chrono::seconds(envelope.at("ttl").get<int64_t>());
        entry.stale_window = std::chrono::seconds(envelope.value("stale", int64_t{0}));
        entry.category = categoryFromString(envelope.value("category", std::string("global")))
                             .value_or(CacheCategory::GLOBAL);

        if (envelope.contains("error")) {
            const auto& error = envelope.at("error");
            entry.is_error_marker = true;
            entry.error_kind = failureKindFromString(error.at("kind").get<std::string>());
            entry.error_message = error.value("message", std::string());
            entry.error_status = error.value("status", 0);
            entry.retry_count = error.value("retries", 0);
        } else if (envelope.contains("value")) {
            entry.value = envelope.at("value");
        } else {
            throw std::invalid_argument("Cache entry has neither value nor error");
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument("Cache entry field has wrong type: " + std::string(e.what()));
    }

    return entry;
}

std::chrono::seconds WrapOptions::markerTtl(FailureKind kind, int status_code) const {
    std::chrono::seconds chosen = error_ttl;
    if (kind == FailureKind::INTERNAL) {
        return std::chrono::seconds(0);
    }
    if (kind == FailureKind::NOT_FOUND) {
        chosen = not_found_ttl;
    } else if (status_code == 429) {
        chosen = rate_limited_ttl;
    } else if (isRejectedStatus(status_code)) {
        chosen = rejected_ttl;
    }

    // EN: A failure never outlives the success it replaces.
    // FR: Un échec ne survit jamais au succès qu'il remplace.
    if (chosen >= ttl) {
        chosen = ttl - std::chrono::seconds(1);
    }
    return chosen.count() > 0 ? chosen : std::chrono::seconds(0);
}

bool isEmptyPayload(const nlohmann::json& value) {
    if (value.is_null()) return true;
    if (value.is_boolean()) return !value.get<bool>();
    if (value.is_string()) return value.get_ref<const std::string&>().empty();
    if (value.is_array() || value.is_object()) return value.empty();
    return false;
}

} // namespace MDC
