// EN: Failure classification for the metadata cache
// FR: Classification des échecs pour le cache de métadonnées

#include "cache/cache_errors.hpp"

namespace MDC {

std::string failureKindToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::TRANSIENT: return "transient";
        case FailureKind::NOT_FOUND: return "not_found";
        case FailureKind::INTERNAL:  return "internal";
    }
    return "internal";
}

FailureKind failureKindFromString(const std::string& value) {
    if (value == "transient") return FailureKind::TRANSIENT;
    if (value == "not_found") return FailureKind::NOT_FOUND;
    return FailureKind::INTERNAL;
}

FailureKind classifyFailure(const std::exception_ptr& error) noexcept {
    if (!error) {
        return FailureKind::INTERNAL;
    }
    try {
        std::rethrow_exception(error);
    } catch (const UpstreamError&) {
        return FailureKind::TRANSIENT;
    } catch (const NotFoundError&) {
        return FailureKind::NOT_FOUND;
    } catch (...) {
        return FailureKind::INTERNAL;
    }
}

FailureKind classifyHttpStatus(int status_code) noexcept {
    // EN: 404 and 410 mean the resource is gone; retrying will not help
    // FR: 404 et 410 signifient que la ressource n'existe pas ; réessayer n'aide pas
    if (status_code == 404 || status_code == 410) {
        return FailureKind::NOT_FOUND;
    }
    return FailureKind::TRANSIENT;
}

bool isRejectedStatus(int status_code) noexcept {
    return status_code >= 400 && status_code < 500 && status_code != 404 && status_code != 408 &&
           status_code != 410 && status_code != 429;
}

int failureStatusCode(const std::exception_ptr& error) noexcept {
    if (!error) {
        return 0;
    }
    try {
        std::rethrow_exception(error);
    } catch (const UpstreamError& e) {
        return e.statusCode();
    } catch (...) {
        return 0;
    }
}

void throwForHttpStatus(int status_code, const std::string& message) {
    if (classifyHttpStatus(status_code) == FailureKind::NOT_FOUND) {
        throw NotFoundError(message + " (HTTP " + std::to_string(status_code) + ")");
    }
    throw UpstreamError(message + " (HTTP " + std::to_string(status_code) + ")", status_code);
}

std::exception_ptr makeCachedFailure(FailureKind kind, const std::string& message, int status_code) {
    if (kind == FailureKind::NOT_FOUND) {
        return std::make_exception_ptr(NotFoundError(message, true));
    }
    return std::make_exception_ptr(UpstreamError(message, status_code, true));
}

std::string describeFailure(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace MDC
