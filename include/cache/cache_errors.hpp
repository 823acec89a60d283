// EN: Failure taxonomy of the metadata cache - upstream, not-found, internal and store errors
// FR: Taxonomie des échecs du cache de métadonnées - erreurs amont, introuvable, interne et stockage

#pragma once

#include "infrastructure/threading/thread_pool.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace MDC {

// EN: How a failure is treated by the cache
// FR: Comment un échec est traité par le cache
enum class FailureKind {
    TRANSIENT,   // EN: Timeout, network, 5xx, rate limit - cached briefly with bounded retries / FR: Timeout, réseau, 5xx, limite - mis en cache brièvement avec retries bornés
    NOT_FOUND,   // EN: Resource does not exist - cached as a negative result / FR: Ressource inexistante - mise en cache comme résultat négatif
    INTERNAL     // EN: Defect in the compute function - never cached / FR: Défaut de la fonction de calcul - jamais mis en cache
};

std::string failureKindToString(FailureKind kind);
FailureKind failureKindFromString(const std::string& value);

// EN: Base class of every error raised by the cache
// FR: Classe de base de toutes les erreurs levées par le cache
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message, bool served_from_cache = false)
        : std::runtime_error(message), served_from_cache_(served_from_cache) {}

    // EN: True when the error was replayed from an error marker without calling compute
    // FR: Vrai quand l'erreur a été rejouée depuis un marqueur sans appeler le calcul
    bool servedFromCache() const noexcept { return served_from_cache_; }

private:
    bool served_from_cache_;
};

// EN: Transient upstream failure (network, server error, rate limit)
// FR: Échec amont transitoire (réseau, erreur serveur, limite de débit)
class UpstreamError : public CacheError {
public:
    explicit UpstreamError(const std::string& message, int status_code = 0, bool served_from_cache = false)
        : CacheError(message, served_from_cache), status_code_(status_code) {}

    int statusCode() const noexcept { return status_code_; }

private:
    int status_code_;
};

// EN: Upstream call exceeded its deadline
// FR: L'appel amont a dépassé son délai
class UpstreamTimeoutError : public UpstreamError {
public:
    explicit UpstreamTimeoutError(const std::string& operation, std::chrono::milliseconds timeout)
        : UpstreamError("Upstream call '" + operation + "' timed out after " +
                        std::to_string(timeout.count()) + "ms", 408) {}
};

// EN: Permanent negative result
// FR: Résultat négatif permanent
class NotFoundError : public CacheError {
public:
    explicit NotFoundError(const std::string& message, bool served_from_cache = false)
        : CacheError(message, served_from_cache) {}
};

// EN: Compute produced an unusable result (e.g. rejected by a validator)
// FR: Le calcul a produit un résultat inutilisable (ex. rejeté par un validateur)
class InternalComputeError : public CacheError {
public:
    explicit InternalComputeError(const std::string& message) : CacheError(message) {}
};

// EN: Backing store failure (read, write, enumeration)
// FR: Échec du stockage (lecture, écriture, énumération)
class StoreError : public CacheError {
public:
    explicit StoreError(const std::string& message) : CacheError(message) {}
};

// EN: Classify a caught exception. Anything outside the upstream taxonomy is INTERNAL.
// FR: Classe une exception capturée. Tout ce qui est hors de la taxonomie amont est INTERNAL.
FailureKind classifyFailure(const std::exception_ptr& error) noexcept;

// EN: Map an HTTP status to a failure kind (404/410 not found, everything else transient)
// FR: Associe un statut HTTP à un type d'échec (404/410 introuvable, le reste transitoire)
FailureKind classifyHttpStatus(int status_code) noexcept;

// EN: 4xx statuses other than 404, 408, 410 and 429: the upstream refuses the request as sent
// FR: Statuts 4xx hors 404, 408, 410 et 429 : l'amont refuse la requête telle quelle
bool isRejectedStatus(int status_code) noexcept;

// EN: HTTP status carried by an UpstreamError, 0 for anything else
// FR: Statut HTTP porté par une UpstreamError, 0 pour le reste
int failureStatusCode(const std::exception_ptr& error) noexcept;

// EN: Throw the exception matching an HTTP error status. Helper for compute functions.
// FR: Lève l'exception correspondant à un statut HTTP d'erreur. Aide pour les fonctions de calcul.
[[noreturn]] void throwForHttpStatus(int status_code, const std::string& message);

// EN: Rebuild the exception stored in an error marker, flagged as served from cache
// FR: Reconstruit l'exception stockée dans un marqueur d'erreur, marquée comme servie du cache
std::exception_ptr makeCachedFailure(FailureKind kind, const std::string& message, int status_code = 0);

// EN: Extract a printable message from an exception pointer
// FR: Extrait un message affichable d'un pointeur d'exception
std::string describeFailure(const std::exception_ptr& error);

// EN: Run an operation with a deadline. The operation keeps running on its own thread
//     after a timeout; its result is then discarded. The operation may outlive the caller,
//     so it must own what it captures (no references to the caller's stack).
// FR: Exécute une opération avec une échéance. L'opération continue sur son propre thread
//     après un timeout ; son résultat est alors ignoré. L'opération peut survivre à l'appelant,
//     elle doit donc posséder ce qu'elle capture (pas de références vers la pile de l'appelant).
template<typename Func>
auto runWithDeadline(Func&& operation, std::chrono::milliseconds timeout, const std::string& name)
    -> typename std::invoke_result<Func>::type {
    using result_type = typename std::invoke_result<Func>::type;

    auto promise = std::make_shared<std::promise<result_type>>();
    std::future<result_type> future = promise->get_future();

    std::thread([promise, op = std::forward<Func>(operation)]() mutable {
        try {
            if constexpr (std::is_void_v<result_type>) {
                op();
                promise->set_value();
            } else {
                promise->set_value(op());
            }
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        throw UpstreamTimeoutError(name, timeout);
    }
    return future.get();
}

// EN: Same contract, running the operation on a caller-owned pool. A timed-out operation
//     keeps its worker busy until it returns; size the pool for the expected stragglers.
// FR: Même contrat, l'opération tourne sur un pool fourni par l'appelant. Une opération
//     expirée occupe son worker jusqu'à son retour ; dimensionner le pool en conséquence.
template<typename Func>
auto runWithDeadline(ThreadPool& pool, Func&& operation, std::chrono::milliseconds timeout,
                     const std::string& name) -> typename std::invoke_result<Func>::type {
    auto future = pool.submitNamed("deadline:" + name, TaskPriority::HIGH, std::forward<Func>(operation));

    if (future.wait_for(timeout) != std::future_status::ready) {
        throw UpstreamTimeoutError(name, timeout);
    }
    return future.get();
}

} // namespace MDC
