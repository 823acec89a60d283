#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace MDC {

// EN: Source of per-user configuration, implemented by the embedding application.
// FR: Source de la configuration par utilisateur, implémentée par l'application hôte.
class ConfigProvider {
public:
    virtual ~ConfigProvider() = default;

    // EN: Returns nullopt when the user is unknown. May throw on backend failure.
    // FR: Retourne nullopt si l'utilisateur est inconnu. Peut lever en cas d'échec du backend.
    virtual std::optional<nlohmann::json> loadUserConfig(const std::string& user_uuid) = 0;
};

// EN: In-memory provider for embedding and tests.
// FR: Fournisseur en mémoire pour l'intégration et les tests.
class StaticConfigProvider : public ConfigProvider {
public:
    void setUserConfig(const std::string& user_uuid, const nlohmann::json& config);
    bool removeUserConfig(const std::string& user_uuid);

    std::optional<nlohmann::json> loadUserConfig(const std::string& user_uuid) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, nlohmann::json> configs_;
};

} // namespace MDC
