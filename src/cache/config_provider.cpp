// EN: In-memory user configuration provider.
// FR: Fournisseur de configuration utilisateur en mémoire.

#include "cache/config_provider.hpp"

namespace MDC {

void StaticConfigProvider::setUserConfig(const std::string& user_uuid, const nlohmann::json& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    configs_[user_uuid] = config;
}

bool StaticConfigProvider::removeUserConfig(const std::string& user_uuid) {
    std::lock_guard<std::mutex> lock(mutex_);
    return configs_.erase(user_uuid) > 0;
}

std::optional<nlohmann::json> StaticConfigProvider::loadUserConfig(const std::string& user_uuid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(user_uuid);
    if (it == configs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace MDC
