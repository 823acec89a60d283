// EN: Implementation of the ConfigManager class. YAML parsing, environment overrides and validation.
// FR: Implémentation de la classe ConfigManager. Parsing YAML, surcharges d'environnement et validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <sstream>

extern char** environ;

namespace MDC {

namespace {

struct EnvironmentAlias {
    const char* name;
    const char* section;
    const char* key;
    bool inverted;
};

// EN: Cache-specific variable names kept for compatibility with existing deployments.
// FR: Noms de variables spécifiques au cache conservés pour les déploiements existants.
const EnvironmentAlias kEnvironmentAliases[] = {
    {"META_TTL", "meta", "ttl_seconds", false},
    {"CATALOG_TTL", "catalog", "ttl_seconds", false},
    {"NO_CACHE", "cache", "enabled", true},
    {"ENABLE_CACHE_WARMING", "warming", "enabled", false},
    {"CACHE_WARMING_INTERVAL", "warming", "interval_minutes", false},
    {"CACHE_MAX_RETRIES", "cache", "max_retries", false},
    {"SOFTWARE_VERSION", "cache", "software_version", false},
};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool isTruthy(const std::string& raw) {
    const std::string lowered = toLower(raw);
    return lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on";
}

} // namespace

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    try {
        if (!std::filesystem::exists(filename)) {
            LOG_ERROR("config", "Configuration file not found: " + filename);
            return false;
        }

        YAML::Node yaml = YAML::LoadFile(filename);
        if (!loadYaml(yaml)) {
            return false;
        }

        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (!loadYaml(yaml)) {
            return false;
        }

        LOG_INFO("config", "Configuration loaded from string");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

// EN: Top-level maps become sections. A top-level scalar becomes section.value.
// FR: Les maps de premier niveau deviennent des sections. Un scalaire devient section.value.
bool ConfigManager::loadYaml(const YAML::Node& yaml) {
    if (!yaml.IsMap() && !yaml.IsNull()) {
        LOG_ERROR("config", "Configuration root must be a map");
        return false;
    }

    std::unordered_map<std::string, ConfigSection> loaded;
    for (const auto& section : yaml) {
        const std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
        } else {
            config_section.set("value", parseYamlValue(section.second));
        }

        loaded[section_name] = config_section;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sections_ = std::move(loaded);
    return true;
}

ConfigValue ConfigManager::parseScalar(const std::string& raw) {
    if (raw == "true" || raw == "false") {
        return ConfigValue(raw == "true");
    }

    if (!raw.empty() && raw.find('.') == std::string::npos) {
        try {
            size_t consumed = 0;
            int int_val = std::stoi(raw, &consumed);
            if (consumed == raw.size()) {
                return ConfigValue(int_val);
            }
        } catch (const std::exception&) {
            // EN: Not an int, continue.
            // FR: Pas un entier, on continue.
        }
    }

    if (!raw.empty()) {
        try {
            size_t consumed = 0;
            double double_val = std::stod(raw, &consumed);
            if (consumed == raw.size()) {
                return ConfigValue(double_val);
            }
        } catch (const std::exception&) {
            // EN: Not a double, treat as string.
            // FR: Pas un double, traité comme chaîne.
        }
    }

    return ConfigValue(expandVariables(raw));
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsScalar()) {
        return parseScalar(node.as<std::string>());
    }
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }
    if (node.IsNull()) {
        return ConfigValue();
    }

    YAML::Emitter emitter;
    emitter << node;
    return ConfigValue(std::string(emitter.c_str()));
}

size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    size_t applied = 0;

    for (const auto& alias : kEnvironmentAliases) {
        const std::string raw = getEnvironmentVariable(prefix + alias.name);
        if (raw.empty()) {
            continue;
        }
        ConfigValue value = alias.inverted ? ConfigValue(!isTruthy(raw)) : parseScalar(raw);
        set(alias.section, alias.key, value);
        LOG_INFO("config", "Environment override applied: " + std::string(alias.section) + "." +
                 alias.key + " from " + prefix + alias.name);
        ++applied;
    }

    // EN: Generic overrides: PREFIX<SECTION>__<KEY>=value.
    // FR: Surcharges génériques : PREFIX<SECTION>__<KEY>=valeur.
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        const std::string entry(*env);
        const size_t eq = entry.find('=');
        if (eq == std::string::npos || entry.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        const std::string name = entry.substr(prefix.size(), eq - prefix.size());
        const size_t separator = name.find("__");
        if (separator == std::string::npos || separator == 0 || separator + 2 >= name.size()) {
            continue;
        }
        const std::string section = toLower(name.substr(0, separator));
        const std::string key = toLower(name.substr(separator + 2));
        set(section, key, parseScalar(entry.substr(eq + 1)));
        LOG_INFO("config", "Environment override applied: " + section + "." + key);
        ++applied;
    }

    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
    LOG_DEBUG("config", "Added " + std::to_string(rules.size()) + " validation rules");
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        const size_t dot_pos = rule.key.find('.');
        const std::string section_name = (dot_pos != std::string::npos) ?
            rule.key.substr(0, dot_pos) : "default";
        const std::string key_name = (dot_pos != std::string::npos) ?
            rule.key.substr(dot_pos + 1) : rule.key;

        ConfigValue value;
        auto section_it = sections_.find(section_name);
        if (section_it != sections_.end()) {
            value = section_it->second.get(key_name);
        }

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        section_it->second.remove(key);
    }
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sections_.find(section);
    return it != sections_.end() ? it->second : ConfigSection();
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    std::ostringstream oss;
    for (const auto& section_name : names) {
        const auto& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    // EN: Integers are accepted where a double is expected.
    // FR: Les entiers sont acceptés là où un double est attendu.
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.tryAs<double>() && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    if ((rule.type == "int" || rule.type == "double") &&
        (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }

        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + ConfigValue(*rule.min_value).toString();
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + ConfigValue(*rule.max_value).toString();
            return false;
        }
    }

    if (!rule.allowed_values.empty()) {
        const std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) {
    std::string result = value;
    static const std::regex var_regex(R"(\$\{([^}]+)\})");
    std::smatch match;

    while (std::regex_search(result, match, var_regex)) {
        const std::string var_value = getEnvironmentVariable(match[1].str());
        if (var_value.empty()) {
            // EN: Leave unknown variables as-is.
            // FR: Laisse les variables inconnues telles quelles.
            break;
        }
        result.replace(match.position(), match.length(), var_value);
    }

    return result;
}

std::string ConfigManager::getEnvironmentVariable(const std::string& name) {
    const char* env_value = std::getenv(name.c_str());
    return env_value ? std::string(env_value) : "";
}

} // namespace MDC
