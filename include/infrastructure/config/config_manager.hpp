#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace MDC {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(value) {}

    // EN: String literals must not decay to bool.
    // FR: Les littéraux chaîne ne doivent pas devenir des bool.
    ConfigValue(const char* value) : value_(std::string(value)) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        if (const T* held = std::get_if<T>(&*value_)) {
            return *held;
        }
        throw std::runtime_error("ConfigValue type mismatch");
    }

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) {
            return std::nullopt;
        }
        if (const T* held = std::get_if<T>(&*value_)) {
            return *held;
        }
        return std::nullopt;
    }

    // EN: Get value as specific type or return default if type mismatch.
    // FR: Obtient la valeur comme type spécifique ou retourne défaut si type incorrect.
    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }

    bool isValid() const { return value_.has_value(); }

    // EN: Convert value to string representation.
    // FR: Convertit la valeur en représentation chaîne.
    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys() const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Configuration manager with YAML parsing, environment overrides and validation.
// FR: Gestionnaire de configuration avec parsing YAML, surcharges d'environnement et validation.
class ConfigManager {
public:
    // EN: Validation rule for one "section.key" entry.
    // FR: Règle de validation pour une entrée "section.key".
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    // EN: Get the singleton instance.
    // FR: Obtient l'instance singleton.
    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file. Replaces every loaded section.
    // FR: Charge la configuration depuis un fichier YAML. Remplace toutes les sections chargées.
    bool loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML string.
    // FR: Charge la configuration depuis une chaîne YAML.
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply environment variable overrides. Recognizes the cache aliases
    //     (META_TTL, CATALOG_TTL, NO_CACHE, ENABLE_CACHE_WARMING, CACHE_WARMING_INTERVAL,
    //     CACHE_MAX_RETRIES, SOFTWARE_VERSION) and the generic form PREFIX<SECTION>__<KEY>.
    //     Returns the number of overrides applied.
    // FR: Applique les surcharges des variables d'environnement. Reconnaît les alias du cache
    //     et la forme générique PREFIX<SECTION>__<KEY>. Retourne le nombre de surcharges appliquées.
    size_t loadEnvironmentOverrides(const std::string& prefix = "MDC_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Validate current configuration against rules.
    // FR: Valide la configuration actuelle contre les règles.
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data and rules.
    // FR: Remet à zéro toutes les données et règles de configuration.
    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

    // EN: Parse a raw scalar the way YAML scalars are parsed (bool, int, double, then string).
    // FR: Analyse un scalaire brut comme les scalaires YAML (bool, int, double, puis chaîne).
    static ConfigValue parseScalar(const std::string& raw);

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadYaml(const YAML::Node& yaml);

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Expand ${VAR} references in configuration strings.
    // FR: Étend les références ${VAR} dans les chaînes de configuration.
    static std::string expandVariables(const std::string& value);

    static std::string getEnvironmentVariable(const std::string& name);

    ConfigValue parseYamlValue(const YAML::Node& node) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

#define CONFIG_GET_SECTION(section, key) MDC::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET_SECTION(section, key, value) MDC::ConfigManager::getInstance().set(section, key, MDC::ConfigValue(value))

} // namespace MDC
