// EN: YAML-backed configuration store with typed values, environment overrides and validation.
// FR: Stockage de configuration basé sur YAML avec valeurs typées, surcharges d'environnement et validation.

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

namespace CIP {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(ValueType(value)) {}

    ConfigValue(const char* value) : value_(ValueType(std::string(value))) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        if (const T* v = std::get_if<T>(&*value_)) {
            return *v;
        }
        throw std::runtime_error("ConfigValue type mismatch");
    }

    // EN: Try to get value as specific type (returns nullopt if empty or type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (nullopt si vide ou type incorrect).
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) {
            return std::nullopt;
        }
        if (const T* v = std::get_if<T>(&*value_)) {
            return *v;
        }
        return std::nullopt;
    }

    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }

    bool isValid() const { return value_.has_value(); }

    // EN: Name of the held type ("bool", "int", "double", "string", "array" or "empty").
    // FR: Nom du type contenu ("bool", "int", "double", "string", "array" ou "empty").
    std::string typeName() const;

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

    // EN: Merge another section into this one.
    // FR: Fusionne une autre section dans celle-ci.
    void merge(const ConfigSection& other, bool overwrite = true);

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Main configuration manager with YAML parsing and validation.
// FR: Gestionnaire de configuration principal avec parsing YAML et validation.
class ConfigManager {
public:
    // EN: Validation rule for a "section.key" configuration value.
    // FR: Règle de validation pour une valeur de configuration "section.key".
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file; previous sections are replaced.
    // FR: Charge la configuration depuis un fichier YAML ; les sections précédentes sont remplacées.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply PREFIX<SECTION>_<KEY> environment variables over known sections.
    // FR: Applique les variables d'environnement PREFIX<SECTION>_<KEY> sur les sections connues.
    size_t loadEnvironmentOverrides(const std::string& prefix = "CIP_");

    void addValidationRules(const std::vector<ValidationRule>& rules);
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    void setSection(const std::string& section, const ConfigSection& config);
    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data and validation rules.
    // FR: Remet à zéro toutes les données de configuration et règles de validation.
    void reset();

    std::string dump() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void loadYaml(const YAML::Node& root);
    ConfigValue parseYamlValue(const YAML::Node& node) const;
    ConfigValue parseScalar(const std::string& text) const;

    bool validateValue(const ConfigValue& value, const ValidationRule& rule, std::string& error) const;

    // EN: Expand ${NAME} environment references in configuration strings.
    // FR: Étend les références ${NAME} d'environnement dans les chaînes de configuration.
    std::string expandVariables(const std::string& value) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

#define CONFIG_GET(section, key) CIP::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET(section, key, value) CIP::ConfigManager::getInstance().set(section, key, CIP::ConfigValue(value))

} // namespace CIP
