// EN: Implementation of the ConfigManager class. YAML configuration parsing and validation.
// FR: Implémentation de la classe ConfigManager. Parsing de configuration YAML et validation.

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

namespace CIP {

std::string ConfigValue::typeName() const {
    if (!value_) {
        return "empty";
    }
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        } else if constexpr (std::is_same_v<T, int>) {
            return "int";
        } else if constexpr (std::is_same_v<T, double>) {
            return "double";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "string";
        } else {
            return "array";
        }
    }, *value_);
}

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

void ConfigSection::merge(const ConfigSection& other, bool overwrite) {
    for (const auto& [key, value] : other.values_) {
        if (overwrite || !has(key)) {
            set(key, value);
        }
    }
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        if (!std::filesystem::exists(filename)) {
            LOG_ERROR("config", "Configuration file not found: " + filename);
            return false;
        }

        loadYaml(YAML::LoadFile(filename));
        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        loadYaml(YAML::Load(yaml_content));
        LOG_DEBUG("config", "Configuration loaded from string");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

// EN: Replace the sections with the top-level maps of the document. Caller holds mutex_.
// FR: Remplace les sections par les maps de premier niveau du document. L'appelant détient mutex_.
void ConfigManager::loadYaml(const YAML::Node& root) {
    std::unordered_map<std::string, ConfigSection> loaded;

    if (root.IsMap()) {
        for (const auto& section : root) {
            std::string section_name = section.first.as<std::string>();
            ConfigSection config_section;

            if (section.second.IsMap()) {
                for (const auto& item : section.second) {
                    config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
                }
            } else {
                config_section.set("value", parseYamlValue(section.second));
            }

            loaded[section_name] = std::move(config_section);
        }
    } else if (!root.IsNull()) {
        throw std::runtime_error("configuration root must be a map");
    }

    sections_ = std::move(loaded);
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }

    if (node.IsNull()) {
        return ConfigValue(std::string());
    }

    // EN: Quoted scalars stay strings ("," must not turn into anything else)
    // FR: Les scalaires quotés restent des chaînes ("," ne doit pas devenir autre chose)
    if (node.Tag() == "!") {
        return ConfigValue(expandVariables(node.as<std::string>()));
    }

    return parseScalar(node.as<std::string>());
}

ConfigValue ConfigManager::parseScalar(const std::string& text) const {
    if (text == "true" || text == "false") {
        return ConfigValue(text == "true");
    }

    static const std::regex int_pattern(R"(^[+-]?\d+$)");
    static const std::regex double_pattern(R"(^[+-]?(\d+\.\d*|\.\d+|\d+)([eE][+-]?\d+)?$)");

    if (std::regex_match(text, int_pattern)) {
        try {
            return ConfigValue(std::stoi(text));
        } catch (const std::out_of_range&) {
            // EN: Too large for int, keep as double below
            // FR: Trop grand pour int, garde en double ci-dessous
        }
    }

    if (std::regex_match(text, double_pattern)) {
        return ConfigValue(std::stod(text));
    }

    return ConfigValue(expandVariables(text));
}

size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t applied = 0;

    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        size_t eq = entry.find('=');
        if (eq == std::string::npos || entry.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        std::string name = entry.substr(prefix.size(), eq - prefix.size());
        std::string value = entry.substr(eq + 1);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        // EN: Match the longest known section name so keys containing '_' survive
        // FR: Choisit le plus long nom de section connu pour que les clés avec '_' survivent
        std::string best_section;
        for (const auto& [section_name, _] : sections_) {
            if (name.size() > section_name.size() + 1 &&
                name.compare(0, section_name.size(), section_name) == 0 &&
                name[section_name.size()] == '_' &&
                section_name.size() > best_section.size()) {
                best_section = section_name;
            }
        }
        if (best_section.empty()) {
            continue;
        }

        std::string key = name.substr(best_section.size() + 1);
        sections_[best_section].set(key, parseScalar(value));
        LOG_INFO("config", "Environment override applied: " + best_section + "." + key);
        ++applied;
    }

    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        size_t dot_pos = rule.key.find('.');
        std::string section_name = (dot_pos != std::string::npos) ?
            rule.key.substr(0, dot_pos) : "default";
        std::string key_name = (dot_pos != std::string::npos) ?
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
        if (!validateValue(value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

bool ConfigManager::validateValue(const ConfigValue& value, const ValidationRule& rule,
                                  std::string& error) const {
    std::string actual = value.typeName();
    bool type_ok = rule.type.empty() || actual == rule.type ||
                   (rule.type == "double" && actual == "int");
    if (!type_ok) {
        error = rule.key + ": expected " + rule.type + ", got " + actual;
        return false;
    }

    std::optional<double> numeric;
    if (auto i = value.tryAs<int>()) {
        numeric = static_cast<double>(*i);
    } else if (auto d = value.tryAs<double>()) {
        numeric = *d;
    }

    if (numeric && rule.min_value && *numeric < *rule.min_value) {
        error = rule.key + ": value " + value.toString() + " is below minimum " +
                ConfigValue(*rule.min_value).toString();
        return false;
    }
    if (numeric && rule.max_value && *numeric > *rule.max_value) {
        error = rule.key + ": value " + value.toString() + " is above maximum " +
                ConfigValue(*rule.max_value).toString();
        return false;
    }

    if (!rule.allowed_values.empty()) {
        std::string text = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), text) ==
            rule.allowed_values.end()) {
            error = rule.key + ": value '" + text + "' is not allowed";
            return false;
        }
    }

    return true;
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

    auto section_it = sections_.find(section);
    return section_it != sections_.end() ? section_it->second : ConfigSection();
}

void ConfigManager::setSection(const std::string& section, const ConfigSection& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section] = config;
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    names.reserve(sections_.size());
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
    for (const auto& name : names) {
        const auto& section = sections_.at(name);
        oss << "[" << name << "]\n";
        for (const auto& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
    }
    return oss.str();
}

std::string ConfigManager::expandVariables(const std::string& value) const {
    static const std::regex var_pattern(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");

    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_pattern);
    auto end = std::sregex_iterator();
    size_t last = 0;

    for (auto it = begin; it != end; ++it) {
        const auto& match = *it;
        result.append(value, last, static_cast<size_t>(match.position()) - last);
        const char* env_value = std::getenv(match[1].str().c_str());
        if (env_value) {
            result += env_value;
        }
        last = static_cast<size_t>(match.position() + match.length());
    }
    result.append(value, last, std::string::npos);
    return result;
}

} // namespace CIP
