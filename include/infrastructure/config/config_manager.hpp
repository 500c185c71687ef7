#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace YAML { class Node; }

namespace GCS {

// EN: One configuration entry. Empty until a loader or set() fills it.
// FR: Une entrée de configuration. Vide tant qu'un chargeur ou set() ne l'a pas remplie.
class ConfigValue {
public:
    using Storage = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;
    ConfigValue(bool flag) : storage_(flag) {}
    ConfigValue(int number) : storage_(number) {}
    ConfigValue(double number) : storage_(number) {}
    ConfigValue(const char* text) : storage_(std::string(text)) {}
    ConfigValue(const std::string& text) : storage_(text) {}
    ConfigValue(const std::vector<std::string>& items) : storage_(items) {}

    // EN: Strict read, std::runtime_error when empty or stored under another type.
    // FR: Lecture stricte, std::runtime_error si vide ou stocké sous un autre type.
    template<typename T>
    T as() const {
        if (!storage_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        auto typed = tryAs<T>();
        if (!typed) {
            throw std::runtime_error("ConfigValue type mismatch");
        }
        return *typed;
    }

    template<typename T>
    std::optional<T> tryAs() const {
        if (storage_ && std::holds_alternative<T>(*storage_)) {
            return std::get<T>(*storage_);
        }
        return std::nullopt;
    }

    template<typename T>
    T asOrDefault(const T& fallback) const {
        return tryAs<T>().value_or(fallback);
    }

    // EN: int and double both read as numbers.
    // FR: int et double se lisent tous deux comme des nombres.
    std::optional<double> asNumber() const;

    bool isValid() const { return storage_.has_value(); }

private:
    std::optional<Storage> storage_;
};

using ConfigSection = std::map<std::string, ConfigValue>;

// EN: Process-wide YAML configuration with typed rules and GCS_* environment overrides.
// FR: Configuration YAML globale au processus avec règles typées et surcharges d'environnement GCS_*.
class ConfigManager {
public:
    // EN: key is "section.key"; a key without a dot lives in the "default" section.
    // FR: key est "section.clé" ; une clé sans point appartient à la section "default".
    struct ValidationRule {
        std::string key;
        std::string type; // bool, int, number, string, array
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
    };

    static ConfigManager& getInstance();

    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);
    bool saveToFile(const std::string& filename) const;

    // EN: Overrides only target sections that exist, see declareSection().
    // FR: Les surcharges ne visent que les sections existantes, voir declareSection().
    size_t loadEnvironmentOverrides(const std::string& prefix = "GCS_");
    void declareSection(const std::string& section);

    void addValidationRules(const std::vector<ValidationRule>& rules);
    void clearValidationRules();
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& key) const;
    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& key, const ConfigValue& value);
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& key) const;
    bool has(const std::string& section, const std::string& key) const;

    void reset();

private:
    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool adopt(const YAML::Node& root, const std::string& origin);
    static ConfigValue fromYaml(const YAML::Node& node);
    static std::optional<std::string> checkRule(const ValidationRule& rule, const ConfigValue& value);
    const ConfigValue* find(const std::string& section, const std::string& key) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> rules_;
};

#define CONFIG_GET(key) GCS::ConfigManager::getInstance().get(key)
#define CONFIG_GET_SECTION(section, key) GCS::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET(key, value) GCS::ConfigManager::getInstance().set(key, GCS::ConfigValue(value))
#define CONFIG_SET_SECTION(section, key, value) GCS::ConfigManager::getInstance().set(section, key, GCS::ConfigValue(value))

} // namespace GCS
