// EN: YAML-backed configuration store. Loading, typed rules, environment overrides.
// FR: Stockage de configuration basé sur YAML. Chargement, règles typées, surcharges d'environnement.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

extern char** environ;

namespace GCS {

namespace {

const char* const kDefaultSection = "default";

std::string lowercase(std::string text) {
    for (auto& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

std::pair<std::string, std::string> splitKey(const std::string& dotted) {
    const size_t dot = dotted.find('.');
    if (dot == std::string::npos) {
        return {kDefaultSection, dotted};
    }
    return {dotted.substr(0, dot), dotted.substr(dot + 1)};
}

// EN: "${HOME}/cp" -> "/root/cp". Unset variables stay as written.
// FR: "${HOME}/cp" -> "/root/cp". Les variables absentes restent telles quelles.
std::string substituteEnvironment(const std::string& text) {
    std::string out;
    size_t cursor = 0;
    while (cursor < text.size()) {
        const size_t open = text.find("${", cursor);
        const size_t close = open == std::string::npos ? std::string::npos : text.find('}', open + 2);
        if (close == std::string::npos) {
            out.append(text, cursor, std::string::npos);
            break;
        }
        out.append(text, cursor, open - cursor);
        const std::string name = text.substr(open + 2, close - open - 2);
        const char* resolved = std::getenv(name.c_str());
        out += resolved ? std::string(resolved) : text.substr(open, close - open + 1);
        cursor = close + 1;
    }
    return out;
}

std::string formatBound(double bound) {
    std::ostringstream oss;
    oss << bound;
    return oss.str();
}

void emitValue(YAML::Emitter& emitter, const ConfigValue& value) {
    if (auto flag = value.tryAs<bool>()) {
        emitter << *flag;
    } else if (auto integer = value.tryAs<int>()) {
        emitter << *integer;
    } else if (auto real = value.tryAs<double>()) {
        emitter << *real;
    } else if (auto items = value.tryAs<std::vector<std::string>>()) {
        emitter << YAML::Flow << *items;
    } else {
        emitter << value.asOrDefault<std::string>("");
    }
}

} // namespace

std::optional<double> ConfigValue::asNumber() const {
    if (auto integer = tryAs<int>()) {
        return static_cast<double>(*integer);
    }
    return tryAs<double>();
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    std::ifstream readable(filename);
    if (!readable) {
        LOG_ERROR("config", "Configuration file not found: " + filename);
        return false;
    }
    try {
        return adopt(YAML::LoadFile(filename), filename);
    } catch (const YAML::Exception& e) {
        LOG_ERROR_META("config", "Cannot parse configuration file",
                       (std::unordered_map<std::string, std::string>{{"file", filename}, {"error", e.what()}}));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        return adopt(YAML::Load(yaml_content), "<string>");
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Cannot parse configuration string: " + std::string(e.what()));
        return false;
    }
}

// EN: A loaded document replaces the previous sections as a whole. Top-level scalars go to "default".
// FR: Un document chargé remplace les sections précédentes en bloc. Les scalaires de premier niveau vont dans "default".
bool ConfigManager::adopt(const YAML::Node& root, const std::string& origin) {
    if (!root.IsNull() && !root.IsMap()) {
        LOG_ERROR("config", "Configuration root is not a map: " + origin);
        return false;
    }

    std::unordered_map<std::string, ConfigSection> fresh;
    for (auto it = root.begin(); it != root.end(); ++it) {
        const std::string name = it->first.as<std::string>();
        const YAML::Node& body = it->second;
        if (!body.IsMap()) {
            fresh[kDefaultSection][name] = fromYaml(body);
            continue;
        }
        ConfigSection& section = fresh[name];
        for (auto entry = body.begin(); entry != body.end(); ++entry) {
            section[entry->first.as<std::string>()] = fromYaml(entry->second);
        }
    }

    const size_t section_count = fresh.size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_.swap(fresh);
    }
    LOG_INFO_META("config", "Configuration loaded",
                  (std::unordered_map<std::string, std::string>{
                      {"origin", origin}, {"sections", std::to_string(section_count)}}));
    return true;
}

// EN: Quoted scalars stay strings. Unquoted ones are tried as bool, then int, then double.
// FR: Les scalaires entre guillemets restent des chaînes. Les autres sont essayés en bool, int puis double.
ConfigValue ConfigManager::fromYaml(const YAML::Node& node) {
    if (node.IsSequence()) {
        std::vector<std::string> items;
        items.reserve(node.size());
        for (const auto& item : node) {
            items.push_back(substituteEnvironment(item.as<std::string>()));
        }
        return ConfigValue(items);
    }
    if (!node.IsScalar()) {
        return ConfigValue();
    }

    const std::string& raw = node.Scalar();
    const bool quoted = node.Tag() == "!";
    if (!quoted) {
        const std::string folded = lowercase(raw);
        if (folded == "true" || folded == "false") {
            return ConfigValue(folded == "true");
        }
        int integer = 0;
        const bool looks_real = raw.find_first_of(".eE") != std::string::npos;
        if (!looks_real && YAML::convert<int>::decode(node, integer)) {
            return ConfigValue(integer);
        }
        double real = 0.0;
        if (YAML::convert<double>::decode(node, real)) {
            return ConfigValue(real);
        }
    }
    return ConfigValue(substituteEnvironment(raw));
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    YAML::Emitter emitter;
    emitter << YAML::BeginMap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& entry : sections_) {
            names.push_back(entry.first);
        }
        std::sort(names.begin(), names.end());

        for (const auto& name : names) {
            emitter << YAML::Key << name << YAML::Value << YAML::BeginMap;
            for (const auto& [key, value] : sections_.at(name)) {
                emitter << YAML::Key << key << YAML::Value;
                emitValue(emitter, value);
            }
            emitter << YAML::EndMap;
        }
    }
    emitter << YAML::EndMap;

    std::ofstream out(filename, std::ios::trunc);
    if (!(out << emitter.c_str() << '\n')) {
        LOG_ERROR("config", "Cannot write configuration file: " + filename);
        return false;
    }
    LOG_INFO("config", "Configuration saved to: " + filename);
    return true;
}

void ConfigManager::declareSection(const std::string& section) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section];
}

// EN: GCS_CHECKPOINT_MAX_CHECKPOINTS=4 sets checkpoint.max_checkpoints. Section names may hold
//     underscores, so the longest declared section matching the prefix is chosen.
// FR: GCS_CHECKPOINT_MAX_CHECKPOINTS=4 fixe checkpoint.max_checkpoints. Les noms de section peuvent
//     contenir des underscores, la plus longue section déclarée correspondant au préfixe est retenue.
size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto owningSection = [this](const std::string& name) {
        std::string owner;
        for (const auto& entry : sections_) {
            const std::string& section = entry.first;
            const bool matches = name.size() > section.size() + 1 &&
                                 name.compare(0, section.size(), section) == 0 &&
                                 name[section.size()] == '_';
            if (matches && section.size() > owner.size()) {
                owner = section;
            }
        }
        return owner;
    };

    size_t applied = 0;
    for (char** cursor = environ; cursor && *cursor; ++cursor) {
        const std::string assignment(*cursor);
        const size_t eq = assignment.find('=');
        if (eq == std::string::npos || eq <= prefix.size() || assignment.rfind(prefix, 0) != 0) {
            continue;
        }
        const std::string name = lowercase(assignment.substr(prefix.size(), eq - prefix.size()));
        const std::string raw = assignment.substr(eq + 1);

        const std::string section = owningSection(name);
        if (section.empty()) {
            LOG_DEBUG("config", "No section for environment variable " + prefix + name);
            continue;
        }

        ConfigValue parsed;
        try {
            parsed = fromYaml(YAML::Load(raw));
        } catch (const YAML::Exception&) {
            LOG_DEBUG("config", "Environment value kept as text: " + prefix + name);
        }
        const std::string key = name.substr(section.size() + 1);
        sections_[section][key] = parsed.isValid() ? parsed : ConfigValue(raw);
        ++applied;
        LOG_INFO("config", "Environment override: " + section + "." + key);
    }
    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.insert(rules_.end(), rules.begin(), rules.end());
}

void ConfigManager::clearValidationRules() {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.clear();
}

std::optional<std::string> ConfigManager::checkRule(const ValidationRule& rule, const ConfigValue& value) {
    bool type_ok = true;
    if (rule.type == "bool") {
        type_ok = value.tryAs<bool>().has_value();
    } else if (rule.type == "int") {
        type_ok = value.tryAs<int>().has_value();
    } else if (rule.type == "number" || rule.type == "double") {
        type_ok = value.asNumber().has_value();
    } else if (rule.type == "string") {
        type_ok = value.tryAs<std::string>().has_value();
    } else if (rule.type == "array") {
        type_ok = value.tryAs<std::vector<std::string>>().has_value();
    }
    if (!type_ok) {
        return rule.key + " must be of type " + rule.type;
    }

    const auto number = value.asNumber();
    if (number && rule.min_value && *number < *rule.min_value) {
        return rule.key + " must be >= " + formatBound(*rule.min_value);
    }
    if (number && rule.max_value && *number > *rule.max_value) {
        return rule.key + " must be <= " + formatBound(*rule.max_value);
    }
    return std::nullopt;
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : rules_) {
        const auto [section, key] = splitKey(rule.key);
        const ConfigValue* value = find(section, key);
        if (!value || !value->isValid()) {
            if (rule.required) {
                errors.push_back(rule.key + " is required");
            }
            continue;
        }
        if (auto problem = checkRule(rule, *value)) {
            errors.push_back(*problem);
        }
    }
    return errors.empty();
}

// EN: Caller holds mutex_.
// FR: L'appelant détient mutex_.
const ConfigValue* ConfigManager::find(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it == sections_.end()) {
        return nullptr;
    }
    auto value_it = section_it->second.find(key);
    return value_it == section_it->second.end() ? nullptr : &value_it->second;
}

ConfigValue ConfigManager::get(const std::string& key) const {
    return get(kDefaultSection, key);
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ConfigValue* value = find(section, key);
    return value ? *value : ConfigValue();
}

void ConfigManager::set(const std::string& key, const ConfigValue& value) {
    set(kDefaultSection, key, value);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section][key] = value;
}

bool ConfigManager::has(const std::string& key) const {
    return has(kDefaultSection, key);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find(section, key) != nullptr;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    rules_.clear();
}

} // namespace GCS
