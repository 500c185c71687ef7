// EN: Mapping between configuration sections and the engine's component configs.
// FR: Correspondance entre les sections de configuration et les configs des composants.

#include "infrastructure/config/streaming_config.hpp"
#include "core/streaming_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cmath>

namespace GCS {

namespace {

// EN: Typed reads that record a readable error instead of throwing on the first bad value.
// FR: Lectures typées qui enregistrent une erreur lisible au lieu de lever dès la première mauvaise valeur.
class SectionReader {
public:
    SectionReader(const ConfigManager& manager, std::string section, std::vector<std::string>& errors)
        : manager_(manager), section_(std::move(section)), errors_(errors) {}

    void read(const std::string& key, bool& target) {
        ConfigValue value = manager_.get(section_, key);
        if (!value.isValid()) {
            return;
        }
        if (auto typed = value.tryAs<bool>()) {
            target = *typed;
        } else {
            errors_.push_back(section_ + "." + key + " must be a boolean");
        }
    }

    void read(const std::string& key, double& target) {
        ConfigValue value = manager_.get(section_, key);
        if (!value.isValid()) {
            return;
        }
        if (auto number = value.asNumber()) {
            target = *number;
        } else {
            errors_.push_back(section_ + "." + key + " must be a number");
        }
    }

    void read(const std::string& key, std::string& target) {
        ConfigValue value = manager_.get(section_, key);
        if (!value.isValid()) {
            return;
        }
        if (auto typed = value.tryAs<std::string>()) {
            target = *typed;
        } else {
            errors_.push_back(section_ + "." + key + " must be a string");
        }
    }

    template<typename Integer>
    void readCount(const std::string& key, Integer& target) {
        ConfigValue value = manager_.get(section_, key);
        if (!value.isValid()) {
            return;
        }
        auto number = value.asNumber();
        if (!number || *number < 0.0 || std::floor(*number) != *number) {
            errors_.push_back(section_ + "." + key + " must be a non-negative integer");
            return;
        }
        target = static_cast<Integer>(*number);
    }

    void readMs(const std::string& key, std::chrono::milliseconds& target) {
        long long ms = target.count();
        readCount(key, ms);
        target = std::chrono::milliseconds(ms);
    }

private:
    const ConfigManager& manager_;
    std::string section_;
    std::vector<std::string>& errors_;
};

ConfigManager::ValidationRule rule(const std::string& key, const std::string& type,
                                   std::optional<double> min_value = std::nullopt,
                                   std::optional<double> max_value = std::nullopt) {
    ConfigManager::ValidationRule validation_rule;
    validation_rule.key = key;
    validation_rule.type = type;
    validation_rule.min_value = min_value;
    validation_rule.max_value = max_value;
    return validation_rule;
}

std::string joinErrors(const std::vector<std::string>& errors) {
    std::string joined;
    for (const auto& error : errors) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += error;
    }
    return joined;
}

} // namespace

const std::vector<std::string>& StreamingConfigLoader::sectionNames() {
    static const std::vector<std::string> names = {"streaming", "analysis", "memory", "checkpoint", "pause"};
    return names;
}

std::vector<ConfigManager::ValidationRule> StreamingConfigLoader::validationRules() {
    return {
        rule("streaming.chunk_size", "number", 1),
        rule("streaming.max_concurrent_chunks", "number", 1, 64),
        rule("streaming.max_chunk_retries", "number", 0),
        rule("streaming.chunk_timeout_ms", "number", 1),
        rule("streaming.line_failure_tolerance", "number", 0.0, 1.0),
        rule("streaming.retry_failed_chunks", "bool"),
        rule("analysis.buffer_size", "number", 1),
        rule("memory.max_memory_usage", "number", 1),
        rule("memory.warning_threshold", "number", 0.0, 1.0),
        rule("memory.critical_threshold", "number", 0.0, 1.0),
        rule("memory.chunk_size_reduction", "number", 0.0, 1.0),
        rule("memory.monitoring_interval_ms", "number", 1),
        rule("checkpoint.checkpoint_interval", "number", 1),
        rule("checkpoint.checkpoint_directory", "string"),
        rule("checkpoint.max_checkpoints", "number", 1),
        rule("checkpoint.retention_days", "number", 1),
        rule("pause.pause_timeout_ms", "number", 0),
        rule("pause.resume_timeout_ms", "number", 0),
        rule("pause.max_pause_duration_ms", "number", 1)
    };
}

StreamingConfig StreamingConfigLoader::fromConfigManager(ConfigManager& manager, bool apply_environment) {
    // EN: Environment overrides only land in existing sections.
    // FR: Les surcharges d'environnement ne s'appliquent qu'aux sections existantes.
    for (const auto& name : sectionNames()) {
        manager.declareSection(name);
    }
    if (apply_environment) {
        size_t applied = manager.loadEnvironmentOverrides("GCS_");
        if (applied > 0) {
            LOG_INFO("config", "Applied " + std::to_string(applied) + " environment overrides");
        }
    }

    std::vector<std::string> errors;
    manager.clearValidationRules();
    manager.addValidationRules(validationRules());
    manager.validate(errors);

    StreamingConfig config;

    SectionReader streaming(manager, "streaming", errors);
    streaming.readCount("chunk_size", config.analysis.chunk_size);
    streaming.readCount("max_concurrent_chunks", config.processing.max_concurrent_chunks);
    streaming.read("retry_failed_chunks", config.processing.retry_failed_chunks);
    streaming.readCount("max_chunk_retries", config.processing.max_chunk_retries);
    streaming.readMs("chunk_timeout_ms", config.processing.chunk_timeout);
    streaming.read("validate_chunk_completion", config.processing.validate_chunk_completion);
    streaming.read("line_failure_tolerance", config.processing.line_failure_tolerance);
    streaming.read("enable_memory_monitoring", config.enable_memory_monitoring);

    SectionReader analysis(manager, "analysis", errors);
    analysis.readCount("buffer_size", config.analysis.buffer_size);
    analysis.read("enable_metadata", config.analysis.enable_metadata);
    analysis.read("validate_chunks", config.analysis.validate_chunks);
    analysis.read("skip_empty_lines", config.analysis.skip_empty_lines);
    analysis.read("skip_comments", config.analysis.skip_comments);
    analysis.read("retain_lines", config.analysis.retain_lines);

    SectionReader memory(manager, "memory", errors);
    memory.readCount("max_memory_usage", config.memory.max_memory_usage);
    memory.read("warning_threshold", config.memory.warning_threshold);
    memory.read("critical_threshold", config.memory.critical_threshold);
    memory.readMs("monitoring_interval_ms", config.memory.monitoring_interval);
    memory.read("enable_garbage_collection", config.memory.enable_garbage_collection);
    memory.read("chunk_size_reduction", config.memory.chunk_size_reduction);
    memory.read("enable_memory_optimization", config.memory.enable_memory_optimization);
    memory.read("track_chunk_memory", config.memory.track_chunk_memory);
    memory.read("enable_leak_detection", config.memory.enable_leak_detection);

    SectionReader checkpoint(manager, "checkpoint", errors);
    checkpoint.read("enable_checkpointing", config.checkpoint.enable_checkpointing);
    checkpoint.readCount("checkpoint_interval", config.checkpoint.checkpoint_interval);
    checkpoint.read("checkpoint_directory", config.checkpoint.checkpoint_directory);
    checkpoint.readCount("max_checkpoints", config.checkpoint.max_checkpoints);
    checkpoint.read("compression_enabled", config.checkpoint.compression_enabled);
    checkpoint.read("validate_checksums", config.checkpoint.validate_checksums);
    checkpoint.read("auto_cleanup", config.checkpoint.auto_cleanup);
    checkpoint.readCount("retention_days", config.checkpoint.retention_days);

    SectionReader pause(manager, "pause", errors);
    pause.read("enable_pause_resume", config.pause.enable_pause_resume);
    pause.readMs("pause_timeout_ms", config.pause.pause_timeout);
    pause.readMs("resume_timeout_ms", config.pause.resume_timeout);
    pause.read("save_state_on_pause", config.pause.save_state_on_pause);
    pause.read("validate_state_on_resume", config.pause.validate_state_on_resume);
    pause.readMs("max_pause_duration_ms", config.pause.max_pause_duration);
    pause.read("enable_graceful_pause", config.pause.enable_graceful_pause);

    if (!errors.empty()) {
        LOG_ERROR("config", "Invalid streaming configuration: " + joinErrors(errors));
        throw ConfigurationError("Invalid streaming configuration: " + joinErrors(errors));
    }

    validate(config);
    return config;
}

StreamingConfig StreamingConfigLoader::fromFile(const std::string& path, bool apply_environment) {
    ConfigManager& manager = ConfigManager::getInstance();
    if (!manager.loadFromFile(path)) {
        throw ConfigurationError("Cannot load configuration file: " + path);
    }
    LOG_INFO("config", "Streaming configuration loaded from " + path);
    return fromConfigManager(manager, apply_environment);
}

void StreamingConfigLoader::validate(const StreamingConfig& config) {
    std::vector<std::string> errors;
    if (config.analysis.chunk_size == 0) {
        errors.push_back("streaming.chunk_size must be at least 1");
    }
    if (config.analysis.buffer_size == 0) {
        errors.push_back("analysis.buffer_size must be at least 1");
    }
    if (config.processing.max_concurrent_chunks == 0) {
        errors.push_back("streaming.max_concurrent_chunks must be at least 1");
    }
    if (config.processing.chunk_timeout.count() <= 0) {
        errors.push_back("streaming.chunk_timeout_ms must be positive");
    }
    if (config.memory.warning_threshold >= config.memory.critical_threshold) {
        errors.push_back("memory.warning_threshold must be below memory.critical_threshold");
    }
    if (config.memory.chunk_size_reduction <= 0.0 || config.memory.chunk_size_reduction >= 1.0) {
        errors.push_back("memory.chunk_size_reduction must be in (0, 1)");
    }
    if (config.checkpoint.max_checkpoints == 0) {
        errors.push_back("checkpoint.max_checkpoints must be at least 1");
    }
    if (config.checkpoint.retention_days <= 0) {
        errors.push_back("checkpoint.retention_days must be at least 1");
    }
    if (config.pause.max_pause_duration.count() <= 0) {
        errors.push_back("pause.max_pause_duration_ms must be positive");
    }

    if (!errors.empty()) {
        throw ConfigurationError("Invalid streaming configuration: " + joinErrors(errors));
    }
}

nlohmann::json StreamingConfigLoader::toJson(const StreamingConfig& config) {
    return {
        {"streaming", {
            {"chunk_size", config.analysis.chunk_size},
            {"max_concurrent_chunks", config.processing.max_concurrent_chunks},
            {"retry_failed_chunks", config.processing.retry_failed_chunks},
            {"max_chunk_retries", config.processing.max_chunk_retries},
            {"chunk_timeout_ms", config.processing.chunk_timeout.count()},
            {"validate_chunk_completion", config.processing.validate_chunk_completion},
            {"line_failure_tolerance", config.processing.line_failure_tolerance},
            {"enable_memory_monitoring", config.enable_memory_monitoring}
        }},
        {"analysis", {
            {"buffer_size", config.analysis.buffer_size},
            {"enable_metadata", config.analysis.enable_metadata},
            {"validate_chunks", config.analysis.validate_chunks},
            {"skip_empty_lines", config.analysis.skip_empty_lines},
            {"skip_comments", config.analysis.skip_comments},
            {"retain_lines", config.analysis.retain_lines}
        }},
        {"memory", {
            {"max_memory_usage", config.memory.max_memory_usage},
            {"warning_threshold", config.memory.warning_threshold},
            {"critical_threshold", config.memory.critical_threshold},
            {"monitoring_interval_ms", config.memory.monitoring_interval.count()},
            {"chunk_size_reduction", config.memory.chunk_size_reduction}
        }},
        {"checkpoint", {
            {"enable_checkpointing", config.checkpoint.enable_checkpointing},
            {"checkpoint_interval", config.checkpoint.checkpoint_interval},
            {"checkpoint_directory", config.checkpoint.checkpoint_directory},
            {"max_checkpoints", config.checkpoint.max_checkpoints},
            {"compression_enabled", config.checkpoint.compression_enabled},
            {"retention_days", config.checkpoint.retention_days}
        }},
        {"pause", {
            {"enable_pause_resume", config.pause.enable_pause_resume},
            {"enable_graceful_pause", config.pause.enable_graceful_pause},
            {"pause_timeout_ms", config.pause.pause_timeout.count()},
            {"max_pause_duration_ms", config.pause.max_pause_duration.count()}
        }}
    };
}

} // namespace GCS
