#pragma once

#include "infrastructure/config/config_manager.hpp"
#include "streaming/checkpoint_manager.hpp"
#include "streaming/chunk_processor.hpp"
#include "streaming/file_analyzer.hpp"
#include "streaming/memory_manager.hpp"
#include "streaming/stream_pause_resume.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace GCS {

// EN: Immutable engine configuration, built once at startup and passed by const reference.
// FR: Configuration immuable du moteur, construite une fois au démarrage et passée par référence constante.
struct StreamingConfig {
    FileAnalyzerConfig analysis;
    ChunkProcessorConfig processing;
    MemoryManagerConfig memory;
    CheckpointConfig checkpoint;
    PauseResumeConfig pause;
    bool enable_memory_monitoring{true};
};

// EN: Builds a StreamingConfig from the YAML sections streaming, analysis, memory, checkpoint and pause.
//     Keys are snake_case; GCS_<SECTION>_<KEY> environment variables override file values.
// FR: Construit une StreamingConfig depuis les sections YAML streaming, analysis, memory, checkpoint et pause.
//     Les clés sont en snake_case ; les variables GCS_<SECTION>_<CLE> surchargent le fichier.
class StreamingConfigLoader {
public:
    static const std::vector<std::string>& sectionNames();
    static std::vector<ConfigManager::ValidationRule> validationRules();

    // EN: Throws ConfigurationError listing every violation.
    // FR: Lance ConfigurationError listant chaque violation.
    static StreamingConfig fromConfigManager(ConfigManager& manager, bool apply_environment = true);
    static StreamingConfig fromFile(const std::string& path, bool apply_environment = true);

    // EN: Cross-field checks on an already built value. Throws ConfigurationError.
    // FR: Vérifications inter-champs d'une valeur déjà construite. Lance ConfigurationError.
    static void validate(const StreamingConfig& config);

    static nlohmann::json toJson(const StreamingConfig& config);
};

} // namespace GCS
