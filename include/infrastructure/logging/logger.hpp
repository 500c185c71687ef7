#pragma once

#include <chrono>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace GCS {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Thread-safe singleton logger writing one JSON object per line (NDJSON).
// FR: Logger singleton thread-safe écrivant un objet JSON par ligne (NDJSON).
class Logger {
public:
    using Metadata = std::unordered_map<std::string, std::string>;

    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        Metadata metadata;
    };

    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Append records to a file. Console output is switched off on success.
    // FR: Ajoute les entrées à un fichier. La sortie console est coupée en cas de succès.
    bool setOutputFile(const std::string& filename);
    void closeOutputFile();
    void setConsoleOutput(bool enabled);

    void setCorrelationId(const std::string& correlation_id);
    void addGlobalMetadata(const std::string& key, const std::string& value);
    void clearGlobalMetadata();

    // EN: Records under the current level are dropped before any formatting.
    // FR: Les entrées sous le niveau courant sont écartées avant tout formatage.
    void log(LogLevel level, const std::string& module, const std::string& message,
             const Metadata& metadata = Metadata{});

    void debug(const std::string& module, const std::string& message, const Metadata& metadata = Metadata{});
    void info(const std::string& module, const std::string& message, const Metadata& metadata = Metadata{});
    void warn(const std::string& module, const std::string& message, const Metadata& metadata = Metadata{});
    void error(const std::string& module, const std::string& message, const Metadata& metadata = Metadata{});

    void flush();

    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    std::string generateCorrelationId();

    // EN: Format an entry as a single NDJSON line (no trailing newline).
    // FR: Formate une entrée en une ligne NDJSON (sans saut de ligne final).
    static std::string formatAsNDJSON(const LogEntry& entry);

    static std::string levelToString(LogLevel level);

    // EN: Parse "debug", "INFO", "warning"... Returns nullopt for unknown names.
    // FR: Parse "debug", "INFO", "warning"... Retourne nullopt pour les noms inconnus.
    static std::optional<LogLevel> parseLevel(const std::string& name);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void emit(const std::string& line);
    static std::string isoTimestamp(std::chrono::system_clock::time_point when);
    static std::string currentThreadTag();

    mutable std::mutex mutex_;
    LogLevel threshold_ = LogLevel::INFO;
    bool to_console_ = true;
    std::ofstream file_;
    std::string correlation_id_;
    Metadata global_metadata_;
};

#define LOG_DEBUG(module, message) GCS::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) GCS::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) GCS::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) GCS::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) GCS::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) GCS::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) GCS::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) GCS::Logger::getInstance().error(module, message, metadata)

} // namespace GCS
