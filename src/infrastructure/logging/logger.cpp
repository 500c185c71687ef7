// EN: NDJSON logger. Each record is one nlohmann::json object written on its own line.
// FR: Logger NDJSON. Chaque entrée est un objet nlohmann::json écrit sur sa propre ligne.

#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iostream>
#include <random>
#include <thread>

namespace GCS {

namespace {

constexpr std::array<const char*, 4> kLevelNames = {"DEBUG", "INFO", "WARN", "ERROR"};

} // namespace

Logger& Logger::getInstance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

// EN: Append mode. When the file cannot be opened the current sink is left untouched.
// FR: Mode ajout. Si le fichier ne s'ouvre pas, la sortie courante reste inchangée.
bool Logger::setOutputFile(const std::string& filename) {
    std::ofstream candidate(filename, std::ios::out | std::ios::app);
    if (!candidate) {
        std::cerr << "logger: cannot open " << filename << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    file_ = std::move(candidate);
    to_console_ = false;
    return true;
}

void Logger::closeOutputFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    to_console_ = true;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    to_console_ = enabled;
}

void Logger::setCorrelationId(const std::string& correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = correlation_id;
}

void Logger::addGlobalMetadata(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_.insert_or_assign(key, value);
}

void Logger::clearGlobalMetadata() {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_.clear();
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message,
                 const Metadata& metadata) {
    LogEntry entry{std::chrono::system_clock::now(), level, message, {}, module, currentThreadTag(), metadata};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < threshold_) {
            return;
        }
        entry.correlation_id = correlation_id_;
        // EN: Per-call keys shadow global ones / FR: Les clés de l'appel masquent les clés globales
        entry.metadata.insert(global_metadata_.begin(), global_metadata_.end());
    }
    emit(formatAsNDJSON(entry));
}

void Logger::debug(const std::string& module, const std::string& message, const Metadata& metadata) {
    log(LogLevel::DEBUG, module, message, metadata);
}

void Logger::info(const std::string& module, const std::string& message, const Metadata& metadata) {
    log(LogLevel::INFO, module, message, metadata);
}

void Logger::warn(const std::string& module, const std::string& message, const Metadata& metadata) {
    log(LogLevel::WARN, module, message, metadata);
}

void Logger::error(const std::string& module, const std::string& message, const Metadata& metadata) {
    log(LogLevel::ERROR, module, message, metadata);
}

void Logger::emit(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line << '\n';
    }
    if (to_console_) {
        std::cout << line << '\n';
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
    std::cout.flush();
}

// EN: 8-4-4-4-12 lowercase hex groups built from two random 64-bit words.
// FR: Groupes hexadécimaux 8-4-4-4-12 construits depuis deux mots aléatoires de 64 bits.
std::string Logger::generateCorrelationId() {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    const uint64_t high = generator();
    const uint64_t low = generator();

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned int>(high >> 32),
                  static_cast<unsigned int>((high >> 16) & 0xFFFF),
                  static_cast<unsigned int>(high & 0xFFFF),
                  static_cast<unsigned int>(low >> 48),
                  static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return std::string(buffer);
}

// EN: Metadata keys are flattened next to the fixed fields; fixed fields are never overwritten.
// FR: Les clés de métadonnées sont aplaties à côté des champs fixes, qui ne sont jamais écrasés.
std::string Logger::formatAsNDJSON(const LogEntry& entry) {
    nlohmann::json record = {
        {"timestamp", isoTimestamp(entry.timestamp)},
        {"level", levelToString(entry.level)},
        {"module", entry.module},
        {"message", entry.message},
        {"thread_id", entry.thread_id}
    };
    if (!entry.correlation_id.empty()) {
        record["correlation_id"] = entry.correlation_id;
    }
    for (const auto& [key, value] : entry.metadata) {
        record.emplace(key, value);
    }
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::levelToString(LogLevel level) {
    const auto index = static_cast<size_t>(level);
    return index < kLevelNames.size() ? kLevelNames[index] : "UNKNOWN";
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) {
    std::string upper(name.size(), '\0');
    std::transform(name.begin(), name.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") {
        return LogLevel::WARN;
    }
    for (size_t i = 0; i < kLevelNames.size(); ++i) {
        if (upper == kLevelNames[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

// EN: UTC with millisecond precision, e.g. 2024-05-01T12:00:00.042Z
// FR: UTC à la milliseconde, ex. 2024-05-01T12:00:00.042Z
std::string Logger::isoTimestamp(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char date[24];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%s.%03dZ", date, static_cast<int>(millis));
    return std::string(stamp);
}

std::string Logger::currentThreadTag() {
    return std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));
}

} // namespace GCS
