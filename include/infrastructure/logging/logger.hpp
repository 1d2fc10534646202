// EN: Thread-safe NDJSON logger shared by every ingestion component.
// FR: Logger NDJSON thread-safe partagé par tous les composants d'ingestion.

#pragma once

#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace CIP {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Parse a level name ("debug", "info", "warn", "error"); returns false if unknown.
// FR: Parse un nom de niveau ("debug", "info", "warn", "error") ; retourne false si inconnu.
bool parseLogLevel(const std::string& name, LogLevel& level);

// EN: Thread-safe singleton logger with NDJSON output and correlation IDs.
// FR: Logger singleton thread-safe avec sortie NDJSON et IDs de corrélation.
class Logger {
public:
    // EN: Structure representing a log entry.
    // FR: Structure représentant une entrée de log.
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        std::unordered_map<std::string, std::string> metadata;
    };

    // EN: Receives every formatted NDJSON line when installed.
    // FR: Reçoit chaque ligne NDJSON formatée lorsqu'il est installé.
    using Sink = std::function<void(LogLevel level, const std::string& line)>;

    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Set output file for logging (disables console output).
    // FR: Définit le fichier de sortie (désactive la sortie console).
    bool setOutputFile(const std::string& filename);

    // EN: Route entries to a sink instead of console/file; pass nullptr to restore console.
    // FR: Redirige les entrées vers un sink au lieu de console/fichier ; nullptr restaure la console.
    void setSink(Sink sink);

    void setCorrelationId(const std::string& correlation_id);
    void addGlobalMetadata(const std::string& key, const std::string& value);
    void clearGlobalMetadata();

    void log(LogLevel level, const std::string& module, const std::string& message);
    void log(LogLevel level, const std::string& module, const std::string& message,
             const std::unordered_map<std::string, std::string>& metadata);

    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void warn(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);

    void debug(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);
    void info(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void warn(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void error(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);

    void flush();

    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    std::string generateCorrelationId();

    // EN: Format an entry as a single NDJSON line (exposed for tests).
    // FR: Formate une entrée en une ligne NDJSON (exposé pour les tests).
    static std::string formatAsNDJSON(const LogEntry& entry);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeEntry(const LogEntry& entry);

    static std::string levelToString(LogLevel level);
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);
    static std::string getThreadId();

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unordered_map<std::string, std::string> global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    Sink sink_;
    mutable std::mutex mutex_;
    bool console_output_ = true;
};

#define LOG_DEBUG(module, message) CIP::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) CIP::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) CIP::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) CIP::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) CIP::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) CIP::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) CIP::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) CIP::Logger::getInstance().error(module, message, metadata)

} // namespace CIP
