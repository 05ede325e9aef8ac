#ifndef LOGGER_H
#define LOGGER_H

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

/// Namespace with the names of every log source used across the project.
namespace Log {
  const std::string contractHost = "ContractHost";
  const std::string erc721Series = "ERC721Series";
  const std::string options = "Options";
  const std::string seriesmintd = "SeriesMintD";
}

/// Enum for the log message types, ordered by severity.
enum class LogType { DEBUG, INFO, WARNING, ERROR, NONE };

/**
 * Singleton logger.
 * Messages below the configured level are dropped. Accepted messages are
 * appended to the log file, if one was set, and go through Utils::safePrint().
 */
class Logger {
  private:
    std::mutex logMutex_;                   ///< Serializes writes to the log file.
    std::ofstream logFile_;                 ///< Handle for the active log file.
    std::string logFilePath_;               ///< Path of the active log file. Empty until setLogFile().
    std::atomic<LogType> logLevel_ = LogType::INFO; ///< Minimum level that gets logged.

    Logger() = default;

    /// Getter for the singleton instance.
    static Logger& getInstance() {
      static Logger instance;
      return instance;
    }

    void write(LogType type, const std::string& logSrc, const std::string& func, const std::string& message);

  public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger();

    /**
     * Log a message.
     * @param type The type of the message.
     * @param logSrc The module the message comes from (see the Log namespace).
     * @param func The function the message comes from (usually `__func__`).
     * @param message The message itself.
     */
    static void logToDebug(LogType type, const std::string& logSrc, std::string&& func, std::string&& message) noexcept;

    /// Change the file messages are written to (empty for none). The previous file is closed.
    static void setLogFile(const std::string& path);

    /// Change the minimum level that gets logged.
    static void setLogLevel(LogType level);

    /// Getter for the minimum level that gets logged.
    static LogType getLogLevel();

    /// Convert a log type to its name ("DEBUG", "INFO", ...).
    static std::string logTypeToString(LogType type);

    /// Convert a name back to a log type. Throws DynamicException on unknown names.
    static LogType logTypeFromString(const std::string& name);
};

#endif // LOGGER_H
