#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <string>
#include <map>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path and configures log rotation parameters.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Mirror messages at or above @p level to standard error.
 *
 * The console sink works with or without a log file. Gateway warnings use it
 * so that a value downgraded to a default is never silent.
 *
 * @param enable Turn the console sink on or off.
 * @param level  Minimum severity written to stderr.
 */
void set_console_logging(bool enable, LogLevel level = LogLevel::WARNING);

/**
 * @brief Set the global minimum log level.
 *
 * @param level Desired @ref LogLevel threshold for emitting messages.
 */
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit logs as JSON objects instead of plain
 *               text.
 */
void set_json_logging(bool enable);

/**
 * @brief Compress rotated log files with gzip.
 */
void set_log_compression(bool enable);

/**
 * @brief Configure how many rotated log files are retained.
 *
 * @param max_files Number of historical log files to keep after rotation.
 */
void set_log_rotation(size_t max_files);

/**
 * @brief Check whether the file logger has been initialized.
 *
 * @return `true` if the log file is open; `false` otherwise.
 */
bool logger_initialized();

/**
 * @brief Block until every queued message has been written.
 */
void flush_logger();

/**
 * @brief Log a message with structured key/value fields.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Map of field names to values providing structured context.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Initialize system logging using the specified facility.
 *
 * @param facility Syslog facility identifier to tag messages with.
 */
void init_syslog(int facility = 0);

/**
 * @brief Shut down the logging subsystem and release resources.
 *
 * Safe to call more than once.
 */
void shutdown_logger();

/**
 * @brief RAII helper calling shutdown_logger() when it goes out of scope.
 *
 * The writer thread must be joined before static destruction, so every exit
 * path of a program that logs should hold one.
 */
struct LoggerGuard {
    LoggerGuard() = default;
    ~LoggerGuard() { shutdown_logger(); }
    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;
};

#endif // LOGGER_HPP
