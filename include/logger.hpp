#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

namespace svckit {

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

using LogFields = std::map<std::string, std::string>;

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for append and starts the background writer.
 * Calling it again reopens the sink with the new settings.
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
 * @brief Set the global minimum log level.
 */
void set_log_level(LogLevel level);

/**
 * @brief Parse "debug", "info", "warning" or "error" (any case).
 *
 * @throws std::runtime_error on an unknown level name.
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Enable or disable JSON formatted log lines.
 */
void set_json_logging(bool enable);

/**
 * @brief gzip rotated files instead of keeping them as plain text.
 */
void set_log_compression(bool enable);

/**
 * @brief Mirror every written line to stderr.
 *
 * Used by foreground runs. Lines are echoed even when no log file is open.
 */
void set_console_logging(bool enable);

/**
 * @brief Initialize system logging using the specified facility.
 *
 * @param facility Syslog facility identifier to tag messages with.
 */
void init_syslog(int facility = 0);

/**
 * @brief Check whether a log file is open.
 */
bool logger_initialized();

void log_event(LogLevel level, const std::string& message, const LogFields& fields = {});

void log_debug(const std::string& msg, const LogFields& fields = {});
void log_info(const std::string& msg, const LogFields& fields = {});
void log_warning(const std::string& msg, const LogFields& fields = {});
void log_error(const std::string& msg, const LogFields& fields = {});

/**
 * @brief Block until every queued message reached the sink.
 */
void flush_logger();

/**
 * @brief Stop the writer thread ahead of fork().
 *
 * Queued messages are written first. Messages logged while paused are kept
 * and written once resume_logger() runs. Both calls are no-ops while the
 * logger is not running.
 */
void pause_logger();

/**
 * @brief Restart the writer thread in the calling process after fork().
 */
void resume_logger();

/**
 * @brief Shut down the logging subsystem and release resources.
 */
void shutdown_logger();

} // namespace svckit

#endif // LOGGER_HPP
