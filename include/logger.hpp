#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Open a log file in addition to the console sink.
 *
 * @param path      Filesystem path of the log file, opened for append.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Size in bytes after which the file is rotated. `0`
 *                  disables rotation.
 * @param max_files Number of rotated files to keep.
 * @return `false` if the file could not be opened; console logging keeps
 *         working in that case.
 */
bool init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Set the global minimum log level for every sink.
 */
void set_log_level(LogLevel level);

LogLevel get_log_level();

/**
 * @brief Emit entries as single-line JSON objects instead of plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files.
 */
void set_log_compression(bool enable);

/**
 * @brief Enable or disable echoing entries to stderr. Enabled by default.
 */
void set_console_logging(bool enable);

/**
 * @return `true` if a log file is currently open.
 */
bool logger_initialized();

/**
 * @brief Parse `DEBUG`, `INFO`, `WARNING`/`WARN` or `ERROR`, ignoring case.
 *
 * @param text Level name.
 * @param ok   Set to `false` on an unknown name.
 */
LogLevel parse_log_level(const std::string& text, bool& ok);

void log_event(LogLevel level, const std::string& message);
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
 * @brief Flush the file sink.
 */
void flush_logger();

/**
 * @brief Close the file sink and restore defaults.
 */
void shutdown_logger();

#endif // LOGGER_HPP
