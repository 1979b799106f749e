#ifndef MCPHOST_UTILS_LOGGING_HPP_
#define MCPHOST_UTILS_LOGGING_HPP_

#include <functional>
#include <string>

namespace mcphost {
namespace logging {

/**
 * @brief Log levels
 */
enum class Level { Trace, Debug, Info, Warning, Error, Fatal };

/**
 * @brief Convert a log level to a string
 *
 * @param level The log level
 * @return std::string The string representation
 */
std::string levelToString(Level level);

/**
 * @brief Parse a log level from a string
 *
 * Accepts upper or lower case names; "warn" is accepted for Warning.
 *
 * @param level_str The string representation
 * @return Level The log level
 * @throws std::invalid_argument if the string is not a valid log level
 */
Level levelFromString(const std::string &level_str);

/**
 * @brief Log handler function type
 *
 * @param level The log level
 * @param message The log message
 * @param file The source file
 * @param line The source line
 */
using LogHandler = std::function<void(Level level, const std::string &message,
                                      const std::string &file, int line)>;

/**
 * @brief Set the global log level
 */
void setLevel(Level level);

/**
 * @brief Get the global log level
 */
Level getLevel();

/**
 * @brief Apply the level named by the MCPHOST_LOG_LEVEL environment variable
 *
 * Leaves the current level untouched when the variable is unset or invalid.
 *
 * @return true if a level was applied
 */
bool configureFromEnvironment();

/**
 * @brief Set the global log handler
 *
 * Passing an empty handler restores the default handler.
 *
 * @param handler The log handler
 * @return LogHandler The handler that was installed before
 */
LogHandler setHandler(LogHandler handler);

/**
 * @brief Log a message
 *
 * @param level The log level
 * @param message The log message
 * @param file The source file
 * @param line The source line
 */
void log(Level level, const std::string &message, const std::string &file = "",
         int line = 0);

/**
 * @brief Prefix a message with the server it concerns
 *
 * @return std::string "[server] message"
 */
std::string withServer(const std::string &server, const std::string &message);

/**
 * @brief Check if a log level is enabled
 */
bool isEnabled(Level level);

/**
 * @brief Default log handler that logs to stderr
 */
void defaultHandler(Level level, const std::string &message,
                    const std::string &file, int line);

} // namespace logging
} // namespace mcphost

#define MCPHOST_LOG_AT(level, msg)                                             \
  do {                                                                         \
    if (mcphost::logging::isEnabled(level)) {                                  \
      mcphost::logging::log(level, msg, __FILE__, __LINE__);                   \
    }                                                                          \
  } while (0)

// Convenience macros for logging
#define MCPHOST_LOG_TRACE(msg)                                                 \
  MCPHOST_LOG_AT(mcphost::logging::Level::Trace, msg)
#define MCPHOST_LOG_DEBUG(msg)                                                 \
  MCPHOST_LOG_AT(mcphost::logging::Level::Debug, msg)
#define MCPHOST_LOG_INFO(msg) MCPHOST_LOG_AT(mcphost::logging::Level::Info, msg)
#define MCPHOST_LOG_WARNING(msg)                                               \
  MCPHOST_LOG_AT(mcphost::logging::Level::Warning, msg)
#define MCPHOST_LOG_ERROR(msg)                                                 \
  MCPHOST_LOG_AT(mcphost::logging::Level::Error, msg)
#define MCPHOST_LOG_FATAL(msg)                                                 \
  MCPHOST_LOG_AT(mcphost::logging::Level::Fatal, msg)

// Server-tagged variants
#define MCPHOST_SERVER_LOG_DEBUG(server, msg)                                  \
  MCPHOST_LOG_DEBUG(mcphost::logging::withServer(server, msg))
#define MCPHOST_SERVER_LOG_INFO(server, msg)                                   \
  MCPHOST_LOG_INFO(mcphost::logging::withServer(server, msg))
#define MCPHOST_SERVER_LOG_WARNING(server, msg)                                \
  MCPHOST_LOG_WARNING(mcphost::logging::withServer(server, msg))
#define MCPHOST_SERVER_LOG_ERROR(server, msg)                                  \
  MCPHOST_LOG_ERROR(mcphost::logging::withServer(server, msg))

#endif // MCPHOST_UTILS_LOGGING_HPP_
