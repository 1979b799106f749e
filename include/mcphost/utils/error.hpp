#ifndef MCPHOST_UTILS_ERROR_HPP_
#define MCPHOST_UTILS_ERROR_HPP_

#include "mcphost/types.hpp"
#include <stdexcept>
#include <string>
#include <system_error>

namespace mcphost {

/**
 * @brief Base exception class for client errors
 *
 * This class extends std::runtime_error and carries JSON-RPC style error data
 * so every failure can be reported or forwarded in a uniform shape.
 */
class MCPHostException : public std::runtime_error {
public:
  /**
   * @brief Construct a new MCPHostException with error data
   *
   * @param error The error data
   */
  explicit MCPHostException(types::ErrorData error);

  /**
   * @brief Construct a new MCPHostException with error code and message
   *
   * @param code The error code
   * @param message The error message
   */
  explicit MCPHostException(types::ErrorCode code, const std::string &message);

  /**
   * @brief Get the error data
   *
   * @return const types::ErrorData& The error data
   */
  const types::ErrorData &error() const;

protected:
  /**
   * @brief Get mutable reference to error data for derived classes
   *
   * @return types::ErrorData& The error data
   */
  types::ErrorData &error_data();

private:
  types::ErrorData error_; ///< The error data
};

/**
 * @brief Communication failure: closed pipe, write after exit, invalid JSON
 */
class TransportException : public MCPHostException {
public:
  /**
   * @brief Construct a new TransportException
   *
   * @param message The error message
   * @param data Optional additional data
   */
  explicit TransportException(const std::string &message,
                              const nlohmann::json &data = nullptr);

  /**
   * @brief Construct a new TransportException with error code
   *
   * @param code The error code
   * @param message The error message
   * @param data Optional additional data
   */
  explicit TransportException(types::ErrorCode code, const std::string &message,
                              const nlohmann::json &data = nullptr);

  /**
   * @brief Construct a new TransportException from a std::error_code
   *
   * @param error The std::error_code
   * @param context What was being attempted
   */
  explicit TransportException(const std::error_code &error,
                              const std::string &context = "");
};

/**
 * @brief No response arrived within the configured read timeout
 */
class TimeoutException : public TransportException {
public:
  explicit TimeoutException(const std::string &message,
                            const nlohmann::json &data = nullptr);
};

/**
 * @brief The server executable could not be started
 */
class SpawnException : public MCPHostException {
public:
  explicit SpawnException(const std::string &message,
                          const nlohmann::json &data = nullptr);
};

/**
 * @brief A handshake step failed; wraps the underlying failure
 */
class InitializationException : public MCPHostException {
public:
  explicit InitializationException(const std::string &message,
                                   const nlohmann::json &data = nullptr);
};

/**
 * @brief The requested tool is not in the server's discovered tool list
 *
 * The message enumerates the tool names the server does offer.
 */
class ToolUnavailableException : public MCPHostException {
public:
  explicit ToolUnavailableException(const std::string &message,
                                    const nlohmann::json &data = nullptr);
};

/**
 * @brief The server answered with a JSON-RPC error object
 *
 * error() holds the remote code and message unchanged.
 */
class RemoteErrorException : public MCPHostException {
public:
  explicit RemoteErrorException(const types::ErrorData &remote);
};

/**
 * @brief An operation addressed a server name that is not registered
 */
class ServerNotFoundException : public MCPHostException {
public:
  explicit ServerNotFoundException(const std::string &server_name);
};

/**
 * @brief The server configuration could not be read or is invalid
 */
class ConfigException : public MCPHostException {
public:
  explicit ConfigException(const std::string &message,
                           const nlohmann::json &data = nullptr);
};

} // namespace mcphost

#endif // MCPHOST_UTILS_ERROR_HPP_
