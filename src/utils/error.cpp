#include "mcphost/utils/error.hpp"

namespace mcphost {

namespace {
types::ErrorData makeErrorData(types::ErrorCode code, const std::string &message,
                               const nlohmann::json &data) {
  return {.code = static_cast<int>(code), .message = message, .data = data};
}
} // namespace

MCPHostException::MCPHostException(types::ErrorData error)
    : std::runtime_error(error.message), error_(std::move(error)) {}

MCPHostException::MCPHostException(types::ErrorCode code,
                                   const std::string &message)
    : std::runtime_error(message),
      error_({static_cast<int>(code), message, nullptr}) {}

const types::ErrorData &MCPHostException::error() const { return error_; }

types::ErrorData &MCPHostException::error_data() { return error_; }

TransportException::TransportException(const std::string &message,
                                       const nlohmann::json &data)
    : MCPHostException(
          makeErrorData(types::ErrorCode::TransportError, message, data)) {}

TransportException::TransportException(types::ErrorCode code,
                                       const std::string &message,
                                       const nlohmann::json &data)
    : MCPHostException(makeErrorData(code, message, data)) {}

TransportException::TransportException(const std::error_code &error,
                                       const std::string &context)
    : MCPHostException(makeErrorData(
          types::ErrorCode::TransportError,
          context.empty() ? error.message() : context + ": " + error.message(),
          nlohmann::json{{"errno", error.value()}})) {}

TimeoutException::TimeoutException(const std::string &message,
                                   const nlohmann::json &data)
    : TransportException(types::ErrorCode::TimeoutError, message, data) {}

SpawnException::SpawnException(const std::string &message,
                               const nlohmann::json &data)
    : MCPHostException(
          makeErrorData(types::ErrorCode::SpawnError, message, data)) {}

InitializationException::InitializationException(const std::string &message,
                                                 const nlohmann::json &data)
    : MCPHostException(
          makeErrorData(types::ErrorCode::InitializationError, message, data)) {
}

ToolUnavailableException::ToolUnavailableException(const std::string &message,
                                                   const nlohmann::json &data)
    : MCPHostException(
          makeErrorData(types::ErrorCode::ToolUnavailable, message, data)) {}

RemoteErrorException::RemoteErrorException(const types::ErrorData &remote)
    : MCPHostException(remote) {}

ServerNotFoundException::ServerNotFoundException(const std::string &server_name)
    : MCPHostException(makeErrorData(types::ErrorCode::ServerNotFound,
                                     "Server '" + server_name + "' not found",
                                     nlohmann::json{{"server", server_name}})) {}

ConfigException::ConfigException(const std::string &message,
                                 const nlohmann::json &data)
    : MCPHostException(
          makeErrorData(types::ErrorCode::ConfigError, message, data)) {}

} // namespace mcphost
