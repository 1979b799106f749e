#ifndef MCPHOST_TYPES_HPP_
#define MCPHOST_TYPES_HPP_

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mcphost {
namespace types {

/**
 * @brief Standard JSON-RPC 2.0 error codes and client-side error codes
 */
enum class ErrorCode {
  // JSON-RPC 2.0 standard error codes
  ParseError = -32700,     ///< Invalid JSON was received
  InvalidRequest = -32600, ///< The JSON sent is not a valid Request object
  MethodNotFound = -32601, ///< The method does not exist / is not available
  InvalidParams = -32602,  ///< Invalid method parameter(s)
  InternalError = -32603,  ///< Internal JSON-RPC error

  // Client-side error codes
  ProtocolError = -32000,       ///< Malformed or unexpected message
  TransportError = -32001,      ///< Pipe closed, write after close, bad JSON
  TimeoutError = -32002,        ///< No response within the read timeout
  SpawnError = -32010,          ///< Server executable could not be started
  InitializationError = -32011, ///< Handshake with the server failed
  ToolUnavailable = -32012,     ///< Tool not in the discovered tool list
  ServerNotFound = -32013,      ///< No server registered under that name
  ConfigError = -32014          ///< Invalid server configuration
};

/**
 * @brief Structure representing an error in JSON-RPC 2.0
 */
struct ErrorData {
  int code;            ///< Error code
  std::string message; ///< Error message
  nlohmann::json data; ///< Optional additional error data
};

/**
 * @brief JSON-RPC 2.0 request message
 */
struct JSONRPCRequest {
  std::string jsonrpc = "2.0";                          ///< Always "2.0"
  int id = 0;                                           ///< Request identifier
  std::string method;                                   ///< Method name
  nlohmann::json params = nlohmann::json::object();     ///< Method parameters
};

/**
 * @brief JSON-RPC 2.0 notification message (request without id)
 */
struct JSONRPCNotification {
  std::string jsonrpc = "2.0";          ///< JSON-RPC version (always "2.0")
  std::string method;                   ///< Method name
  std::optional<nlohmann::json> params; ///< Method parameters
};

/**
 * @brief JSON-RPC 2.0 response as received from a server
 *
 * A well-behaved server sets exactly one of result or error. Responses that
 * carry neither are kept as-is in raw so callers can fall back to the full
 * message.
 */
struct JSONRPCResponse {
  std::string jsonrpc = "2.0";          ///< JSON-RPC version
  nlohmann::json id;                    ///< Request identifier as received
  std::optional<nlohmann::json> result; ///< Result data
  std::optional<ErrorData> error;       ///< Error data
  nlohmann::json raw;                   ///< The complete decoded message
};

/**
 * @brief Tool definition as discovered through tools/list
 *
 * The input schema is opaque to the client. raw holds the descriptor exactly
 * as the server sent it.
 */
struct Tool {
  std::string name;                       ///< Tool name
  std::optional<std::string> description; ///< Tool description
  nlohmann::json input_schema;            ///< JSON Schema for the input
  nlohmann::json raw;                     ///< Descriptor as received
};

/**
 * @brief Client information sent in the initialize request
 */
struct ClientInfo {
  std::string name = "mcphost";  ///< Client name
  std::string version = "0.1.0"; ///< Client version
};

/**
 * @brief How to start one MCP server process
 */
struct ServerSpec {
  std::string name;                       ///< Unique server identifier
  std::string command;                    ///< Executable path or name
  std::vector<std::string> args;          ///< Command-line arguments
  std::map<std::string, std::string> env; ///< Environment overrides
  bool enabled = true;                    ///< Whether to connect at all
};

} // namespace types
} // namespace mcphost

// JSON serialization/deserialization functions
namespace nlohmann {

// ErrorCode enum serialization
template <> struct adl_serializer<mcphost::types::ErrorCode> {
  static void to_json(json &j, const mcphost::types::ErrorCode &code) {
    j = static_cast<int>(code);
  }

  static void from_json(const json &j, mcphost::types::ErrorCode &code) {
    code = static_cast<mcphost::types::ErrorCode>(j.get<int>());
  }
};

// ErrorData serialization
template <> struct adl_serializer<mcphost::types::ErrorData> {
  static void to_json(json &j, const mcphost::types::ErrorData &error) {
    j = json{{"code", error.code}, {"message", error.message}};
    if (!error.data.is_null()) {
      j["data"] = error.data;
    }
  }

  static void from_json(const json &j, mcphost::types::ErrorData &error) {
    j.at("code").get_to(error.code);
    j.at("message").get_to(error.message);
    if (j.contains("data")) {
      error.data = j["data"];
    } else {
      error.data = nullptr;
    }
  }
};

// JSONRPCRequest serialization
template <> struct adl_serializer<mcphost::types::JSONRPCRequest> {
  static void to_json(json &j, const mcphost::types::JSONRPCRequest &request) {
    j = json::object();
    j["jsonrpc"] = request.jsonrpc;
    j["id"] = request.id;
    j["method"] = request.method;
    j["params"] = request.params;
  }

  static void from_json(const json &j,
                        mcphost::types::JSONRPCRequest &request) {
    j.at("jsonrpc").get_to(request.jsonrpc);
    j.at("id").get_to(request.id);
    j.at("method").get_to(request.method);
    if (j.contains("params")) {
      request.params = j["params"];
    } else {
      request.params = json::object();
    }
  }
};

// JSONRPCNotification serialization
template <> struct adl_serializer<mcphost::types::JSONRPCNotification> {
  static void to_json(json &j,
                      const mcphost::types::JSONRPCNotification &notification) {
    j = json::object();
    j["jsonrpc"] = notification.jsonrpc;
    j["method"] = notification.method;
    if (notification.params) {
      j["params"] = *notification.params;
    }
  }

  static void from_json(const json &j,
                        mcphost::types::JSONRPCNotification &notification) {
    j.at("jsonrpc").get_to(notification.jsonrpc);
    j.at("method").get_to(notification.method);
    if (j.contains("params")) {
      notification.params = j["params"];
    }
  }
};

// Tool serialization; the raw descriptor wins when present
template <> struct adl_serializer<mcphost::types::Tool> {
  static void to_json(json &j, const mcphost::types::Tool &tool) {
    if (!tool.raw.is_null()) {
      j = tool.raw;
      return;
    }

    j = json{{"name", tool.name}};
    if (tool.description) {
      j["description"] = *tool.description;
    }
    if (!tool.input_schema.is_null()) {
      j["inputSchema"] = tool.input_schema;
    }
  }

  static void from_json(const json &j, mcphost::types::Tool &tool) {
    tool.name = j.value("name", "");
    if (j.contains("description") && j["description"].is_string()) {
      tool.description = j["description"].get<std::string>();
    } else {
      tool.description.reset();
    }
    tool.input_schema = j.value("inputSchema", json());
    tool.raw = j;
  }
};

// ServerSpec serialization
template <> struct adl_serializer<mcphost::types::ServerSpec> {
  static void to_json(json &j, const mcphost::types::ServerSpec &spec) {
    j = json{{"name", spec.name},
             {"command", spec.command},
             {"args", spec.args},
             {"env", spec.env},
             {"enabled", spec.enabled}};
  }

  static void from_json(const json &j, mcphost::types::ServerSpec &spec) {
    j.at("name").get_to(spec.name);
    j.at("command").get_to(spec.command);
    spec.args = j.value("args", std::vector<std::string>{});
    spec.env = j.value("env", std::map<std::string, std::string>{});
    spec.enabled = j.value("enabled", true);
  }
};

} // namespace nlohmann

#endif // MCPHOST_TYPES_HPP_
