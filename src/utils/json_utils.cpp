#include "mcphost/utils/json_utils.hpp"
#include "mcphost/utils/error.hpp"
#include <nlohmann/json-schema.hpp>

namespace mcphost {
namespace json_utils {

namespace {
types::ErrorData errorFromJson(const nlohmann::json &error) {
  types::ErrorData data{.code = static_cast<int>(types::ErrorCode::InternalError),
                        .message = "Unknown error",
                        .data = nullptr};

  if (!error.is_object()) {
    data.message = error.is_string() ? error.get<std::string>() : error.dump();
    return data;
  }

  if (error.contains("code") && error["code"].is_number_integer()) {
    data.code = error["code"].get<int>();
  }
  if (error.contains("message") && error["message"].is_string()) {
    data.message = error["message"].get<std::string>();
  }
  if (error.contains("data")) {
    data.data = error["data"];
  }
  return data;
}

std::string toLine(const nlohmann::ordered_json &message) {
  return message.dump() + "\n";
}
} // namespace

bool validate(const nlohmann::json &json, const nlohmann::json &schema,
              std::string *error_msg) {
  try {
    nlohmann::json_schema::json_validator validator;
    validator.set_root_schema(schema);
    validator.validate(json);
    return true;
  } catch (const std::exception &e) {
    if (error_msg) {
      *error_msg = e.what();
    }
    return false;
  }
}

nlohmann::json parse(const std::string &json_str) {
  try {
    return nlohmann::json::parse(json_str);
  } catch (const nlohmann::json::parse_error &e) {
    throw TransportException("Invalid JSON: " + std::string(e.what()));
  }
}

std::string encodeRequest(const types::JSONRPCRequest &request) {
  nlohmann::ordered_json message;
  message["jsonrpc"] = request.jsonrpc;
  message["id"] = request.id;
  message["method"] = request.method;
  message["params"] = nlohmann::ordered_json(request.params);
  return toLine(message);
}

std::string encodeNotification(const types::JSONRPCNotification &notification) {
  nlohmann::ordered_json message;
  message["jsonrpc"] = notification.jsonrpc;
  message["method"] = notification.method;
  if (notification.params) {
    message["params"] = nlohmann::ordered_json(*notification.params);
  }
  return toLine(message);
}

types::JSONRPCResponse decodeResponse(const std::string &line) {
  nlohmann::json json = parse(line);

  if (!json.is_object() || !json.contains("jsonrpc") || !json.contains("id")) {
    throw TransportException(types::ErrorCode::ProtocolError,
                             "Invalid JSON-RPC response: missing envelope",
                             nlohmann::json{{"line", line}});
  }

  types::JSONRPCResponse response;
  response.jsonrpc =
      json["jsonrpc"].is_string() ? json["jsonrpc"].get<std::string>() : "";
  response.id = json["id"];
  if (json.contains("result")) {
    response.result = json["result"];
  }
  if (json.contains("error")) {
    response.error = errorFromJson(json["error"]);
  }
  response.raw = std::move(json);
  return response;
}

} // namespace json_utils
} // namespace mcphost
