#ifndef MCPHOST_UTILS_JSON_UTILS_HPP_
#define MCPHOST_UTILS_JSON_UTILS_HPP_

#include "mcphost/types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace mcphost {
namespace json_utils {

/**
 * @brief Validate JSON against a schema
 *
 * @param json The JSON value to validate
 * @param schema The JSON schema to validate against
 * @param error_msg Optional output parameter for error message
 * @return true if validation succeeded, false otherwise
 */
bool validate(const nlohmann::json &json, const nlohmann::json &schema,
              std::string *error_msg = nullptr);

/**
 * @brief Parse a JSON string
 *
 * @param json_str The JSON string to parse
 * @return nlohmann::json The parsed JSON
 * @throws TransportException if parsing fails
 */
nlohmann::json parse(const std::string &json_str);

/**
 * @brief Encode a request as one wire line
 *
 * Keys are written in the order jsonrpc, id, method, params without
 * insignificant whitespace, followed by a single newline.
 *
 * @param request The request to encode
 * @return std::string The newline-terminated line
 */
std::string encodeRequest(const types::JSONRPCRequest &request);

/**
 * @brief Encode a notification as one wire line
 *
 * @param notification The notification to encode
 * @return std::string The newline-terminated line
 */
std::string encodeNotification(const types::JSONRPCNotification &notification);

/**
 * @brief Decode one received line into a response
 *
 * Only the envelope is checked: the line must be a JSON object carrying
 * jsonrpc and id. A malformed error member is kept with a generic message
 * rather than rejected.
 *
 * @param line The received line, with or without its newline
 * @return types::JSONRPCResponse The decoded response
 * @throws TransportException if the line is not valid JSON or lacks the
 * envelope (code ProtocolError)
 */
types::JSONRPCResponse decodeResponse(const std::string &line);

} // namespace json_utils
} // namespace mcphost

#endif // MCPHOST_UTILS_JSON_UTILS_HPP_
