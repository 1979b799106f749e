#ifndef MCPHOST_CONFIG_SERVER_CONFIG_HPP_
#define MCPHOST_CONFIG_SERVER_CONFIG_HPP_

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "mcphost/types.hpp"

namespace mcphost {
namespace config {

/**
 * @brief JSON schema every server configuration document must satisfy
 */
const nlohmann::json &serverConfigSchema();

/**
 * @brief Parse server specs from a configuration document
 *
 * The document is either {"servers": [...]} or a bare array of server
 * entries. When two entries share a name the later one wins.
 *
 * @param document The configuration document
 * @return std::vector<types::ServerSpec> Specs in document order
 * @throws ConfigException if the document does not match the schema
 */
std::vector<types::ServerSpec> parseServerSpecs(const nlohmann::json &document);

/**
 * @brief Read and parse a configuration file
 *
 * @throws ConfigException if the file cannot be read, is not JSON or is
 * invalid
 */
std::vector<types::ServerSpec> loadServerSpecs(const std::string &path);

/**
 * @brief Keep only the specs marked enabled
 */
std::vector<types::ServerSpec>
enabledOnly(const std::vector<types::ServerSpec> &specs);

} // namespace config
} // namespace mcphost

#endif // MCPHOST_CONFIG_SERVER_CONFIG_HPP_
