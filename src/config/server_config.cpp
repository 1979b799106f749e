#include "mcphost/config/server_config.hpp"
#include "mcphost/utils/error.hpp"
#include "mcphost/utils/json_utils.hpp"
#include "mcphost/utils/logging.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace mcphost {
namespace config {

const nlohmann::json &serverConfigSchema() {
  static const nlohmann::json schema = nlohmann::json::parse(R"({
    "$schema": "http://json-schema.org/draft-07/schema#",
    "definitions": {
      "server": {
        "type": "object",
        "required": ["name", "command"],
        "properties": {
          "name": {"type": "string", "minLength": 1},
          "command": {"type": "string", "minLength": 1},
          "args": {"type": "array", "items": {"type": "string"}},
          "env": {
            "type": "object",
            "additionalProperties": {"type": "string"}
          },
          "enabled": {"type": "boolean"}
        }
      },
      "servers": {
        "type": "array",
        "items": {"$ref": "#/definitions/server"}
      }
    },
    "oneOf": [
      {"$ref": "#/definitions/servers"},
      {
        "type": "object",
        "required": ["servers"],
        "properties": {"servers": {"$ref": "#/definitions/servers"}}
      }
    ]
  })");
  return schema;
}

std::vector<types::ServerSpec> parseServerSpecs(const nlohmann::json &document) {
  std::string error;
  if (!json_utils::validate(document, serverConfigSchema(), &error)) {
    throw ConfigException("Invalid server configuration: " + error);
  }

  const nlohmann::json &entries =
      document.is_array() ? document : document["servers"];

  std::vector<types::ServerSpec> specs;
  for (const auto &entry : entries) {
    auto spec = entry.get<types::ServerSpec>();

    auto existing =
        std::find_if(specs.begin(), specs.end(),
                     [&](const types::ServerSpec &s) { return s.name == spec.name; });
    if (existing != specs.end()) {
      MCPHOST_SERVER_LOG_WARNING(spec.name,
                                 "Duplicate server entry; the later one wins");
      *existing = std::move(spec);
    } else {
      specs.push_back(std::move(spec));
    }
  }
  return specs;
}

std::vector<types::ServerSpec> loadServerSpecs(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    throw ConfigException("Cannot open server configuration '" + path + "'",
                          nlohmann::json{{"path", path}});
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(buffer.str());
  } catch (const nlohmann::json::parse_error &e) {
    throw ConfigException("Server configuration '" + path +
                              "' is not valid JSON: " + e.what(),
                          nlohmann::json{{"path", path}});
  }

  try {
    auto specs = parseServerSpecs(document);
    MCPHOST_LOG_DEBUG("Loaded " + std::to_string(specs.size()) +
                      " server(s) from " + path);
    return specs;
  } catch (const ConfigException &e) {
    throw ConfigException(path + ": " + e.what(),
                          nlohmann::json{{"path", path}});
  }
}

std::vector<types::ServerSpec>
enabledOnly(const std::vector<types::ServerSpec> &specs) {
  std::vector<types::ServerSpec> result;
  std::copy_if(specs.begin(), specs.end(), std::back_inserter(result),
               [](const types::ServerSpec &spec) { return spec.enabled; });
  return result;
}

} // namespace config
} // namespace mcphost
