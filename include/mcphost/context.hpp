#ifndef MCPHOST_CONTEXT_HPP_
#define MCPHOST_CONTEXT_HPP_

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/client.hpp"
#include "mcphost/types.hpp"

namespace mcphost {

/**
 * @brief One tool call whose result contributes to a gathered context
 */
struct ContextSource {
  std::string key;    ///< Key of the result in the gathered data
  std::string server; ///< Server to call
  std::string tool;   ///< Tool to call
  nlohmann::json arguments = nlohmann::json::object(); ///< Tool arguments
};

/**
 * @brief Outcome of one context source
 */
struct SourceResult {
  std::string key;
  std::optional<nlohmann::json> payload; ///< Set on success
  std::optional<types::ErrorData> error; ///< Set on failure

  bool ok() const { return payload.has_value(); }
};

/**
 * @brief Data collected from several tool calls
 */
struct GatheredContext {
  nlohmann::json data = nlohmann::json::object(); ///< Successful payloads by key
  std::vector<SourceResult> results;              ///< One entry per source

  /**
   * @brief True if every source succeeded
   */
  bool complete() const;
};

/**
 * @brief Call every source in order and collect the results
 *
 * A failing source is recorded in results and left out of data; it never
 * aborts the remaining sources.
 */
GatheredContext gatherContext(Client &client,
                              const std::vector<ContextSource> &sources);

} // namespace mcphost

#endif // MCPHOST_CONTEXT_HPP_
