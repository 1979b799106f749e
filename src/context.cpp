#include "mcphost/context.hpp"
#include "mcphost/utils/error.hpp"
#include "mcphost/utils/logging.hpp"

namespace mcphost {

bool GatheredContext::complete() const {
  for (const auto &result : results) {
    if (!result.ok()) {
      return false;
    }
  }
  return true;
}

GatheredContext gatherContext(Client &client,
                              const std::vector<ContextSource> &sources) {
  GatheredContext context;

  for (const auto &source : sources) {
    SourceResult result;
    result.key = source.key;

    try {
      auto payload = client.callTool(source.server, source.tool, source.arguments);
      context.data[source.key] = payload;
      result.payload = std::move(payload);
    } catch (const MCPHostException &e) {
      MCPHOST_SERVER_LOG_WARNING(source.server, "Context source '" + source.key +
                                                    "' failed: " + e.what());
      result.error = e.error();
    }

    context.results.push_back(std::move(result));
  }

  return context;
}

} // namespace mcphost
