#include "mcphost/client.hpp"
#include "mcphost/utils/error.hpp"
#include "mcphost/utils/logging.hpp"

namespace mcphost {

Client::Client(ClientConfig config)
    : Client(config, transport::makeProcessTransportFactory(config.transport)) {}

Client::Client(ClientConfig config, transport::TransportFactory factory)
    : config_(std::move(config)),
      registry_(std::move(factory), config_.connection),
      lifecycle_(config_.shutdown_timeout) {}

Client::~Client() {
  if (!registry_.empty()) {
    lifecycle_.disconnectAll(registry_);
  }
}

void Client::connect(const types::ServerSpec &spec) {
  registry_.connect(spec.name, spec);
}

ConnectSummary Client::connectAll(const std::vector<types::ServerSpec> &specs) {
  ConnectSummary summary;

  for (const auto &spec : specs) {
    if (!spec.enabled) {
      MCPHOST_SERVER_LOG_INFO(spec.name, "Disabled; skipping");
      summary.skipped.push_back(spec.name);
      continue;
    }

    try {
      connect(spec);
      summary.connected.push_back(spec.name);
    } catch (const MCPHostException &e) {
      MCPHOST_SERVER_LOG_ERROR(spec.name, e.what());
      summary.failed[spec.name] = e.error();
    }
  }

  MCPHOST_LOG_INFO("Connected " + std::to_string(summary.connected.size()) +
                   " server(s), " + std::to_string(summary.failed.size()) +
                   " failed, " + std::to_string(summary.skipped.size()) +
                   " skipped");
  return summary;
}

std::vector<types::Tool> Client::listTools(const std::string &server) const {
  return registry_.listTools(server);
}

nlohmann::json Client::callTool(const std::string &server,
                                const std::string &tool,
                                const nlohmann::json &arguments) {
  return registry_.callTool(server, tool, arguments);
}

bool Client::isConnected(const std::string &server) const {
  return registry_.isConnected(server);
}

std::vector<ServerTool> Client::allTools() const { return registry_.allTools(); }

size_t Client::serverCount() const { return registry_.size(); }

size_t Client::toolCount() const { return registry_.toolCount(); }

ShutdownReport Client::disconnectAll() {
  return lifecycle_.disconnectAll(registry_);
}

Registry &Client::registry() { return registry_; }

} // namespace mcphost
