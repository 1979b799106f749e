#include "mcphost/registry.hpp"
#include "mcphost/utils/error.hpp"
#include "mcphost/utils/logging.hpp"

namespace mcphost {

Registry::Registry(transport::TransportFactory factory, ConnectionConfig config)
    : factory_(std::move(factory)), config_(std::move(config)) {}

void Registry::connect(const std::string &name, const types::ServerSpec &spec) {
  MCPHOST_SERVER_LOG_INFO(name, "Connecting: " + spec.command);

  // Spawning and the handshake run outside the lock
  std::shared_ptr<Connection> connection =
      Connection::open(name, spec, factory_, config_);

  std::shared_ptr<Connection> replaced;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(name);
    if (it != connections_.end()) {
      replaced = std::move(it->second);
      it->second = std::move(connection);
    } else {
      connections_.emplace(name, std::move(connection));
    }
  }

  if (replaced) {
    MCPHOST_SERVER_LOG_WARNING(name, "Replacing existing connection");
  }
}

std::vector<types::Tool> Registry::listTools(const std::string &name) const {
  return get(name)->tools();
}

nlohmann::json Registry::callTool(const std::string &name,
                                  const std::string &tool,
                                  const nlohmann::json &arguments) {
  return get(name)->callTool(tool, arguments);
}

bool Registry::isConnected(const std::string &name) const {
  auto connection = find(name);
  return connection && connection->isReady();
}

std::vector<std::string> Registry::names() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(connections_.size());
  for (const auto &[name, connection] : connections_) {
    result.push_back(name);
  }
  return result;
}

size_t Registry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

bool Registry::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.empty();
}

std::shared_ptr<Connection> Registry::find(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(name);
  if (it == connections_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<std::pair<std::string, std::shared_ptr<Connection>>>
Registry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::pair<std::string, std::shared_ptr<Connection>>>(
      connections_.begin(), connections_.end());
}

void Registry::clear() {
  std::map<std::string, std::shared_ptr<Connection>> released;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    released.swap(connections_);
  }
  // Connections are destroyed here, outside the lock
}

std::vector<ServerTool> Registry::allTools() const {
  std::vector<ServerTool> result;
  for (const auto &[name, connection] : snapshot()) {
    for (const auto &tool : connection->tools()) {
      result.push_back(ServerTool{name, tool});
    }
  }
  return result;
}

size_t Registry::toolCount() const {
  size_t count = 0;
  for (const auto &entry : snapshot()) {
    count += entry.second->tools().size();
  }
  return count;
}

std::shared_ptr<Connection> Registry::get(const std::string &name) const {
  auto connection = find(name);
  if (!connection) {
    throw ServerNotFoundException(name);
  }
  return connection;
}

} // namespace mcphost
