#ifndef MCPHOST_REGISTRY_HPP_
#define MCPHOST_REGISTRY_HPP_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mcphost/connection.hpp"
#include "mcphost/transport/transport.hpp"
#include "mcphost/types.hpp"

namespace mcphost {

/**
 * @brief A discovered tool together with the server offering it
 */
struct ServerTool {
  std::string server; ///< Registered server name
  types::Tool tool;   ///< Tool descriptor
};

/**
 * @brief Named collection of connections
 *
 * Each name maps to at most one connection. Connecting under an existing
 * name replaces the previous connection, which is released. Lookups hand out
 * shared ownership, so a call on one connection never holds the map lock.
 */
class Registry {
public:
  /**
   * @brief Construct a registry
   *
   * @param factory Creates transports for new connections
   * @param config Protocol settings applied to every connection
   */
  explicit Registry(transport::TransportFactory factory,
                    ConnectionConfig config = ConnectionConfig());

  Registry(const Registry &) = delete;
  Registry &operator=(const Registry &) = delete;

  /**
   * @brief Spawn and initialize a server, then register it under name
   *
   * On failure the registry is left unchanged.
   *
   * @throws SpawnException if the server cannot be started
   * @throws InitializationException if the handshake fails
   */
  void connect(const std::string &name, const types::ServerSpec &spec);

  /**
   * @brief Tools discovered on a server
   *
   * @throws ServerNotFoundException if name is not registered
   */
  std::vector<types::Tool> listTools(const std::string &name) const;

  /**
   * @brief Invoke a tool on a registered server
   *
   * @throws ServerNotFoundException if name is not registered
   * @see Connection::callTool
   */
  nlohmann::json callTool(const std::string &name, const std::string &tool,
                          const nlohmann::json &arguments);

  /**
   * @brief True if name is registered and its connection is ready
   */
  bool isConnected(const std::string &name) const;

  /**
   * @brief Registered server names in sorted order
   */
  std::vector<std::string> names() const;

  size_t size() const;
  bool empty() const;

  /**
   * @brief Connection registered under name, or nullptr
   */
  std::shared_ptr<Connection> find(const std::string &name) const;

  /**
   * @brief Stable copy of all registered connections
   */
  std::vector<std::pair<std::string, std::shared_ptr<Connection>>>
  snapshot() const;

  /**
   * @brief Drop every registered connection
   */
  void clear();

  /**
   * @brief Every discovered tool across all servers
   */
  std::vector<ServerTool> allTools() const;

  /**
   * @brief Total number of discovered tools across all servers
   */
  size_t toolCount() const;

private:
  std::shared_ptr<Connection> get(const std::string &name) const;

  transport::TransportFactory factory_;
  ConnectionConfig config_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Connection>> connections_;
};

} // namespace mcphost

#endif // MCPHOST_REGISTRY_HPP_
