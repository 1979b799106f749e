#ifndef MCPHOST_CLIENT_HPP_
#define MCPHOST_CLIENT_HPP_

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "mcphost/connection.hpp"
#include "mcphost/lifecycle_controller.hpp"
#include "mcphost/registry.hpp"
#include "mcphost/transport/process_transport.hpp"
#include "mcphost/types.hpp"

namespace mcphost {

/**
 * @brief Settings for a Client
 */
struct ClientConfig {
  ConnectionConfig connection;           ///< Applied to every connection
  transport::TransportOptions transport; ///< Process handling
  std::chrono::milliseconds shutdown_timeout =
      LifecycleController::kDefaultTimeout; ///< Graceful exit wait per server
};

/**
 * @brief Outcome of connecting a batch of servers
 */
struct ConnectSummary {
  std::vector<std::string> connected; ///< Servers that became ready
  std::vector<std::string> skipped;   ///< Disabled servers
  std::map<std::string, types::ErrorData> failed; ///< Failures by server name

  bool allConnected() const { return failed.empty(); }
};

/**
 * @brief MCP host client
 *
 * The Client class provides a high-level API over a set of named MCP
 * servers, each running as a child process. It owns the registry of
 * connections and shuts every remaining server down when destroyed.
 */
class Client {
public:
  /**
   * @brief Construct a Client that spawns servers as child processes
   *
   * @param config Client settings
   */
  explicit Client(ClientConfig config = ClientConfig());

  /**
   * @brief Construct a Client with a custom transport factory
   *
   * @param config Client settings
   * @param factory Creates the transport for each server
   */
  Client(ClientConfig config, transport::TransportFactory factory);

  /**
   * @brief Destroy the Client, disconnecting any remaining servers
   */
  ~Client();

  Client(const Client &) = delete;
  Client &operator=(const Client &) = delete;

  /**
   * @brief Connect a server under its spec name
   *
   * @throws SpawnException if the server cannot be started
   * @throws InitializationException if the handshake fails
   */
  void connect(const types::ServerSpec &spec);

  /**
   * @brief Connect every enabled server, continuing past failures
   *
   * @param specs Servers to connect
   * @return ConnectSummary Which servers connected, were skipped or failed
   */
  ConnectSummary connectAll(const std::vector<types::ServerSpec> &specs);

  /**
   * @brief Get the tools discovered on a server
   *
   * @throws ServerNotFoundException if the server is not connected
   */
  std::vector<types::Tool> listTools(const std::string &server) const;

  /**
   * @brief Call a tool on a server
   *
   * @param server Server name
   * @param tool Tool name
   * @param arguments Tool arguments
   * @return nlohmann::json The tool result
   */
  nlohmann::json callTool(const std::string &server, const std::string &tool,
                          const nlohmann::json &arguments =
                              nlohmann::json::object());

  /**
   * @brief Check if a server is connected and running
   */
  bool isConnected(const std::string &server) const;

  /**
   * @brief Every discovered tool with the server offering it
   */
  std::vector<ServerTool> allTools() const;

  size_t serverCount() const;
  size_t toolCount() const;

  /**
   * @brief Shut down every server
   *
   * @return ShutdownReport Per-server outcome
   */
  ShutdownReport disconnectAll();

  /**
   * @brief Access the underlying registry
   */
  Registry &registry();

private:
  ClientConfig config_;
  Registry registry_;
  LifecycleController lifecycle_;
};

} // namespace mcphost

#endif // MCPHOST_CLIENT_HPP_
