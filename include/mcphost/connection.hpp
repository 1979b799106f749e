#ifndef MCPHOST_CONNECTION_HPP_
#define MCPHOST_CONNECTION_HPP_

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mcphost/transport/transport.hpp"
#include "mcphost/types.hpp"

namespace mcphost {

/**
 * @brief Lifecycle states of a server connection
 */
enum class ConnectionStatus {
  Disconnected,
  Connecting,
  Initializing,
  Ready,
  Disconnecting,
  Failed
};

/**
 * @brief Convert a connection status to a string
 */
std::string statusToString(ConnectionStatus status);

/**
 * @brief How a connection's process went away during shutdown
 */
enum class ShutdownOutcome {
  Graceful, ///< Exited on its own after its input was closed
  Forced    ///< Had to be terminated
};

/**
 * @brief Per-connection protocol settings
 */
struct ConnectionConfig {
  /**
   * @brief Identity sent in the initialize request
   */
  types::ClientInfo client_info;

  /**
   * @brief Protocol version sent in the initialize request
   */
  std::string protocol_version = "2024-11-05";

  /**
   * @brief How long to wait for each response; zero waits indefinitely
   */
  std::chrono::milliseconds request_timeout = std::chrono::seconds(30);

  /**
   * @brief Reject responses whose id differs from the request's id
   */
  bool verify_response_ids = true;

  /**
   * @brief Send notifications/initialized between initialize and tools/list
   *
   * Disable for peers that answer every line they read.
   */
  bool send_initialized_notification = true;

  /**
   * @brief Tool calls slower than this are logged as warnings
   */
  std::chrono::milliseconds slow_call_threshold = std::chrono::seconds(30);
};

/**
 * @brief One named server session
 *
 * A Connection exclusively owns the transport of its server process and
 * drives the handshake:
 * - initialize with a static client identity
 * - the notifications/initialized notification, unless disabled
 * - tools/list, whose result becomes the connection's tool list
 *
 * At most one request is in flight at a time: each request is written and
 * its response read before the next request may start.
 */
class Connection {
public:
  /**
   * @brief Spawn a server and run the handshake
   *
   * @param name Server name used in logs and errors
   * @param spec How to start the server
   * @param factory Creates the transport for the spec
   * @param config Protocol settings
   * @return std::unique_ptr<Connection> A Ready connection
   * @throws SpawnException if the server process cannot be started
   * @throws InitializationException if any handshake step fails
   */
  static std::unique_ptr<Connection>
  open(const std::string &name, const types::ServerSpec &spec,
       const transport::TransportFactory &factory,
       const ConnectionConfig &config = ConnectionConfig());

  ~Connection();

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  /**
   * @brief Invoke a tool on the server
   *
   * @param tool_name Tool to call; must match a discovered tool exactly
   * @param arguments Tool arguments, forwarded unchanged
   * @return nlohmann::json The result member of the response, or the whole
   * response if the server sent neither result nor error
   * @throws ToolUnavailableException if the tool was not discovered
   * @throws RemoteErrorException if the server returned an error object
   * @throws TransportException on communication failure
   */
  nlohmann::json callTool(const std::string &tool_name,
                          const nlohmann::json &arguments);

  /**
   * @brief Return the next request id and advance the counter
   *
   * Ids start at 1 and are never reused within this connection.
   */
  int nextRequestId();

  /**
   * @brief Ready and the server process is still running
   */
  bool isReady() const;

  /**
   * @brief Close the server's input, wait, and terminate it if needed
   *
   * @param timeout How long to wait for a graceful exit
   * @return ShutdownOutcome Whether the exit was graceful or forced
   */
  ShutdownOutcome shutdown(std::chrono::milliseconds timeout);

  const std::string &name() const;
  ConnectionStatus status() const;

  /**
   * @brief Tools discovered during the handshake
   */
  const std::vector<types::Tool> &tools() const;

  /**
   * @brief Names of the discovered tools, in discovery order
   */
  std::vector<std::string> toolNames() const;

private:
  Connection(std::string name, const ConnectionConfig &config);

  void handshake();

  types::JSONRPCResponse request(const std::string &method,
                                 const nlohmann::json &params);
  void notify(const std::string &method);

  void setStatus(ConnectionStatus status);

  std::string name_;
  ConnectionConfig config_;
  std::unique_ptr<transport::Transport> transport_;
  std::atomic<ConnectionStatus> status_;
  std::vector<types::Tool> tools_;

  int next_request_id_;
  std::mutex id_mutex_;

  // Held for the write/read pair of one request
  std::mutex call_mutex_;
};

} // namespace mcphost

#endif // MCPHOST_CONNECTION_HPP_
