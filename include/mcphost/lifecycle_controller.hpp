#ifndef MCPHOST_LIFECYCLE_CONTROLLER_HPP_
#define MCPHOST_LIFECYCLE_CONTROLLER_HPP_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/connection.hpp"
#include "mcphost/registry.hpp"
#include "mcphost/types.hpp"

namespace mcphost {

/**
 * @brief Teardown result for a single server
 */
struct ServerShutdownResult {
  std::string name;                     ///< Registered server name
  bool succeeded = false;               ///< Teardown completed without error
  ShutdownOutcome outcome =
      ShutdownOutcome::Graceful;        ///< Valid when succeeded
  std::optional<types::ErrorData> error; ///< Set when teardown failed
};

/**
 * @brief Per-server results of a disconnectAll pass
 */
struct ShutdownReport {
  std::vector<ServerShutdownResult> servers;

  /**
   * @brief Number of servers whose teardown raised an error
   */
  size_t failureCount() const;

  /**
   * @brief True if every server exited on its own
   */
  bool allGraceful() const;
};

/**
 * @brief Orderly teardown of connections
 *
 * Each server gets its input closed and a grace period to exit; a server
 * still running afterwards is terminated.
 */
class LifecycleController {
public:
  static constexpr std::chrono::milliseconds kDefaultTimeout =
      std::chrono::seconds(2);

  explicit LifecycleController(
      std::chrono::milliseconds timeout = kDefaultTimeout);

  /**
   * @brief Shut down one connection
   *
   * @return ShutdownOutcome Forced if the process had to be terminated
   */
  ShutdownOutcome disconnect(Connection &connection,
                             std::chrono::milliseconds timeout);
  ShutdownOutcome disconnect(Connection &connection);

  /**
   * @brief Shut down every connection in the registry, then clear it
   *
   * Errors are logged and recorded per server; they never stop the pass.
   * The registry is empty on return.
   */
  ShutdownReport disconnectAll(Registry &registry,
                               std::chrono::milliseconds timeout);
  ShutdownReport disconnectAll(Registry &registry);

  std::chrono::milliseconds timeout() const;

private:
  std::chrono::milliseconds timeout_;
};

} // namespace mcphost

#endif // MCPHOST_LIFECYCLE_CONTROLLER_HPP_
