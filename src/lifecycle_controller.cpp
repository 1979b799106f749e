#include "mcphost/lifecycle_controller.hpp"
#include "mcphost/utils/error.hpp"
#include "mcphost/utils/logging.hpp"

namespace mcphost {

size_t ShutdownReport::failureCount() const {
  size_t count = 0;
  for (const auto &server : servers) {
    if (!server.succeeded) {
      ++count;
    }
  }
  return count;
}

bool ShutdownReport::allGraceful() const {
  for (const auto &server : servers) {
    if (!server.succeeded || server.outcome != ShutdownOutcome::Graceful) {
      return false;
    }
  }
  return true;
}

LifecycleController::LifecycleController(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

ShutdownOutcome LifecycleController::disconnect(Connection &connection,
                                                std::chrono::milliseconds timeout) {
  MCPHOST_SERVER_LOG_INFO(connection.name(), "Disconnecting");
  ShutdownOutcome outcome = connection.shutdown(timeout);
  if (outcome == ShutdownOutcome::Forced) {
    MCPHOST_SERVER_LOG_WARNING(connection.name(), "Terminated after timeout");
  } else {
    MCPHOST_SERVER_LOG_DEBUG(connection.name(), "Exited gracefully");
  }
  return outcome;
}

ShutdownOutcome LifecycleController::disconnect(Connection &connection) {
  return disconnect(connection, timeout_);
}

ShutdownReport LifecycleController::disconnectAll(Registry &registry,
                                                  std::chrono::milliseconds timeout) {
  ShutdownReport report;

  for (const auto &[name, connection] : registry.snapshot()) {
    ServerShutdownResult result;
    result.name = name;

    try {
      result.outcome = disconnect(*connection, timeout);
      result.succeeded = true;
    } catch (const MCPHostException &e) {
      MCPHOST_SERVER_LOG_ERROR(name, "Error during shutdown: " +
                                         std::string(e.what()));
      result.error = e.error();
    } catch (const std::exception &e) {
      MCPHOST_SERVER_LOG_ERROR(name, "Error during shutdown: " +
                                         std::string(e.what()));
      result.error = types::ErrorData{
          static_cast<int>(types::ErrorCode::InternalError), e.what(),
          nlohmann::json{{"server", name}}};
    }

    report.servers.push_back(std::move(result));
  }

  registry.clear();

  if (report.failureCount() > 0) {
    MCPHOST_LOG_WARNING("Shutdown finished with " +
                        std::to_string(report.failureCount()) + " error(s)");
  } else {
    MCPHOST_LOG_INFO("All servers shut down");
  }
  return report;
}

ShutdownReport LifecycleController::disconnectAll(Registry &registry) {
  return disconnectAll(registry, timeout_);
}

std::chrono::milliseconds LifecycleController::timeout() const {
  return timeout_;
}

} // namespace mcphost
