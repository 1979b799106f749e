#include "mcphost/connection.hpp"
#include "mcphost/utils/error.hpp"
#include "mcphost/utils/json_utils.hpp"
#include "mcphost/utils/logging.hpp"

#include <algorithm>

namespace mcphost {

namespace {
std::string joinNames(const std::vector<std::string> &names) {
  std::string joined;
  for (const auto &name : names) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += name;
  }
  return joined;
}

std::string trimNewline(const std::string &line) {
  if (!line.empty() && line.back() == '\n') {
    return line.substr(0, line.size() - 1);
  }
  return line;
}

long long millis(std::chrono::steady_clock::duration duration) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration)
      .count();
}
} // namespace

std::string statusToString(ConnectionStatus status) {
  switch (status) {
  case ConnectionStatus::Disconnected:
    return "Disconnected";
  case ConnectionStatus::Connecting:
    return "Connecting";
  case ConnectionStatus::Initializing:
    return "Initializing";
  case ConnectionStatus::Ready:
    return "Ready";
  case ConnectionStatus::Disconnecting:
    return "Disconnecting";
  case ConnectionStatus::Failed:
    return "Failed";
  default:
    return "Unknown";
  }
}

Connection::Connection(std::string name, const ConnectionConfig &config)
    : name_(std::move(name)), config_(config),
      status_(ConnectionStatus::Disconnected), next_request_id_(1) {}

Connection::~Connection() {
  if (status_ == ConnectionStatus::Ready) {
    MCPHOST_SERVER_LOG_DEBUG(name_, "Releasing connection without shutdown");
  }
}

std::unique_ptr<Connection>
Connection::open(const std::string &name, const types::ServerSpec &spec,
                 const transport::TransportFactory &factory,
                 const ConnectionConfig &config) {
  std::unique_ptr<Connection> connection(new Connection(name, config));
  connection->setStatus(ConnectionStatus::Connecting);

  try {
    connection->transport_ = factory(spec);
  } catch (const SpawnException &e) {
    connection->setStatus(ConnectionStatus::Failed);
    MCPHOST_SERVER_LOG_ERROR(name, e.what());
    throw;
  } catch (const std::exception &e) {
    connection->setStatus(ConnectionStatus::Failed);
    MCPHOST_SERVER_LOG_ERROR(name, e.what());
    throw SpawnException("Failed to spawn MCP server '" + name +
                             "': " + e.what(),
                         nlohmann::json{{"server", name}});
  }

  if (!connection->transport_) {
    connection->setStatus(ConnectionStatus::Failed);
    throw SpawnException("Failed to spawn MCP server '" + name +
                             "': no transport created",
                         nlohmann::json{{"server", name}});
  }

  connection->setStatus(ConnectionStatus::Initializing);

  try {
    connection->handshake();
  } catch (const MCPHostException &e) {
    connection->setStatus(ConnectionStatus::Failed);
    MCPHOST_SERVER_LOG_ERROR(name, "Initialization failed: " +
                                       std::string(e.what()));
    throw InitializationException(
        "Failed to initialize server '" + name + "': " + e.what(),
        nlohmann::json{{"server", name}, {"cause", e.error()}});
  } catch (const std::exception &e) {
    connection->setStatus(ConnectionStatus::Failed);
    MCPHOST_SERVER_LOG_ERROR(name, "Initialization failed: " +
                                       std::string(e.what()));
    throw InitializationException("Failed to initialize server '" + name +
                                      "': " + e.what(),
                                  nlohmann::json{{"server", name}});
  }

  connection->setStatus(ConnectionStatus::Ready);
  MCPHOST_SERVER_LOG_INFO(name, "Connected with " +
                                    std::to_string(connection->tools_.size()) +
                                    " tools");
  return connection;
}

void Connection::handshake() {
  nlohmann::json params = {
      {"protocolVersion", config_.protocol_version},
      {"capabilities", nlohmann::json::object()},
      {"clientInfo",
       {{"name", config_.client_info.name},
        {"version", config_.client_info.version}}}};

  // Only arrival matters; the content is not negotiated
  auto init = request("initialize", params);
  if (init.error) {
    MCPHOST_SERVER_LOG_WARNING(name_, "initialize returned an error: " +
                                          init.error->message);
  } else if (init.result && init.result->is_object() &&
             init.result->contains("serverInfo") &&
             (*init.result)["serverInfo"].is_object()) {
    const auto &info = (*init.result)["serverInfo"];
    MCPHOST_SERVER_LOG_DEBUG(name_, "Server identifies as " +
                                        info.value("name", "?") + " " +
                                        info.value("version", "?"));
  }

  if (config_.send_initialized_notification) {
    notify("notifications/initialized");
  }

  auto listed = request("tools/list", nlohmann::json::object());

  tools_.clear();
  if (!listed.result || !listed.result->is_object() ||
      !listed.result->contains("tools") ||
      !(*listed.result)["tools"].is_array()) {
    MCPHOST_SERVER_LOG_WARNING(name_,
                               "tools/list returned no tool array; no tools");
    return;
  }

  for (const auto &entry : (*listed.result)["tools"]) {
    if (!entry.is_object() || !entry.contains("name") ||
        !entry["name"].is_string()) {
      MCPHOST_SERVER_LOG_WARNING(name_, "Ignoring malformed tool descriptor: " +
                                            entry.dump());
      continue;
    }
    tools_.push_back(entry.get<types::Tool>());
  }

  MCPHOST_SERVER_LOG_DEBUG(name_, "Tools: " + joinNames(toolNames()));
}

nlohmann::json Connection::callTool(const std::string &tool_name,
                                    const nlohmann::json &arguments) {
  if (status() != ConnectionStatus::Ready) {
    throw TransportException("Server '" + name_ + "' is not ready (status: " +
                                 statusToString(status()) + ")",
                             nlohmann::json{{"server", name_}});
  }

  auto names = toolNames();
  if (std::find(names.begin(), names.end(), tool_name) == names.end()) {
    throw ToolUnavailableException(
        "Tool '" + tool_name + "' not available on server '" + name_ +
            "'. Available tools: [" + joinNames(names) + "]",
        nlohmann::json{
            {"server", name_}, {"tool", tool_name}, {"available", names}});
  }

  MCPHOST_SERVER_LOG_INFO(name_, "Calling tool '" + tool_name + "'");

  const auto started = std::chrono::steady_clock::now();
  auto response =
      request("tools/call", {{"name", tool_name}, {"arguments", arguments}});
  const auto elapsed = std::chrono::steady_clock::now() - started;

  if (elapsed > config_.slow_call_threshold) {
    MCPHOST_SERVER_LOG_WARNING(name_, "Tool '" + tool_name + "' took " +
                                          std::to_string(millis(elapsed)) +
                                          "ms (slow)");
  } else {
    MCPHOST_SERVER_LOG_DEBUG(name_, "Tool '" + tool_name + "' completed in " +
                                        std::to_string(millis(elapsed)) + "ms");
  }

  if (response.result) {
    return *response.result;
  }

  if (response.error) {
    MCPHOST_SERVER_LOG_WARNING(name_, "Tool '" + tool_name +
                                          "' failed: " + response.error->message);
    throw RemoteErrorException(*response.error);
  }

  // Neither result nor error: hand back the whole message
  return response.raw;
}

int Connection::nextRequestId() {
  std::lock_guard<std::mutex> lock(id_mutex_);
  return next_request_id_++;
}

bool Connection::isReady() const {
  return status_ == ConnectionStatus::Ready && transport_ &&
         transport_->isAlive();
}

ShutdownOutcome Connection::shutdown(std::chrono::milliseconds timeout) {
  if (!transport_) {
    setStatus(ConnectionStatus::Disconnected);
    return ShutdownOutcome::Graceful;
  }

  setStatus(ConnectionStatus::Disconnecting);
  ShutdownOutcome outcome = ShutdownOutcome::Graceful;

  try {
    if (!transport_->closeStdinThenWait(timeout)) {
      MCPHOST_SERVER_LOG_WARNING(name_, "Server did not exit within " +
                                            std::to_string(timeout.count()) +
                                            "ms; terminating");
      transport_->terminate();
      outcome = ShutdownOutcome::Forced;
    }
  } catch (const std::exception &) {
    setStatus(ConnectionStatus::Failed);
    throw;
  }

  setStatus(ConnectionStatus::Disconnected);
  return outcome;
}

const std::string &Connection::name() const { return name_; }

ConnectionStatus Connection::status() const { return status_; }

const std::vector<types::Tool> &Connection::tools() const { return tools_; }

std::vector<std::string> Connection::toolNames() const {
  std::vector<std::string> names;
  names.reserve(tools_.size());
  for (const auto &tool : tools_) {
    names.push_back(tool.name);
  }
  return names;
}

types::JSONRPCResponse Connection::request(const std::string &method,
                                           const nlohmann::json &params) {
  std::lock_guard<std::mutex> lock(call_mutex_);

  types::JSONRPCRequest outgoing;
  outgoing.id = nextRequestId();
  outgoing.method = method;
  outgoing.params = params;

  const std::string line = json_utils::encodeRequest(outgoing);
  MCPHOST_SERVER_LOG_DEBUG(name_, "-> " + trimNewline(line));
  transport_->writeLine(line);

  const std::string reply = transport_->readLine(config_.request_timeout);
  MCPHOST_SERVER_LOG_DEBUG(name_, "<- " + reply);

  auto response = json_utils::decodeResponse(reply);
  if (config_.verify_response_ids && response.id != outgoing.id) {
    throw TransportException(
        types::ErrorCode::ProtocolError,
        "Response id " + response.id.dump() + " does not match request id " +
            std::to_string(outgoing.id),
        nlohmann::json{{"server", name_}, {"method", method}});
  }

  return response;
}

void Connection::notify(const std::string &method) {
  std::lock_guard<std::mutex> lock(call_mutex_);

  types::JSONRPCNotification notification;
  notification.method = method;

  const std::string line = json_utils::encodeNotification(notification);
  MCPHOST_SERVER_LOG_DEBUG(name_, "-> " + trimNewline(line));
  transport_->writeLine(line);
}

void Connection::setStatus(ConnectionStatus status) { status_ = status; }

} // namespace mcphost
