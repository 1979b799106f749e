#include "mcphost/client.hpp"
#include "mcphost/config/server_config.hpp"
#include "mcphost/utils/error.hpp"
#include "mcphost/utils/logging.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace mcphost;

namespace {

struct ToolCall {
  std::string server;
  std::string tool;
  nlohmann::json arguments = nlohmann::json::object();
};

struct Options {
  std::string config_path;
  std::optional<ToolCall> call;
};

void printUsage(const char *program) {
  std::cerr << "Usage: " << program
            << " <servers.json> [--log-level LEVEL]"
               " [--call SERVER TOOL [ARGS_JSON]]"
            << std::endl;
}

// Returns nullopt on a usage error
std::optional<Options> parseArgs(int argc, char **argv) {
  Options options;
  std::vector<std::string> args(argv + 1, argv + argc);

  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--log-level") {
      if (i + 1 >= args.size()) {
        return std::nullopt;
      }
      logging::setLevel(logging::levelFromString(args[++i]));
    } else if (args[i] == "--call") {
      if (i + 2 >= args.size()) {
        return std::nullopt;
      }
      ToolCall call;
      call.server = args[++i];
      call.tool = args[++i];
      if (i + 1 < args.size() && args[i + 1].rfind("--", 0) != 0) {
        call.arguments = nlohmann::json::parse(args[++i]);
      }
      options.call = std::move(call);
    } else if (options.config_path.empty() && args[i].rfind("--", 0) != 0) {
      options.config_path = args[i];
    } else {
      return std::nullopt;
    }
  }

  if (options.config_path.empty()) {
    return std::nullopt;
  }
  return options;
}

} // namespace

int main(int argc, char **argv) {
  logging::setLevel(logging::Level::Warning);
  logging::configureFromEnvironment();

  std::optional<Options> options;
  try {
    options = parseArgs(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    printUsage(argv[0]);
    return 1;
  }
  if (!options) {
    printUsage(argv[0]);
    return 1;
  }

  std::vector<types::ServerSpec> specs;
  try {
    specs = config::loadServerSpecs(options->config_path);
  } catch (const ConfigException &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  Client client;
  ConnectSummary summary = client.connectAll(specs);

  for (const auto &name : summary.connected) {
    std::cout << name << ":" << std::endl;
    for (const auto &tool : client.listTools(name)) {
      std::cout << "  " << tool.name;
      if (tool.description) {
        std::cout << " - " << *tool.description;
      }
      std::cout << std::endl;
    }
  }
  for (const auto &[name, error] : summary.failed) {
    std::cerr << name << ": failed to connect: " << error.message << std::endl;
  }
  for (const auto &name : summary.skipped) {
    std::cout << name << ": disabled" << std::endl;
  }

  int exit_code = 0;
  if (options->call) {
    const auto &call = *options->call;
    try {
      auto result = client.callTool(call.server, call.tool, call.arguments);
      std::cout << result.dump(2) << std::endl;
    } catch (const MCPHostException &e) {
      std::cerr << "Call failed: " << e.what() << std::endl;
      exit_code = 2;
    }
  }

  ShutdownReport report = client.disconnectAll();
  for (const auto &server : report.servers) {
    if (server.error) {
      std::cerr << server.name << ": shutdown error: " << server.error->message
                << std::endl;
    }
  }

  return exit_code;
}
