#include <gtest/gtest.h>

#include "mcphost/client.hpp"
#include "mcphost/context.hpp"
#include "mcphost/utils/error.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace mcphost;
using namespace mcphost::types;
using json = nlohmann::json;

namespace {

ServerSpec mockServer(const std::string &name,
                      const std::vector<std::string> &args = {}) {
  ServerSpec spec;
  spec.name = name;
  spec.command = MCPHOST_MOCK_SERVER_PATH;
  spec.args = args;
  return spec;
}

} // namespace

// Test fixture for end-to-end client tests against a real server process
class ClientIntegrationTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.connection.request_timeout = std::chrono::seconds(10);
    config_.shutdown_timeout = std::chrono::milliseconds(500);
    config_.transport.kill_grace = std::chrono::milliseconds(200);
  }

  ClientConfig config_;
};

TEST_F(ClientIntegrationTest, DiscoversAndCallsTools) {
  Client client(config_);
  client.connect(mockServer("cal", {"--tools", "get_events,get_contacts"}));

  auto tools = client.listTools("cal");
  ASSERT_EQ(tools.size(), 2u);
  EXPECT_EQ(tools[0].name, "get_events");
  EXPECT_EQ(tools[1].name, "get_contacts");
  ASSERT_TRUE(tools[0].description.has_value());
  EXPECT_EQ(*tools[0].description, "Mock tool get_events");

  EXPECT_EQ(client.callTool("cal", "get_contacts", json::object()),
            json({{"contacts", json::array()}}));
  EXPECT_TRUE(client.isConnected("cal"));
}

TEST_F(ClientIntegrationTest, ServerSeesHandshakeInOrder) {
  Client client(config_);
  client.connect(mockServer("cal"));

  json history = client.callTool("cal", "history", json::object());

  EXPECT_EQ(history["methods"],
            json::array({"initialize", "notifications/initialized", "tools/list",
                         "tools/call"}));
}

TEST_F(ClientIntegrationTest, ArgumentsRoundTrip) {
  Client client(config_);
  client.connect(mockServer("cal"));
  json arguments = {{"query", "weekly review"}, {"limit", 3}, {"tags", {"a", "b"}}};

  EXPECT_EQ(client.callTool("cal", "echo", arguments), arguments);
}

TEST_F(ClientIntegrationTest, UnknownToolLeavesConnectionUsable) {
  Client client(config_);
  client.connect(mockServer("cal", {"--tools", "get_events"}));

  EXPECT_THROW(client.callTool("cal", "get_contacts"), ToolUnavailableException);
  EXPECT_EQ(client.callTool("cal", "get_events")["events"][0], "standup");
}

TEST_F(ClientIntegrationTest, RemoteErrorIsReported) {
  Client client(config_);
  client.connect(mockServer("cal", {"--call-error", "no such tool"}));

  try {
    client.callTool("cal", "get_events");
    FAIL() << "Expected RemoteErrorException";
  } catch (const RemoteErrorException &e) {
    EXPECT_EQ(std::string(e.what()), "no such tool");
    EXPECT_EQ(e.error().code, -32601);
  }
}

TEST_F(ClientIntegrationTest, InvalidJsonReplyIsCommunicationFailure) {
  Client client(config_);
  client.connect(mockServer("cal", {"--bad-json-on-call"}));

  EXPECT_THROW(client.callTool("cal", "get_events"), TransportException);
}

TEST_F(ClientIntegrationTest, ReplyWithoutResultReturnsWholeMessage) {
  Client client(config_);
  client.connect(mockServer("cal"));

  json reply = client.callTool("cal", "raw_reply");

  EXPECT_EQ(reply["jsonrpc"], "2.0");
  EXPECT_TRUE(reply.contains("id"));
}

TEST_F(ClientIntegrationTest, MissingToolsFieldMeansNoTools) {
  Client client(config_);
  client.connect(mockServer("cal", {"--no-tools-field"}));

  EXPECT_TRUE(client.listTools("cal").empty());
  EXPECT_TRUE(client.isConnected("cal"));
}

TEST_F(ClientIntegrationTest, ServerExitingDuringHandshake) {
  Client client(config_);

  EXPECT_THROW(client.connect(mockServer("cal", {"--exit-after-initialize"})),
               InitializationException);
  EXPECT_EQ(client.serverCount(), 0u);
  EXPECT_FALSE(client.isConnected("cal"));
}

TEST_F(ClientIntegrationTest, MismatchedIdsFailHandshake) {
  Client client(config_);

  EXPECT_THROW(client.connect(mockServer("cal", {"--wrong-id"})),
               InitializationException);
}

TEST_F(ClientIntegrationTest, SlowServerTimesOut) {
  config_.connection.request_timeout = std::chrono::milliseconds(200);
  Client client(config_);

  auto started = std::chrono::steady_clock::now();
  EXPECT_THROW(client.connect(mockServer("cal", {"--delay-ms", "3000"})),
               InitializationException);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
}

TEST_F(ClientIntegrationTest, MissingExecutableLeavesRegistryUnchanged) {
  Client client(config_);
  client.connect(mockServer("cal"));

  ServerSpec ghost;
  ghost.name = "ghost";
  ghost.command = "/nonexistent/mcp-server-binary";

  EXPECT_THROW(client.connect(ghost), SpawnException);
  EXPECT_EQ(client.serverCount(), 1u);
  EXPECT_TRUE(client.isConnected("cal"));
}

TEST_F(ClientIntegrationTest, EnvironmentOverridesReachServer) {
  Client client(config_);
  ServerSpec spec = mockServer("cal");
  spec.env["CALENDAR_TOKEN"] = "token-123";
  client.connect(spec);

  json result = client.callTool("cal", "echo_env", {{"name", "CALENDAR_TOKEN"}});

  EXPECT_EQ(result["value"], "token-123");
}

TEST_F(ClientIntegrationTest, ConnectAllWithMixedServers) {
  ServerSpec disabled = mockServer("archive");
  disabled.enabled = false;
  ServerSpec ghost;
  ghost.name = "ghost";
  ghost.command = "/nonexistent/mcp-server-binary";

  Client client(config_);
  ConnectSummary summary = client.connectAll(
      {mockServer("cal"), ghost, disabled, mockServer("mail", {"--tools", "get_inbox"})});

  EXPECT_EQ(summary.connected, (std::vector<std::string>{"cal", "mail"}));
  EXPECT_EQ(summary.skipped, std::vector<std::string>{"archive"});
  ASSERT_EQ(summary.failed.count("ghost"), 1u);
  EXPECT_EQ(summary.failed.at("ghost").code,
            static_cast<int>(ErrorCode::SpawnError));
  EXPECT_EQ(client.toolCount(), 8u);
}

TEST_F(ClientIntegrationTest, GracefulDisconnectAll) {
  Client client(config_);
  client.connect(mockServer("cal"));
  client.connect(mockServer("mail"));

  ShutdownReport report = client.disconnectAll();

  ASSERT_EQ(report.servers.size(), 2u);
  EXPECT_TRUE(report.allGraceful());
  EXPECT_EQ(client.serverCount(), 0u);
}

TEST_F(ClientIntegrationTest, HangingServerIsTerminatedWithinBound) {
  Client client(config_);
  client.connect(mockServer("stuck", {"--hang-on-eof", "--ignore-sigterm"}));
  client.connect(mockServer("cal"));

  auto started = std::chrono::steady_clock::now();
  ShutdownReport report = client.disconnectAll();
  auto elapsed = std::chrono::steady_clock::now() - started;

  ASSERT_EQ(report.servers.size(), 2u);
  EXPECT_EQ(report.failureCount(), 0u);
  EXPECT_EQ(report.servers[0].name, "cal");
  EXPECT_EQ(report.servers[0].outcome, ShutdownOutcome::Graceful);
  EXPECT_EQ(report.servers[1].name, "stuck");
  EXPECT_EQ(report.servers[1].outcome, ShutdownOutcome::Forced);
  EXPECT_LT(elapsed, std::chrono::seconds(5));
  EXPECT_EQ(client.serverCount(), 0u);
}

TEST_F(ClientIntegrationTest, GathersContextAcrossServers) {
  Client client(config_);
  client.connect(mockServer("cal"));
  client.connect(mockServer("mail", {"--call-error", "mailbox offline"}));

  auto context = gatherContext(
      client, {{.key = "events", .server = "cal", .tool = "get_events"},
               {.key = "contacts", .server = "cal", .tool = "get_contacts"},
               {.key = "inbox", .server = "mail", .tool = "get_events"}});

  EXPECT_FALSE(context.complete());
  EXPECT_EQ(context.data["contacts"], json({{"contacts", json::array()}}));
  EXPECT_EQ(context.data["events"]["events"], json::array({"standup"}));
  EXPECT_FALSE(context.data.contains("inbox"));
  ASSERT_TRUE(context.results[2].error.has_value());
  EXPECT_EQ(context.results[2].error->message, "mailbox offline");
}
