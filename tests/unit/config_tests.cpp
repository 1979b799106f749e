#include "mcphost/config/server_config.hpp"
#include "mcphost/utils/error.hpp"
#include "mcphost/utils/logging.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace mcphost;
using namespace mcphost::types;
using json = nlohmann::json;

// Test fixture for server configuration tests
class ServerConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    previous_handler_ = logging::setHandler(
        [this](logging::Level level, const std::string &message,
               const std::string &, int) {
          if (level == logging::Level::Warning) {
            warnings_.push_back(message);
          }
        });
  }

  void TearDown() override {
    logging::setHandler(previous_handler_);
    for (const auto &path : files_) {
      std::remove(path.c_str());
    }
  }

  std::string writeFile(const std::string &name, const std::string &content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream(path) << content;
    files_.push_back(path);
    return path;
  }

  std::vector<std::string> files_;
  std::vector<std::string> warnings_;
  logging::LogHandler previous_handler_;
};

TEST_F(ServerConfigTest, ParsesServersObject) {
  json document = {
      {"servers",
       {{{"name", "cal"}, {"command", "cal-server"}, {"args", {"--port", "0"}}},
        {{"name", "mail"},
         {"command", "mail-server"},
         {"env", {{"MAIL_TOKEN", "secret"}}},
         {"enabled", false}}}}};

  auto specs = config::parseServerSpecs(document);

  ASSERT_EQ(specs.size(), 2u);
  EXPECT_EQ(specs[0].name, "cal");
  EXPECT_EQ(specs[0].args, (std::vector<std::string>{"--port", "0"}));
  EXPECT_TRUE(specs[0].enabled);
  EXPECT_EQ(specs[1].env.at("MAIL_TOKEN"), "secret");
  EXPECT_FALSE(specs[1].enabled);
}

TEST_F(ServerConfigTest, ParsesBareArray) {
  json document = json::array({{{"name", "cal"}, {"command", "cal-server"}}});

  auto specs = config::parseServerSpecs(document);

  ASSERT_EQ(specs.size(), 1u);
  EXPECT_EQ(specs[0].command, "cal-server");
}

TEST_F(ServerConfigTest, EmptyServerListIsValid) {
  EXPECT_TRUE(config::parseServerSpecs(json{{"servers", json::array()}}).empty());
}

TEST_F(ServerConfigTest, RejectsMissingCommand) {
  json document = {{"servers", {{{"name", "cal"}}}}};

  try {
    config::parseServerSpecs(document);
    FAIL() << "Expected ConfigException";
  } catch (const ConfigException &e) {
    EXPECT_EQ(e.error().code, static_cast<int>(ErrorCode::ConfigError));
  }
}

TEST_F(ServerConfigTest, RejectsEmptyName) {
  json document = json::array({{{"name", ""}, {"command", "x"}}});

  EXPECT_THROW(config::parseServerSpecs(document), ConfigException);
}

TEST_F(ServerConfigTest, RejectsWrongTypes) {
  EXPECT_THROW(config::parseServerSpecs(json::array(
                   {{{"name", "cal"}, {"command", "x"}, {"args", "--flag"}}})),
               ConfigException);
  EXPECT_THROW(config::parseServerSpecs(json::array(
                   {{{"name", "cal"}, {"command", "x"}, {"env", {{"A", 1}}}}})),
               ConfigException);
  EXPECT_THROW(config::parseServerSpecs(json::array(
                   {{{"name", "cal"}, {"command", "x"}, {"enabled", "yes"}}})),
               ConfigException);
  EXPECT_THROW(config::parseServerSpecs(json("servers")), ConfigException);
}

TEST_F(ServerConfigTest, DuplicateNameLastWins) {
  json document = json::array({{{"name", "cal"}, {"command", "old-server"}},
                               {{"name", "mail"}, {"command", "mail-server"}},
                               {{"name", "cal"}, {"command", "new-server"}}});

  auto specs = config::parseServerSpecs(document);

  ASSERT_EQ(specs.size(), 2u);
  EXPECT_EQ(specs[0].name, "cal");
  EXPECT_EQ(specs[0].command, "new-server");
  ASSERT_EQ(warnings_.size(), 1u);
  EXPECT_NE(warnings_[0].find("[cal]"), std::string::npos);
}

TEST_F(ServerConfigTest, EnabledOnlyFiltersDisabled) {
  std::vector<ServerSpec> specs(3);
  specs[0].name = "a";
  specs[1].name = "b";
  specs[1].enabled = false;
  specs[2].name = "c";

  auto enabled = config::enabledOnly(specs);

  ASSERT_EQ(enabled.size(), 2u);
  EXPECT_EQ(enabled[0].name, "a");
  EXPECT_EQ(enabled[1].name, "c");
}

TEST_F(ServerConfigTest, LoadsFile) {
  std::string path = writeFile("mcphost_servers.json", R"({
    "servers": [
      {"name": "cal", "command": "cal-server", "args": ["--stdio"]}
    ]
  })");

  auto specs = config::loadServerSpecs(path);

  ASSERT_EQ(specs.size(), 1u);
  EXPECT_EQ(specs[0].args, std::vector<std::string>{"--stdio"});
}

TEST_F(ServerConfigTest, MissingFile) {
  try {
    config::loadServerSpecs(::testing::TempDir() + "does_not_exist.json");
    FAIL() << "Expected ConfigException";
  } catch (const ConfigException &e) {
    EXPECT_NE(std::string(e.what()).find("does_not_exist.json"),
              std::string::npos);
  }
}

TEST_F(ServerConfigTest, InvalidJsonFile) {
  std::string path = writeFile("mcphost_bad.json", "{\"servers\": [");

  EXPECT_THROW(config::loadServerSpecs(path), ConfigException);
}

TEST_F(ServerConfigTest, InvalidDocumentNamesFile) {
  std::string path =
      writeFile("mcphost_invalid.json", R"({"servers": [{"name": "cal"}]})");

  try {
    config::loadServerSpecs(path);
    FAIL() << "Expected ConfigException";
  } catch (const ConfigException &e) {
    EXPECT_EQ(std::string(e.what()).rfind(path, 0), 0u);
  }
}
