#include <gtest/gtest.h>

#include <fstream>
#include <map>

#include "noted/config/config.hpp"
#include "test_helpers.hpp"

using namespace noted::config;
using namespace noted::test;
using noted::ErrorCode;

namespace {

Config::EnvLookup fakeEnvironment(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

}  // namespace

class ConfigTest : public TempDirTest {};

TEST_F(ConfigTest, Defaults) {
  Config config;

  EXPECT_EQ(config.server.address, "0.0.0.0");
  EXPECT_EQ(config.server.port, 8081);
  EXPECT_EQ(config.server.threads, 0u);
  EXPECT_EQ(config.server.body_limit, 1024u * 1024u);
  EXPECT_EQ(config.server.read_timeout_seconds, 60);
  EXPECT_EQ(config.database.path, std::filesystem::path("./notes.db"));
  EXPECT_EQ(config.database.pool_size, 4u);
  EXPECT_EQ(config.database.journal_mode, "WAL");
  EXPECT_TRUE(config.database.create_schema);
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_TRUE(config.logging.file.empty());
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, LoadFromString) {
  Config config;
  auto result = config.loadFromString(R"(
[server]
address = "127.0.0.1"
port = 9090
threads = 2
body_limit = 4096
read_timeout_seconds = 5

[database]
path = "/tmp/other.db"
pool_size = 8
busy_timeout_ms = 100
acquire_timeout_ms = 200
journal_mode = "delete"
create_schema = false

[logging]
level = "debug"
file = "/tmp/noted.log"
)");

  ASSERT_OK(result);
  EXPECT_EQ(config.server.address, "127.0.0.1");
  EXPECT_EQ(config.server.port, 9090);
  EXPECT_EQ(config.server.threads, 2u);
  EXPECT_EQ(config.server.body_limit, 4096u);
  EXPECT_EQ(config.server.read_timeout_seconds, 5);
  EXPECT_EQ(config.database.path, std::filesystem::path("/tmp/other.db"));
  EXPECT_EQ(config.database.pool_size, 8u);
  EXPECT_EQ(config.database.busy_timeout_ms, 100);
  EXPECT_EQ(config.database.acquire_timeout_ms, 200);
  EXPECT_EQ(config.database.journal_mode, "DELETE");
  EXPECT_FALSE(config.database.create_schema);
  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_EQ(config.logging.file, std::filesystem::path("/tmp/noted.log"));
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
  Config config;
  ASSERT_OK(config.loadFromString("[server]\nport = 8000\n"));

  EXPECT_EQ(config.server.port, 8000);
  EXPECT_EQ(config.server.address, "0.0.0.0");
  EXPECT_EQ(config.database.path, std::filesystem::path("./notes.db"));
}

TEST_F(ConfigTest, MalformedTomlIsConfigError) {
  Config config;
  EXPECT_ERROR(config.loadFromString("[server\nport = "), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, OutOfRangePortInFile) {
  Config config;
  EXPECT_ERROR(config.loadFromString("[server]\nport = 70000\n"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, LoadFromFile) {
  auto path = temp_dir_ / "noted.toml";
  {
    std::ofstream file(path);
    file << "[database]\npath = \"" << (temp_dir_ / "data.db").string() << "\"\n";
  }

  Config config;
  ASSERT_OK(config.load(path));
  EXPECT_EQ(config.database.path, temp_dir_ / "data.db");
  EXPECT_EQ(config.sourcePath(), path);
}

TEST_F(ConfigTest, LoadMissingFile) {
  Config config;
  EXPECT_ERROR(config.load(temp_dir_ / "missing.toml"), ErrorCode::kConfigError);
  EXPECT_TRUE(config.sourcePath().empty());
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
  Config config;
  ASSERT_OK(config.loadFromString("[server]\nport = 9000\n[logging]\nlevel = \"warn\"\n"));

  auto env = fakeEnvironment({
    {"NOTED_PORT", "9100"},
    {"NOTED_LOG", "trace"},
    {"NOTED_DATABASE", "/var/lib/noted/notes.db"},
    {"NOTED_ADDRESS", "127.0.0.1"},
  });
  ASSERT_OK(config.applyEnvironment(env));

  EXPECT_EQ(config.server.port, 9100);
  EXPECT_EQ(config.logging.level, "trace");
  EXPECT_EQ(config.database.path, std::filesystem::path("/var/lib/noted/notes.db"));
  EXPECT_EQ(config.server.address, "127.0.0.1");
}

TEST_F(ConfigTest, EnvironmentRejectsBadPort) {
  Config config;
  EXPECT_ERROR(config.applyEnvironment(fakeEnvironment({{"NOTED_PORT", "80a"}})),
               ErrorCode::kConfigError);
  EXPECT_ERROR(config.applyEnvironment(fakeEnvironment({{"NOTED_PORT", "0"}})),
               ErrorCode::kConfigError);
  EXPECT_EQ(config.server.port, 8081);
}

TEST_F(ConfigTest, EmptyEnvironmentChangesNothing) {
  Config config;
  ASSERT_OK(config.applyEnvironment(fakeEnvironment({})));
  EXPECT_EQ(config.server.port, 8081);
  EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, ResolveEnvVar) {
  auto env = fakeEnvironment({{"NOTES_HOME", "/home/me/notes.db"}});

  EXPECT_EQ(Config::resolveEnvVar("env:NOTES_HOME", env), "/home/me/notes.db");
  EXPECT_EQ(Config::resolveEnvVar("env:UNSET", env), "");
  EXPECT_EQ(Config::resolveEnvVar("plain.db", env), "plain.db");
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
  {
    Config config;
    config.server.port = 0;
    EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);
  }
  {
    Config config;
    config.database.pool_size = 0;
    EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);
  }
  {
    Config config;
    config.database.path.clear();
    EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);
  }
  {
    Config config;
    config.database.journal_mode = "SIDEWAYS";
    EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);
  }
  {
    Config config;
    config.logging.level = "loud";
    EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);
  }
  {
    Config config;
    config.server.read_timeout_seconds = 0;
    EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);
  }
}
