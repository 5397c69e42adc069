#include <gtest/gtest.h>

#include <fstream>
#include <map>

#include "noted/app/application.hpp"
#include "test_helpers.hpp"

using namespace noted::app;
using namespace noted::test;
using noted::ErrorCode;
using noted::config::Config;

namespace {

Config::EnvLookup environment(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

}  // namespace

class ApplicationTest : public TempDirTest {
 protected:
  std::filesystem::path writeConfig(const std::string& text) {
    auto path = temp_dir_ / "noted.toml";
    std::ofstream file(path);
    file << text;
    return path;
  }
};

TEST_F(ApplicationTest, CommandLineOverridesEnvironmentAndFile) {
  CommandLineOptions options;
  options.config_file = writeConfig("[server]\nport = 9000\naddress = \"10.0.0.1\"\n").string();
  options.port = 9200;
  options.no_create_schema = true;

  auto config = Application::resolveConfig(options, environment({{"NOTED_PORT", "9100"},
                                                                {"NOTED_ADDRESS", "127.0.0.1"}}));
  ASSERT_OK(config);
  EXPECT_EQ(config->server.port, 9200);
  EXPECT_EQ(config->server.address, "127.0.0.1");
  EXPECT_FALSE(config->database.create_schema);
}

TEST_F(ApplicationTest, EnvironmentOverridesFile) {
  CommandLineOptions options;
  options.config_file = writeConfig("[logging]\nlevel = \"warn\"\n").string();

  auto config = Application::resolveConfig(options, environment({{"NOTED_LOG", "debug"}}));
  ASSERT_OK(config);
  EXPECT_EQ(config->logging.level, "debug");
}

TEST_F(ApplicationTest, MissingExplicitConfigFails) {
  CommandLineOptions options;
  options.config_file = (temp_dir_ / "absent.toml").string();

  EXPECT_ERROR(Application::resolveConfig(options, environment({})), ErrorCode::kConfigError);
}

TEST_F(ApplicationTest, InvalidResultFailsValidation) {
  CommandLineOptions options;
  options.log_level = "shouty";

  EXPECT_ERROR(Application::resolveConfig(options, environment({})), ErrorCode::kConfigError);
}

TEST_F(ApplicationTest, CommandLinePathsAndThreads) {
  CommandLineOptions options;
  options.database = (temp_dir_ / "cli.db").string();
  options.log_file = (temp_dir_ / "noted.log").string();
  options.threads = 3;

  auto config = Application::resolveConfig(options, environment({{"NOTED_DATABASE", "/env.db"}}));
  ASSERT_OK(config);
  EXPECT_EQ(config->database.path, temp_dir_ / "cli.db");
  EXPECT_EQ(config->logging.file, temp_dir_ / "noted.log");
  EXPECT_EQ(config->server.threads, 3u);
}
