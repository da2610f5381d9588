#include <gtest/gtest.h>
#include <stdlib.h>

#include <fstream>

#include "../include/configloader.hpp"
#include "../include/configmanager.hpp"
#include "../include/configvalidator.hpp"
#include "../include/enviromentprocessor.hpp"
#include "../include/orchestratorsettings.hpp"
#include "test_support.hpp"

using testsupport::TempDir;

namespace {

nlohmann::json sampleConfig() {
  return nlohmann::json::parse(R"({
    "defaults": {
      "orchestrator": {
        "base_path": "$ENV{STEWARD_TEST_ROOT}/nodes-root",
        "start_attempts": 20,
        "role_policy": "warn"
      },
      "logging": [{"type": "console", "level": "info"}]
    },
    "environments": {
      "production": {},
      "development": {
        "orchestrator": {"start_attempts": 3, "probe_port": false},
        "logging": [{"type": "console", "level": "debug"}]
      }
    }
  })");
}

}  // namespace

class ConfigManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    setenv("STEWARD_TEST_ROOT", "/var/lib/steward", 1);
    ConfigManager::instance().initializeFromJson(sampleConfig());
  }
  void TearDown() override { unsetenv("STEWARD_TEST_ROOT"); }
};

TEST_F(ConfigManagerTest, MergesEnvironmentOverDefaults) {
  auto merged = ConfigManager::instance().getMergedConfig("development");

  EXPECT_EQ(merged["orchestrator"]["start_attempts"], 3);
  EXPECT_EQ(merged["orchestrator"]["role_policy"], "warn");
  EXPECT_EQ(merged["orchestrator"]["probe_port"], false);
  EXPECT_EQ(merged["logging"][0]["level"], "debug");
}

TEST_F(ConfigManagerTest, SubstitutesEnvironmentVariables) {
  auto merged = ConfigManager::instance().getMergedConfig("production");
  EXPECT_EQ(merged["orchestrator"]["base_path"], "/var/lib/steward/nodes-root");
}

// Переопределения из командной строки сильнее секции окружения
TEST_F(ConfigManagerTest, CliOverridesWinOverEnvironment) {
  auto &mgr = ConfigManager::instance();
  mgr.applyCliOverrides({{"orchestrator.start_attempts", "7"},
                         {"orchestrator.engine_executable", "/opt/es/bin/es"},
                         {"orchestrator.allow_copy_while_running", "true"}});

  auto merged = mgr.getMergedConfig("development");
  EXPECT_EQ(merged["orchestrator"]["start_attempts"], 7);
  EXPECT_EQ(merged["orchestrator"]["engine_executable"], "/opt/es/bin/es");
  EXPECT_EQ(merged["orchestrator"]["allow_copy_while_running"], true);
}

TEST_F(ConfigManagerTest, ReinitializeDropsOverrides) {
  auto &mgr = ConfigManager::instance();
  mgr.applyCliOverrides({{"orchestrator.start_attempts", "7"}});
  mgr.initializeFromJson(sampleConfig());

  EXPECT_EQ(mgr.getMergedConfig("production")["orchestrator"]["start_attempts"], 20);
}

TEST_F(ConfigManagerTest, InvalidOverrideIsRejectedOnMerge) {
  auto &mgr = ConfigManager::instance();
  mgr.applyCliOverrides({{"orchestrator.role_policy", "maybe"}});

  EXPECT_THROW(mgr.getMergedConfig("production"), std::runtime_error);
}

TEST_F(ConfigManagerTest, UnknownEnvironmentThrows) {
  EXPECT_THROW(ConfigManager::instance().getMergedConfig("staging"),
               std::runtime_error);
}

TEST_F(ConfigManagerTest, ReloadRequiresFileSource) {
  EXPECT_THROW(ConfigManager::instance().reload(), std::runtime_error);
}

TEST_F(ConfigManagerTest, InitializesAndReloadsFromFile) {
  TempDir dir;
  const auto file = (dir.path() / "nodesteward.json").string();
  std::ofstream(file) << sampleConfig().dump();

  auto &mgr = ConfigManager::instance();
  mgr.initialize(file);
  EXPECT_TRUE(mgr.isInitialized());

  auto changed = sampleConfig();
  changed["defaults"]["orchestrator"]["start_attempts"] = 9;
  std::ofstream(file, std::ios::trunc) << changed.dump();
  mgr.reload();

  EXPECT_EQ(mgr.getMergedConfig("production")["orchestrator"]["start_attempts"], 9);
}

TEST_F(ConfigManagerTest, BrokenFileKeepsPreviousConfiguration) {
  TempDir dir;
  const auto file = (dir.path() / "nodesteward.json").string();
  std::ofstream(file) << sampleConfig().dump();

  auto &mgr = ConfigManager::instance();
  mgr.initialize(file);
  std::ofstream(file, std::ios::trunc) << "{ broken";

  EXPECT_THROW(mgr.reload(), std::runtime_error);
  EXPECT_EQ(mgr.getMergedConfig("production")["orchestrator"]["start_attempts"], 20);
}

TEST(ConfigLoaderTest, ReportsParseErrorWithFileName) {
  TempDir dir;
  const auto file = (dir.path() / "bad.json").string();
  std::ofstream(file) << "{\"a\": }";

  ConfigLoader loader;
  try {
    loader.loadFromFile(file);
    FAIL() << "expected parse error";
  } catch (const std::runtime_error &e) {
    EXPECT_NE(std::string(e.what()).find(file), std::string::npos);
  }
  EXPECT_FALSE(loader.hasLoadedFile());
  EXPECT_THROW(loader.loadFromFile(""), std::runtime_error);
  EXPECT_THROW(loader.loadFromFile((dir.path() / "absent.json").string()),
               std::runtime_error);
}

TEST(EnvironmentProcessorTest, LeavesUnknownVariablesInPlace) {
  setenv("STEWARD_TEST_A", "alpha", 1);
  unsetenv("STEWARD_TEST_MISSING");

  std::string value = "$ENV{STEWARD_TEST_A}/$ENV{STEWARD_TEST_MISSING}/$ENV{";
  EnvironmentProcessor{}.resolveVariable(value);
  EXPECT_EQ(value, "alpha/$ENV{STEWARD_TEST_MISSING}/$ENV{");

  nlohmann::json doc = {{"list", {"$ENV{STEWARD_TEST_A}", 5}}};
  EnvironmentProcessor{}.process(doc);
  EXPECT_EQ(doc["list"][0], "alpha");
  EXPECT_EQ(doc["list"][1], 5);
  unsetenv("STEWARD_TEST_A");
}

TEST(ConfigValidatorTest, RootStructure) {
  ConfigValidator validator;
  EXPECT_TRUE(validator.validateRoot(sampleConfig()));
  EXPECT_THROW(validator.validateRoot({{"defaults", {{"a", 1}}}}),
               std::runtime_error);
  EXPECT_THROW(validator.validateRoot(
                   {{"defaults", nlohmann::json::object()},
                    {"environments", nlohmann::json::object()}}),
               std::runtime_error);
}

TEST(ConfigValidatorTest, OrchestratorSection) {
  ConfigValidator validator;
  EXPECT_TRUE(validator.validateOrchestrator(
      {{"heap_limit_ratio", 0.5}, {"http_port_base", 9200}, {"probe_port", true}}));
  EXPECT_THROW(validator.validateOrchestrator({{"start_attempts", 0}}),
               std::runtime_error);
  EXPECT_THROW(validator.validateOrchestrator({{"start_attempts", "5"}}),
               std::runtime_error);
  EXPECT_THROW(validator.validateOrchestrator({{"http_port_base", 70000}}),
               std::runtime_error);
  EXPECT_THROW(validator.validateOrchestrator({{"heap_limit_ratio", 1.5}}),
               std::runtime_error);
  EXPECT_THROW(validator.validateOrchestrator({{"probe_port", "yes"}}),
               std::runtime_error);
}

TEST(ConfigValidatorTest, LoggingSection) {
  ConfigValidator validator;
  EXPECT_TRUE(validator.validateLogging(nlohmann::json::parse(
      R"([{"type": "console"}, {"type": "sync_file", "file": "a.log"}])")));
  EXPECT_THROW(validator.validateLogging(
                   nlohmann::json::parse(R"([{"type": "sync_file"}])")),
               std::runtime_error);
  EXPECT_THROW(validator.validateLogging(
                   nlohmann::json::parse(R"([{"type": "async_file"}])")),
               std::runtime_error);
  EXPECT_THROW(validator.validateLogging(nlohmann::json::object()),
               std::runtime_error);
}

TEST(OrchestratorSettingsTest, DefaultsWithoutSection) {
  auto settings = OrchestratorSettings::fromConfig(nlohmann::json::object());

  EXPECT_EQ(settings.start.attempts, 20);
  EXPECT_EQ(settings.start.interval, std::chrono::milliseconds(3000));
  EXPECT_EQ(settings.stop.attempts, 10);
  EXPECT_EQ(settings.validator.rolePolicy, RolePolicy::Warn);
  EXPECT_DOUBLE_EQ(settings.validator.heapLimitRatio, 0.75);
  EXPECT_FALSE(settings.allowCopyWhileRunning);
  EXPECT_EQ(settings.resolvedRegistryFile(), "./nodes-root/registry.json");
}

TEST(OrchestratorSettingsTest, ReadsOrchestratorSection) {
  auto settings = OrchestratorSettings::fromConfig(nlohmann::json::parse(R"({
    "orchestrator": {
      "base_path": "/srv/steward",
      "registry_file": "/etc/steward/registry.json",
      "role_policy": "reject",
      "heap_limit_ratio": 0.5,
      "stop_attempts": 4,
      "stop_interval_ms": 250,
      "validation_timeout_ms": 1000,
      "allow_copy_while_running": true
    }
  })"));

  EXPECT_EQ(settings.basePath, "/srv/steward");
  EXPECT_EQ(settings.resolvedRegistryFile(), "/etc/steward/registry.json");
  EXPECT_EQ(settings.validator.rolePolicy, RolePolicy::Reject);
  EXPECT_DOUBLE_EQ(settings.validator.heapLimitRatio, 0.5);
  EXPECT_EQ(settings.stop.attempts, 4);
  EXPECT_EQ(settings.stop.interval, std::chrono::milliseconds(250));
  EXPECT_EQ(settings.validationTimeout, std::chrono::milliseconds(1000));
  EXPECT_TRUE(settings.allowCopyWhileRunning);
  EXPECT_EQ(rolePolicyToString(settings.validator.rolePolicy), "reject");
  EXPECT_THROW(rolePolicyFromString("sometimes"), std::invalid_argument);
}
