#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "../include/argumentparser.hpp"

namespace {

ParsedArgs parseArgs(std::vector<std::string> args) {
  args.insert(args.begin(), "nodesteward");
  std::vector<char *> argv;
  for (auto &arg : args) argv.push_back(arg.data());
  argv.push_back(nullptr);
  return ArgumentParser().parse(static_cast<int>(args.size()), argv.data());
}

}  // namespace

TEST(ArgumentParserTest, ParsesCommandAndFlags) {
  auto args = parseArgs({"--config-file=/etc/ns.json", "start", "node-1",
                         "--wait", "--json", "--environment", "development"});

  EXPECT_EQ(args.config_path, "/etc/ns.json");
  EXPECT_EQ(args.command, "start");
  ASSERT_EQ(args.positional.size(), 1u);
  EXPECT_EQ(args.positional[0], "node-1");
  EXPECT_TRUE(args.wait);
  EXPECT_TRUE(args.json_output);
  EXPECT_EQ(args.environment, "development");
}

TEST(ArgumentParserTest, UsesDefaultsWhenOmitted) {
  auto args = parseArgs({"list"});

  EXPECT_EQ(args.config_path, "nodesteward.json");
  EXPECT_EQ(args.environment, "production");
  EXPECT_FALSE(args.use_cli_logging);
  EXPECT_FALSE(args.log_level.has_value());
}

TEST(ArgumentParserTest, CollectsOverridesAndLogging) {
  auto args = parseArgs({"--override=orchestrator.start_attempts:5",
                         "--override=orchestrator.base_path:/srv/a:b",
                         "--log-type=console,sync_file", "--log-level=DEBUG",
                         "verify"});

  EXPECT_EQ(args.overrides.at("orchestrator.start_attempts"), "5");
  EXPECT_EQ(args.overrides.at("orchestrator.base_path"), "/srv/a:b");
  EXPECT_EQ(args.logger_types,
            (std::vector<std::string>{"console", "sync_file"}));
  EXPECT_EQ(args.log_level, "debug");
  EXPECT_TRUE(args.use_cli_logging);
}

TEST(ArgumentParserTest, MutationFlags) {
  auto move = parseArgs({"move", "alpha", "/srv/new", "--preserve-data"});
  EXPECT_TRUE(move.preserve_data);

  auto copy = parseArgs({"copy", "alpha", "beta", "--copy-data"});
  EXPECT_TRUE(copy.copy_data);
  EXPECT_EQ(copy.positional.size(), 2u);

  auto del = parseArgs({"delete", "alpha", "--discard-data"});
  EXPECT_TRUE(del.discard_data);

  auto validate = parseArgs({"validate", "node.json", "--original", "alpha"});
  EXPECT_EQ(validate.original_name, "alpha");
}

TEST(ArgumentParserTest, HelpSkipsCommandValidation) {
  EXPECT_TRUE(parseArgs({"--help"}).help_message);
  EXPECT_TRUE(parseArgs({"-v"}).version_message);
}

TEST(ArgumentParserTest, RejectsInvalidInput) {
  EXPECT_THROW(parseArgs({}), std::invalid_argument);
  EXPECT_THROW(parseArgs({"explode"}), std::invalid_argument);
  EXPECT_THROW(parseArgs({"start"}), std::invalid_argument);
  EXPECT_THROW(parseArgs({"list", "extra"}), std::invalid_argument);
  EXPECT_THROW(parseArgs({"copy", "alpha"}), std::invalid_argument);
  EXPECT_THROW(parseArgs({"--unknown", "list"}), std::invalid_argument);
  EXPECT_THROW(parseArgs({"--log-level=loud", "list"}), std::invalid_argument);
  EXPECT_THROW(parseArgs({"--log-type=syslog", "list"}), std::invalid_argument);
  EXPECT_THROW(parseArgs({"--override=novalue", "list"}), std::invalid_argument);
  EXPECT_THROW(parseArgs({"list", "--config-file"}), std::invalid_argument);
}

TEST(ArgumentParserTest, CommandTableCoversAllCommands) {
  const auto &arity = ArgumentParser::commandArity();
  for (const char *command : {"list", "clusters", "verify", "show", "validate",
                              "create", "update", "set-cluster", "move", "copy",
                              "delete", "start", "stop"}) {
    EXPECT_EQ(arity.count(command), 1u) << command;
  }
}
