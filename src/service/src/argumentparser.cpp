/**
 * @file argumentparser.cpp
 * @brief Реализация парсера аргументов командной строки
 */

#include "../include/argumentparser.hpp"

#include <algorithm>
#include <cctype>

using namespace std;

const vector<string> ArgumentParser::validLogLevels = {
    "debug", "info", "warning", "error", "critical"};

const vector<string> ArgumentParser::validLogTypes = {"console", "sync_file"};

const unordered_map<string, size_t> &ArgumentParser::commandArity() {
  static const unordered_map<string, size_t> arity = {
      {"list", 0},   {"clusters", 0}, {"verify", 0},      {"show", 1},
      {"validate", 1}, {"create", 1}, {"update", 2},      {"set-cluster", 2},
      {"move", 2},   {"copy", 3},     {"delete", 1},      {"start", 1},
      {"stop", 1}};
  return arity;
}

namespace {

bool hasPrefix(const string &arg, const string &option) {
  return arg == option || arg.compare(0, option.size() + 1, option + "=") == 0;
}

}  // namespace

ParsedArgs ArgumentParser::parse(int argc, char **argv) {
  ParsedArgs args;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help_message = true;
    } else if (arg == "--version" || arg == "-v") {
      args.version_message = true;
    } else if (arg == "--json") {
      args.json_output = true;
    } else if (arg == "--wait") {
      args.wait = true;
    } else if (arg == "--discard-data") {
      args.discard_data = true;
    } else if (arg == "--copy-data") {
      args.copy_data = true;
    } else if (arg == "--preserve-data") {
      args.preserve_data = true;
    } else if (hasPrefix(arg, "--original")) {
      args.original_name = optionValue(arg, "--original", i, argc, argv);
    } else if (arg.compare(0, 10, "--override") == 0) {
      parseOverride(arg, args);
    } else if (hasPrefix(arg, "--log-type")) {
      parseLogType(arg, args, i, argc, argv);
    } else if (hasPrefix(arg, "--config-file")) {
      args.config_path = optionValue(arg, "--config-file", i, argc, argv);
    } else if (hasPrefix(arg, "--log-level")) {
      string level = optionValue(arg, "--log-level", i, argc, argv);
      transform(level.begin(), level.end(), level.begin(),
                [](unsigned char c) { return tolower(c); });
      if (find(validLogLevels.begin(), validLogLevels.end(), level) ==
          validLogLevels.end()) {
        throw invalid_argument("ArgumentParser: Invalid log level: " + level);
      }
      args.log_level = level;
      args.use_cli_logging = true;
    } else if (hasPrefix(arg, "--environment")) {
      args.environment = optionValue(arg, "--environment", i, argc, argv);
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
    } else if (args.command.empty()) {
      args.command = arg;
    } else {
      args.positional.push_back(arg);
    }
  }

  validateLogTypes(args.logger_types);
  if (!args.help_message && !args.version_message) {
    validateCommand(args);
  }
  return args;
}

string ArgumentParser::optionValue(const string &arg, const string &option,
                                   int &i, int argc, char **argv) const {
  size_t eqPos = arg.find('=');
  if (eqPos != string::npos) {
    string value = arg.substr(eqPos + 1);
    if (value.empty()) {
      throw invalid_argument("ArgumentParser: " + option + " requires a value");
    }
    return value;
  }
  if (i + 1 < argc) {
    return argv[++i];
  }
  throw invalid_argument("ArgumentParser: " + option + " requires a value");
}

void ArgumentParser::parseOverride(const string &arg, ParsedArgs &args) {
  size_t eqPos = arg.find('=');
  if (eqPos == string::npos) {
    throw invalid_argument(
        "ArgumentParser: Invalid override format. Use --override=key:value");
  }

  string overrideStr = arg.substr(eqPos + 1);
  size_t colonPos = overrideStr.find(':');
  if (colonPos == string::npos || colonPos == 0) {
    throw invalid_argument(
        "ArgumentParser: Invalid override format. Use key:value");
  }

  args.overrides[overrideStr.substr(0, colonPos)] =
      overrideStr.substr(colonPos + 1);
}

void ArgumentParser::parseLogType(const string &arg, ParsedArgs &args, int &i,
                                  int argc, char **argv) {
  string value = optionValue(arg, "--log-type", i, argc, argv);

  size_t pos = 0;
  while ((pos = value.find(',')) != string::npos) {
    args.logger_types.push_back(value.substr(0, pos));
    value.erase(0, pos + 1);
  }
  if (!value.empty()) {
    args.logger_types.push_back(value);
  }

  args.use_cli_logging = true;
}

void ArgumentParser::validateLogTypes(const vector<string> &types) const {
  for (const auto &type : types) {
    if (find(validLogTypes.begin(), validLogTypes.end(), type) ==
        validLogTypes.end()) {
      throw invalid_argument("ArgumentParser: Invalid logger type: " + type);
    }
  }
}

void ArgumentParser::validateCommand(const ParsedArgs &args) const {
  if (args.command.empty()) {
    throw invalid_argument("ArgumentParser: No command given");
  }

  const auto &arity = commandArity();
  auto it = arity.find(args.command);
  if (it == arity.end()) {
    throw invalid_argument("ArgumentParser: Unknown command: " + args.command);
  }

  // copy допускает пропуск целевого каталога
  const bool optionalBase = args.command == "copy" && args.positional.size() == 2;
  if (args.positional.size() != it->second && !optionalBase) {
    throw invalid_argument("ArgumentParser: Command '" + args.command +
                           "' expects " + to_string(it->second) +
                           " argument(s), got " +
                           to_string(args.positional.size()));
  }
}
