/**
 * @file argumentparser.hpp
 * @date October 2026
 * @brief Разбор командной строки nodesteward
 *
 * @details
 * Формат: `nodesteward [options] <command> [args] [command flags]`.
 * Общие параметры допускаются в любом месте строки, первый позиционный
 * аргумент является командой.
 *
 * @code
 nodesteward --config-file=/etc/nodesteward.json start node-1 --wait
 nodesteward --override=orchestrator.start_attempts:5 list --json
 @endcode
 */

#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

struct ParsedArgs {
  std::string config_path = "nodesteward.json";
  std::unordered_map<std::string, std::string> overrides;
  std::vector<std::string> logger_types;
  std::optional<std::string> log_level;
  std::string environment = "production";
  bool use_cli_logging = false;
  bool help_message = false;
  bool version_message = false;
  bool json_output = false;

  std::string command;
  std::vector<std::string> positional;

  bool wait = false;
  bool discard_data = false;
  bool copy_data = false;
  bool preserve_data = false;
  std::optional<std::string> original_name;
};

class ArgumentParser {
 public:
  /**
   * @brief Разбирает argv
   * @throw std::invalid_argument Неизвестный параметр, неверное значение,
   *        неизвестная команда или неверное число аргументов команды
   */
  ParsedArgs parse(int argc, char **argv);

  /// Допустимые команды и число их позиционных аргументов
  static const std::unordered_map<std::string, size_t> &commandArity();

 private:
  static const std::vector<std::string> validLogLevels;
  static const std::vector<std::string> validLogTypes;

  void parseOverride(const std::string &arg, ParsedArgs &args);
  void parseLogType(const std::string &arg, ParsedArgs &args, int &i, int argc,
                    char **argv);
  std::string optionValue(const std::string &arg, const std::string &option,
                          int &i, int argc, char **argv) const;
  void validateLogTypes(const std::vector<std::string> &types) const;
  void validateCommand(const ParsedArgs &args) const;
};
