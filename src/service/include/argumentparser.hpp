/**
 * @file argumentparser.hpp
 * @brief Разбор аргументов командной строки skystation-agent
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct ParsedArgs {
  std::string config_dir = "/opt/skystation";
  std::vector<std::string> logger_types;
  std::optional<std::string> log_level;
  bool use_cli_logging = false;
  bool help_message = false;
  bool version_message = false;
  bool deploy_test = false;
};

class ArgumentParser {
 public:
  /// @throw std::invalid_argument Неизвестный аргумент или неверное значение
  ParsedArgs parse(int argc, char **argv);

  static const std::vector<std::string> validLogLevels;
  static const std::vector<std::string> validLogTypes;

 private:
  // Значение из `--name=value` или следующего аргумента
  std::string takeValue(const std::string &name, const std::string &arg,
                        int &i, int argc, char **argv);
  void parseLogType(const std::string &value, ParsedArgs &args);
  void parseLogLevel(const std::string &value, ParsedArgs &args);
  void validateLogTypes(const std::vector<std::string> &types);
};
