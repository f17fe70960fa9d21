/**
 * @file argumentparser.cpp
 * @brief Реализация парсера аргументов командной строки
 *
 * @details Поддерживаются формы `--name=value` и `--name value`.
 */

#include "../include/argumentparser.hpp"

#include <algorithm>

using namespace std;

const vector<string> ArgumentParser::validLogLevels = {
    "debug", "info", "warning", "error", "critical"};

const vector<string> ArgumentParser::validLogTypes = {"console", "sync_file"};

namespace {

bool hasOption(const string &arg, const string &name) {
  return arg == name || arg.compare(0, name.size() + 1, name + "=") == 0;
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
    } else if (arg == "--deploy-test") {
      args.deploy_test = true;
    } else if (hasOption(arg, "--log-type")) {
      parseLogType(takeValue("--log-type", arg, i, argc, argv), args);
    } else if (hasOption(arg, "--config-dir")) {
      args.config_dir = takeValue("--config-dir", arg, i, argc, argv);
      if (args.config_dir.empty()) {
        throw invalid_argument("ArgumentParser: --config-dir must not be empty");
      }
    } else if (hasOption(arg, "--log-level")) {
      parseLogLevel(takeValue("--log-level", arg, i, argc, argv), args);
    } else {
      throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
    }
  }

  validateLogTypes(args.logger_types);
  return args;
}

string ArgumentParser::takeValue(const string &name, const string &arg, int &i,
                                 int argc, char **argv) {
  size_t eqPos = arg.find('=');
  if (eqPos != string::npos) {
    return arg.substr(eqPos + 1);
  }
  if (i + 1 < argc) {
    return argv[++i];
  }
  throw invalid_argument("ArgumentParser: " + name + " requires a value");
}

void ArgumentParser::parseLogType(const string &value, ParsedArgs &args) {
  string rest = value;
  size_t pos = 0;
  while ((pos = rest.find(',')) != string::npos) {
    string type = rest.substr(0, pos);
    if (!type.empty()) args.logger_types.push_back(type);
    rest.erase(0, pos + 1);
  }
  if (!rest.empty()) {
    args.logger_types.push_back(rest);
  }
  if (args.logger_types.empty()) {
    throw invalid_argument("ArgumentParser: --log-type requires a value");
  }
  args.use_cli_logging = true;
}

void ArgumentParser::parseLogLevel(const string &value, ParsedArgs &args) {
  if (find(validLogLevels.begin(), validLogLevels.end(), value) ==
      validLogLevels.end()) {
    throw invalid_argument("ArgumentParser: Invalid log level: " + value);
  }
  args.log_level = value;
  args.use_cli_logging = true;
}

void ArgumentParser::validateLogTypes(const vector<string> &types) {
  for (const auto &type : types) {
    if (find(validLogTypes.begin(), validLogTypes.end(), type) ==
        validLogTypes.end()) {
      throw invalid_argument("ArgumentParser: Invalid logger type: " + type);
    }
  }
}
