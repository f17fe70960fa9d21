#include "../include/templateprocessor.hpp"

#include <cstdlib>
#include <cstring>

#include "../include/configloader.hpp"
#include "../include/errors.hpp"

using namespace std;

namespace {

string trim(const string &s) {
  const auto first = s.find_first_not_of(" \t");
  if (first == string::npos) return "";
  const auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

}  // namespace

TemplateProcessor::TemplateProcessor(map<string, string> globals)
    : globals_(std::move(globals)) {}

TemplateProcessor TemplateProcessor::fromGlobalsFile(
    const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return TemplateProcessor();

  auto doc = ConfigLoader().loadFromFile(path);
  map<string, string> globals;
  for (auto &[key, value] : doc.items()) {
    if (value.is_string()) {
      globals[key] = value.get<string>();
    } else if (value.is_number() || value.is_boolean()) {
      globals[key] = value.dump();
    } else {
      throw ConfigurationError("globals file " + path.string() +
                               ": value of '" + key + "' is not a scalar");
    }
  }
  return TemplateProcessor(std::move(globals));
}

void TemplateProcessor::process(nlohmann::json &config) const {
  walkJson(config, [this](string &value) {
    resolveEnvironment(value);
    resolveGlobals(value);
  });
}

void TemplateProcessor::walkJson(
    nlohmann::json &node, const function<void(string &)> &func) const {
  if (node.is_object()) {
    for (auto &[key, value] : node.items()) {
      walkJson(value, func);
    }
  } else if (node.is_array()) {
    for (auto &element : node) {
      walkJson(element, func);
    }
  } else if (node.is_string()) {
    string str = node.get<string>();
    func(str);
    node = str;
  }
}

void TemplateProcessor::resolveEnvironment(std::string &value) const {
  size_t start_pos = 0;
  const string prefix = "$ENV{";

  while ((start_pos = value.find(prefix, start_pos)) != string::npos) {
    size_t end_pos = value.find('}', start_pos + prefix.length());
    if (end_pos == string::npos) break;

    string var_name = value.substr(start_pos + prefix.length(),
                                   end_pos - start_pos - prefix.length());

    if (const char *env_val = getenv(var_name.c_str())) {
      value.replace(start_pos, end_pos - start_pos + 1, env_val);
      start_pos += strlen(env_val);
    } else {
      start_pos = end_pos + 1;
    }
  }
}

void TemplateProcessor::resolveGlobals(std::string &value) const {
  size_t start_pos = 0;

  while ((start_pos = value.find("{{", start_pos)) != string::npos) {
    size_t end_pos = value.find("}}", start_pos + 2);
    if (end_pos == string::npos) break;

    const string name = trim(value.substr(start_pos + 2, end_pos - start_pos - 2));
    auto it = globals_.find(name);
    if (it != globals_.end()) {
      value.replace(start_pos, end_pos - start_pos + 2, it->second);
      start_pos += it->second.size();
    } else {
      start_pos = end_pos + 2;
    }
  }
}
