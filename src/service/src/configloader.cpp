/**
 * @file configloader.cpp
 * @brief Реализация загрузчика конфигураций из TOML- и JSON-файлов
 */

#include "../include/configloader.hpp"

#include <fstream>
#include <sstream>
#include <string_view>
#include <toml++/toml.hpp>

#include "../include/errors.hpp"

namespace {

nlohmann::json toJson(const toml::node &node) {
  if (const auto *table = node.as_table()) {
    nlohmann::json object = nlohmann::json::object();
    for (const auto &[key, value] : *table) {
      object[std::string(key.str())] = toJson(value);
    }
    return object;
  }
  if (const auto *array = node.as_array()) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto &element : *array) {
      list.push_back(toJson(element));
    }
    return list;
  }
  if (const auto *value = node.as_string()) return value->get();
  if (const auto *value = node.as_integer()) return value->get();
  if (const auto *value = node.as_floating_point()) return value->get();
  if (const auto *value = node.as_boolean()) return value->get();

  // date, time, date-time
  std::ostringstream ss;
  node.visit([&ss](const auto &v) { ss << v; });
  return ss.str();
}

}  // namespace

ConfigLoader::Format ConfigLoader::formatOf(const std::filesystem::path &filename) {
  std::error_code ec;
  auto resolved = std::filesystem::canonical(filename, ec);
  if (ec) resolved = filename;
  return resolved.extension() == ".toml" ? Format::Toml : Format::Json;
}

nlohmann::json ConfigLoader::loadFromFile(
    const std::filesystem::path &filename) const {
  return parse(readFileContents(filename), filename.string(), formatOf(filename));
}

nlohmann::json ConfigLoader::parse(const std::string &text,
                                   const std::string &origin,
                                   Format format) const {
  nlohmann::json config;
  if (format == Format::Toml) {
    try {
      config = toJson(toml::parse(std::string_view(text), std::string_view(origin)));
    } catch (const toml::parse_error &e) {
      std::stringstream ss;
      ss << "ConfigLoader: TOML parse error in " << origin << ": "
         << e.description() << " at line " << e.source().begin.line;
      throw ConfigurationError(ss.str());
    }
  } else {
    try {
      config = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &e) {
      std::stringstream ss;
      ss << "ConfigLoader: JSON parse error in " << origin << ": " << e.what()
         << " at byte " << e.byte;
      throw ConfigurationError(ss.str());
    }
  }

  if (!config.is_object()) {
    throw ConfigurationError("ConfigLoader: top level of " + origin +
                             " is not an object");
  }
  return config;
}

std::string ConfigLoader::readFileContents(
    const std::filesystem::path &filename) {
  std::ifstream file(filename, std::ios::binary);

  if (!file.is_open()) {
    throw ConfigurationError("ConfigLoader: Failed to open file " +
                             filename.string());
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw ConfigurationError("ConfigLoader: Failed to read file " +
                             filename.string());
  }
  return buffer.str();
}
