#include "../include/commandsource.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

#include "../include/errors.hpp"
#include "sky/compositelogger.hpp"

namespace fs = std::filesystem;

namespace {

bool isBlank(const std::string &text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

std::string readAll(const fs::path &file) {
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot read " + file.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

std::string toString(CommandState state) {
  switch (state) {
    case CommandState::Pending:
      return "pending";
    case CommandState::Running:
      return "running";
    case CommandState::Done:
      return "done";
  }
  return "unknown";
}

CommandRequest CommandRequest::fromJson(const nlohmann::json &json) {
  CommandRequest request;
  request.id = json.at("command_id").get<std::string>();
  request.text = json.at("command_text").get<std::string>();
  request.authToken = json.value("auth_token", std::string());
  return request;
}

nlohmann::json CommandResult::toJson() const {
  return {{"command_id", id},
          {"command_text", text},
          {"exit_code", exitCode},
          {"stdout", stdoutText},
          {"stderr", stderrText}};
}

std::optional<std::string> readMarker(const fs::path &file) {
  std::error_code ec;
  if (!fs::exists(file, ec)) return std::nullopt;
  return readAll(file);
}

void writeMarker(const fs::path &file, const std::string &value) {
  if (file.has_parent_path()) fs::create_directories(file.parent_path());
  const fs::path tmp = file.string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot write " + tmp.string());
    }
    out << value;
  }
  fs::rename(tmp, file);
}

// ---------------------------------------------------------------------------

LocalCommandFileSource::LocalCommandFileSource(fs::path file)
    : file_(std::move(file)) {}

std::optional<CommandRequest> LocalCommandFileSource::poll() {
  std::error_code ec;
  if (!fs::is_regular_file(file_, ec)) return std::nullopt;

  std::string text = readAll(file_);
  if (isBlank(text)) return std::nullopt;

  // Команда принята: очищаем файл
  std::ofstream truncate(file_, std::ios::trunc);
  if (!truncate) {
    throw std::runtime_error("cannot truncate " + file_.string());
  }

  sky::CompositeLogger::instance().info("Command read from " + file_.string());
  return CommandRequest{file_.filename().string(), std::move(text), ""};
}

// ---------------------------------------------------------------------------

RemoteCommandFileSource::RemoteCommandFileSource(
    std::unique_ptr<RemoteSource> remote, fs::path commandFolder)
    : remote_(std::move(remote)), commandFolder_(std::move(commandFolder)) {}

bool RemoteCommandFileSource::isCommandFile(const std::string &name) {
  static const std::string prefix = "command_";
  static const std::string suffix = ".txt";
  return name.size() > prefix.size() + suffix.size() &&
         name.compare(0, prefix.size(), prefix) == 0 &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<CommandRequest> RemoteCommandFileSource::poll() {
  std::vector<std::string> commands;
  for (const auto &name : remote_->listFiles()) {
    if (isCommandFile(name)) commands.push_back(name);
  }
  if (commands.empty()) return std::nullopt;
  if (commands.size() > 1) {
    throw DistributionError("more than one command file at " +
                            remote_->describe());
  }

  const std::string &name = commands.front();
  const fs::path marker = commandFolder_ / "previous.txt";
  if (readMarker(marker) == name) {
    return std::nullopt;
  }

  fs::create_directories(commandFolder_);
  const fs::path local = commandFolder_ / name;
  remote_->download(name, local);
  std::string text = readAll(local);
  std::error_code ec;
  fs::remove(local, ec);

  writeMarker(marker, name);
  sky::CompositeLogger::instance().info("Command " + name + " downloaded from " +
                                        remote_->describe());
  if (isBlank(text)) return std::nullopt;
  return CommandRequest{name, std::move(text), ""};
}

// ---------------------------------------------------------------------------

ChannelCommandSource::ChannelCommandSource(
    std::unique_ptr<CommandChannel> channel, std::string token,
    fs::path markerFile)
    : channel_(std::move(channel)),
      token_(std::move(token)),
      markerFile_(std::move(markerFile)) {
  lastText_ = readMarker(markerFile_);
}

std::optional<CommandRequest> ChannelCommandSource::poll() {
  auto request = channel_->poll();
  if (!request) return std::nullopt;

  if (request->authToken != token_) {
    throw AuthenticationError("command " + request->id +
                              " carries an invalid token");
  }
  if (lastText_ && *lastText_ == request->text) {
    sky::CompositeLogger::instance().debug(
        "Ignoring repeated command " + request->id);
    return std::nullopt;
  }

  lastText_ = request->text;
  writeMarker(markerFile_, request->text);
  return request;
}

void ChannelCommandSource::report(const CommandResult &result) {
  channel_->report(result);
}
