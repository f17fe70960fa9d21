#include "../include/remotesource.hpp"

#include <algorithm>
#include <cctype>

#include "../include/curlremotesource.hpp"
#include "../include/errors.hpp"

namespace fs = std::filesystem;

DirectoryRemoteSource::DirectoryRemoteSource(fs::path directory)
    : directory_(std::move(directory)) {}

std::vector<std::string> DirectoryRemoteSource::listFiles() {
  std::vector<std::string> names;
  std::error_code ec;
  for (fs::directory_iterator it(directory_, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_regular_file(ec)) {
      names.push_back(it->path().filename().string());
    }
  }
  if (ec) {
    throw DistributionError("cannot list " + directory_.string() + ": " +
                            ec.message());
  }
  std::sort(names.begin(), names.end());
  return names;
}

void DirectoryRemoteSource::download(const std::string &name,
                                     const fs::path &destination) {
  std::error_code ec;
  fs::copy_file(directory_ / name, destination,
                fs::copy_options::overwrite_existing, ec);
  if (ec) {
    fs::remove(destination, ec);
    throw DistributionError("cannot copy " + (directory_ / name).string() +
                            ": " + ec.message());
  }
}

std::unique_ptr<RemoteSource> makeRemoteSource(const std::string &url,
                                               std::chrono::seconds timeout) {
  const auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos) {
    return std::make_unique<DirectoryRemoteSource>(url);
  }

  std::string scheme = url.substr(0, schemeEnd);
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (scheme == "file") {
    return std::make_unique<DirectoryRemoteSource>(url.substr(schemeEnd + 3));
  }
  if (scheme == "http" || scheme == "https" || scheme == "ftp") {
    return std::make_unique<CurlRemoteSource>(url, timeout);
  }
  throw ConfigurationError("unsupported remote URL scheme '" + scheme +
                           "' in " + url);
}
