#include "../include/curlremotesource.hpp"

#include <curl/curl.h>
#include <libxml/HTMLparser.h>
#include <libxml/xpath.h>

#include <algorithm>
#include <cstdio>
#include <memory>
#include <mutex>
#include <set>

#include "../include/errors.hpp"
#include "sky/compositelogger.hpp"

namespace fs = std::filesystem;

namespace {

struct CurlResponse {
  std::string data;
};

size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp) {
  const size_t realsize = size * nmemb;
  static_cast<CurlResponse *>(userp)->data.append(
      static_cast<const char *>(contents), realsize);
  return realsize;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

CurlHandle makeHandle(const std::string &url, std::chrono::seconds timeout) {
  static std::once_flag globalInit;
  std::call_once(globalInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw DistributionError("Failed to initialize CURL");
  }
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT,
                   static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                   static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  return curl;
}

std::string basename(std::string href) {
  const auto cut = href.find_first_of("?#");
  if (cut != std::string::npos) href.erase(cut);
  if (href.empty() || href.back() == '/') return {};
  const auto slash = href.rfind('/');
  return slash == std::string::npos ? href : href.substr(slash + 1);
}

}  // namespace

CurlRemoteSource::CurlRemoteSource(std::string url,
                                   std::chrono::seconds timeout)
    : url_(std::move(url)), timeout_(timeout) {
  if (url_.empty() || url_.back() != '/') url_ += '/';
  if (timeout_.count() <= 0) timeout_ = std::chrono::seconds(10);
}

bool CurlRemoteSource::isFtp() const { return url_.rfind("ftp://", 0) == 0; }

std::string CurlRemoteSource::fetch(const std::string &url) {
  auto curl = makeHandle(url, timeout_);
  CurlResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  if (isFtp()) {
    curl_easy_setopt(curl.get(), CURLOPT_DIRLISTONLY, 1L);
  }

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw DistributionError("request to " + url + " failed: " +
                            std::string(curl_easy_strerror(res)));
  }
  return response.data;
}

std::vector<std::string> CurlRemoteSource::listFiles() {
  const std::string body = fetch(url_);
  auto names = isFtp() ? parseNameList(body) : parseIndexPage(body, url_);
  sky::CompositeLogger::instance().debug(
      "Found " + std::to_string(names.size()) + " files at " + url_);
  return names;
}

void CurlRemoteSource::download(const std::string &name,
                                const fs::path &destination) {
  const std::string url = url_ + name;
  auto curl = makeHandle(url, timeout_);

  FILE *file = fopen(destination.c_str(), "wb");
  if (!file) {
    throw DistributionError("Cannot create local file: " +
                            destination.string());
  }
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, file);

  const CURLcode res = curl_easy_perform(curl.get());
  const bool closed = fclose(file) == 0;

  if (res != CURLE_OK || !closed) {
    std::error_code ec;
    fs::remove(destination, ec);
    throw DistributionError(
        "download of " + url + " failed: " +
        (res != CURLE_OK ? std::string(curl_easy_strerror(res))
                         : std::string("cannot flush local file")));
  }
  sky::CompositeLogger::instance().debug("Downloaded " + url + " to " +
                                         destination.string());
}

std::vector<std::string> CurlRemoteSource::parseIndexPage(
    const std::string &html, const std::string &baseUrl) {
  std::set<std::string> names;
  if (html.empty()) return {};

  htmlDocPtr doc = htmlReadMemory(
      html.data(), static_cast<int>(html.size()), baseUrl.c_str(), nullptr,
      HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
          HTML_PARSE_NONET);
  if (!doc) {
    throw DistributionError("cannot parse index page of " + baseUrl);
  }

  xmlXPathContextPtr ctx = xmlXPathNewContext(doc);
  if (!ctx) {
    xmlFreeDoc(doc);
    throw DistributionError("cannot create XPath context");
  }
  xmlXPathObjectPtr result =
      xmlXPathEvalExpression(BAD_CAST "//a/@href", ctx);
  if (result && result->nodesetval) {
    for (int i = 0; i < result->nodesetval->nodeNr; ++i) {
      xmlNodePtr attr = result->nodesetval->nodeTab[i];
      xmlChar *value = xmlNodeGetContent(attr);
      if (!value) continue;
      const std::string name =
          basename(reinterpret_cast<const char *>(value));
      xmlFree(value);
      if (!name.empty() && name != "." && name != "..") names.insert(name);
    }
  }
  if (result) xmlXPathFreeObject(result);
  xmlXPathFreeContext(ctx);
  xmlFreeDoc(doc);

  return std::vector<std::string>(names.begin(), names.end());
}

std::vector<std::string> CurlRemoteSource::parseNameList(
    const std::string &listing) {
  std::set<std::string> names;
  size_t begin = 0;
  while (begin < listing.size()) {
    size_t end = listing.find('\n', begin);
    if (end == std::string::npos) end = listing.size();
    std::string line = listing.substr(begin, end - begin);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
      line.pop_back();
    }
    line = basename(line);
    if (!line.empty() && line != "." && line != "..") names.insert(line);
    begin = end + 1;
  }
  return std::vector<std::string>(names.begin(), names.end());
}
