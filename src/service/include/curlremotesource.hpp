/**
 * @file curlremotesource.hpp
 * @brief Удалённый каталог по HTTP(S)/FTP через libcurl
 *
 * @details Для HTTP(S) перечисление: разбор индексной страницы каталога
 * (HTML-парсер libxml2, XPath `//a/@href`); для FTP: NLST
 * (CURLOPT_DIRLISTONLY). Каждая операция ограничена таймаутом.
 *
 * @ingroup Distribution
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "../include/remotesource.hpp"

class CurlRemoteSource : public RemoteSource {
 public:
  CurlRemoteSource(std::string url, std::chrono::seconds timeout);

  std::vector<std::string> listFiles() override;
  void download(const std::string &name,
                const std::filesystem::path &destination) override;
  std::string describe() const override { return url_; }

  /// Ссылки `<a href>` индексной страницы, сведённые к именам файлов
  static std::vector<std::string> parseIndexPage(const std::string &html,
                                                 const std::string &baseUrl);

  /// Ответ FTP NLST: имя на строку
  static std::vector<std::string> parseNameList(const std::string &listing);

 private:
  std::string fetch(const std::string &url);
  bool isFtp() const;

  std::string url_;  ///< всегда с завершающим '/'
  std::chrono::seconds timeout_;
};
