/**
 * @file filehash.hpp
 * @brief SHA-256 файлов (OpenSSL EVP)
 */

#pragma once

#include <filesystem>
#include <string>

/**
 * @brief SHA-256 содержимого файла в шестнадцатеричном виде (нижний регистр)
 * @throw std::runtime_error Файл не открывается или ошибка OpenSSL
 */
std::string sha256File(const std::filesystem::path &filePath);

/**
 * @brief Первый токен содержимого sidecar-файла `<file>.sha256`
 *        (формат вывода sha256sum), приведённый к нижнему регистру
 */
std::string parseDigestFile(const std::string &content);
