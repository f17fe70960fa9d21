#include "../include/filehash.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

std::string sha256File(const std::filesystem::path &filePath) {
  std::ifstream file(filePath, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open file for hashing: " +
                             filePath.string());
  }

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(
      EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP context");
  }

  const EVP_MD *md = EVP_sha256();
  const size_t hash_size = EVP_MD_size(md);

  if (EVP_DigestInit_ex(mdctx.get(), md, nullptr) != 1) {
    throw std::runtime_error("Failed to initialize SHA256 digest");
  }

  char buffer[8192];
  while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
    if (EVP_DigestUpdate(mdctx.get(), buffer, file.gcount()) != 1) {
      throw std::runtime_error("Failed to update SHA256 digest");
    }
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &len) != 1) {
    throw std::runtime_error("Failed to finalize SHA256 digest");
  }
  if (len != hash_size) {
    throw std::runtime_error("Invalid SHA256 digest length");
  }

  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < len; i++) {
    ss << std::setw(2) << static_cast<unsigned>(hash[i]);
  }
  return ss.str();
}

std::string parseDigestFile(const std::string &content) {
  std::istringstream in(content);
  std::string token;
  in >> token;
  std::transform(token.begin(), token.end(), token.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return token;
}
