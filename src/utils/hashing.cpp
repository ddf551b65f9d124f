#include "hashing.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <vector>
#include <stdexcept>

Sha256::Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
  if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize SHA-256 context");
  }
}

Sha256 &Sha256::update(const void *data, size_t size) {
  if (finished_) {
    throw std::logic_error("SHA-256 context already finished");
  }
  if (size > 0 && EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw std::runtime_error("SHA-256 update failed");
  }
  return *this;
}

Sha256 &Sha256::update(const std::string &data) {
  return update(data.data(), data.size());
}

Sha256 &Sha256::update_field(const std::string &field) {
  std::string length = std::to_string(field.size()) + ":";
  update(length);
  return update(field);
}

std::string Sha256::finish() {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;

  if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
    throw std::runtime_error("SHA-256 finalization failed");
  }
  finished_ = true;

  std::ostringstream hex;
  for (unsigned int i = 0; i < length; ++i) {
    hex << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(digest[i]);
  }
  return hex.str();
}

std::string sha256_hex(const std::string &data) {
  return Sha256().update(data).finish();
}

std::optional<std::string> sha256_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }

  Sha256 hasher;
  char buffer[8192];
  while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
    hasher.update(buffer, static_cast<size_t>(file.gcount()));
  }
  if (file.bad()) {
    return std::nullopt;
  }
  return hasher.finish();
}

std::string sha256_directory(const fs::path &dir) {
  std::vector<fs::path> files;
  std::error_code ec;
  if (fs::is_directory(dir, ec)) {
    for (const auto &entry : fs::recursive_directory_iterator(dir)) {
      if (entry.is_regular_file()) {
        files.push_back(entry.path());
      }
    }
  }
  std::sort(files.begin(), files.end());

  Sha256 hasher;
  for (const auto &file : files) {
    hasher.update_field(file.lexically_relative(dir).generic_string());
    hasher.update_field(sha256_file(file).value_or("unreadable"));
  }
  return hasher.finish();
}
