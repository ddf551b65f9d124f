#ifndef HASHING_HPP
#define HASHING_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <openssl/evp.h>

namespace fs = std::filesystem;

// Incremental SHA-256, hex encoded on finish(). Fields fed through
// update_field() are length-prefixed so ("ab","c") and ("a","bc") differ.
class Sha256 {
public:
  Sha256();

  Sha256 &update(const std::string &data);
  Sha256 &update(const void *data, size_t size);
  Sha256 &update_field(const std::string &field);

  std::string finish();

private:
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
  bool finished_ = false;
};

std::string sha256_hex(const std::string &data);

// Returns nullopt when the file cannot be opened.
std::optional<std::string> sha256_file(const fs::path &path);

// Digest of every regular file below `dir` (relative paths plus contents),
// or of nothing when `dir` does not exist.
std::string sha256_directory(const fs::path &dir);

#endif
