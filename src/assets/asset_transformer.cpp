#include "asset_transformer.hpp"
#include "core/errors.hpp"
#include "utils/logging.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

std::string read_asset(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw AssetReadError(path, std::strerror(errno));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

void write_output_file(const fs::path &path, const std::string &content) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw WriteError(path.parent_path(), ec.message());
    }
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw WriteError(path, std::strerror(errno));
  }
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!file) {
    throw WriteError(path, "short write");
  }
}

std::string CopyTransformer::transform(const AssetRecord &record,
                                       const fs::path &destination) {
  if (!fs::exists(record.source_path)) {
    throw AssetReadError(record.source_path, "no such file");
  }

  std::error_code ec;
  if (destination.has_parent_path()) {
    fs::create_directories(destination.parent_path(), ec);
    if (ec) {
      throw WriteError(destination.parent_path(), ec.message());
    }
  }
  fs::copy_file(record.source_path, destination,
                fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw WriteError(destination, ec.message());
  }
  return "";
}

std::string ImageCopyTransformer::transform(const AssetRecord &record,
                                            const fs::path &destination) {
  CopyTransformer::transform(record, destination);
  if (!record.image_options.empty()) {
    Log::warning("No image transformer installed; " +
                 record.source_path.filename().string() + " copied without " +
                 record.image_options.canonical());
    return "copied";
  }
  return "";
}

std::string MinifyTransformer::transform(const AssetRecord &record,
                                         const fs::path &destination) {
  std::string source = read_asset(record.source_path);
  std::optional<std::string> minified;
  if (minifier_) {
    minified = record.kind == AssetKind::Style ? minifier_->minify_css(source)
                                               : minifier_->minify_js(source);
  }
  if (!minified) {
    write_output_file(destination, source);
    return "copied";
  }
  write_output_file(destination, *minified);
  return "minified";
}
