#include "asset_ledger.hpp"
#include "core/errors.hpp"
#include "utils/hashing.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

const char *asset_kind_name(AssetKind kind) {
  switch (kind) {
  case AssetKind::Script:
    return "script";
  case AssetKind::Style:
    return "style";
  case AssetKind::Image:
    return "image";
  }
  return "asset";
}

const char *image_format_extension(ImageFormat format) {
  switch (format) {
  case ImageFormat::Png:
    return "png";
  case ImageFormat::Jpeg:
    return "jpg";
  case ImageFormat::Webp:
    return "webp";
  case ImageFormat::Avif:
    return "avif";
  case ImageFormat::Gif:
    return "gif";
  }
  return "bin";
}

std::optional<AssetKind> asset_kind_from_name(const std::string &name) {
  for (AssetKind kind : {AssetKind::Script, AssetKind::Style, AssetKind::Image}) {
    if (name == asset_kind_name(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

std::optional<ImageFormat> image_format_from_extension(const std::string &ext) {
  if (ext == "jpeg") {
    return ImageFormat::Jpeg;
  }
  for (ImageFormat format : {ImageFormat::Png, ImageFormat::Jpeg,
                             ImageFormat::Webp, ImageFormat::Avif,
                             ImageFormat::Gif}) {
    if (ext == image_format_extension(format)) {
      return format;
    }
  }
  return std::nullopt;
}

static std::string optional_number(const std::optional<unsigned> &value) {
  return value ? std::to_string(*value) : "";
}

std::string ImageOptions::canonical() const {
  return "w=" + optional_number(width) + ";h=" + optional_number(height) +
         ";f=" + (format ? image_format_extension(*format) : "") +
         ";q=" + optional_number(quality);
}

std::string AssetRecord::options_key() const {
  return kind == AssetKind::Image ? image_options.canonical() : "";
}

std::string AssetRecord::url() const {
  return "/" + build_path.generic_string();
}

fs::path canonical_asset_path(const fs::path &path) {
  std::error_code ec;
  fs::path canonical = fs::weakly_canonical(fs::absolute(path), ec);
  return ec ? fs::absolute(path).lexically_normal() : canonical;
}

long long file_mtime(const fs::path &path) {
  std::error_code ec;
  auto time = fs::last_write_time(path, ec);
  if (ec) {
    return -1;
  }
  return static_cast<long long>(time.time_since_epoch().count());
}

fs::path compute_build_path(const fs::path &assets_dir,
                            const fs::path &canonical_source, AssetKind kind,
                            const ImageOptions &options) {
  Sha256 hasher;
  hasher.update_field(canonical_source.generic_string());
  hasher.update_field(asset_kind_name(kind));
  hasher.update_field(kind == AssetKind::Image ? options.canonical() : "");
  std::string hash = hasher.finish().substr(0, 16);

  std::string extension;
  if (kind == AssetKind::Image && options.format) {
    extension = image_format_extension(*options.format);
  } else if (canonical_source.has_extension()) {
    extension = canonical_source.extension().string().substr(1);
  }

  std::string file_name = extension.empty() ? hash : hash + "." + extension;
  return assets_dir / file_name;
}

const AssetRecord &AssetLedger::add(const fs::path &source_path,
                                    AssetKind kind,
                                    const ImageOptions &options) {
  fs::path canonical = canonical_asset_path(source_path);

  std::string key = canonical.generic_string() + "|" + asset_kind_name(kind) +
                    "|" + (kind == AssetKind::Image ? options.canonical() : "");

  auto existing = records_.find(key);
  if (existing != records_.end()) {
    return existing->second;
  }

  // Images are inspected by the transform step, so they must be readable
  // now; scripts and styles are only read when copied.
  if (kind == AssetKind::Image) {
    std::ifstream probe(canonical, std::ios::binary);
    if (!probe.is_open()) {
      throw AssetReadError(source_path, std::strerror(errno));
    }
  }

  AssetRecord record;
  record.source_path = canonical;
  record.kind = kind;
  record.image_options = kind == AssetKind::Image ? options : ImageOptions();
  record.build_path =
      compute_build_path(assets_dir_, canonical, kind, record.image_options);

  order_.push_back(key);
  return records_.emplace(key, std::move(record)).first->second;
}

const AssetRecord &AssetLedger::include_script(const fs::path &path) {
  const AssetRecord &record = add_script(path);
  included_scripts_.push_back(record.build_path);
  return record;
}

const AssetRecord &AssetLedger::include_style(const fs::path &path) {
  const AssetRecord &record = add_style(path);
  included_styles_.push_back(record.build_path);
  return record;
}

std::vector<AssetRecord> AssetLedger::records() const {
  std::vector<AssetRecord> result;
  result.reserve(order_.size());
  for (const auto &key : order_) {
    result.push_back(records_.at(key));
  }
  return result;
}

std::vector<AssetDependency> AssetLedger::dependencies() const {
  std::vector<AssetDependency> deps;
  for (const auto &key : order_) {
    const auto &record = records_.at(key);
    deps.push_back({record.source_path, file_mtime(record.source_path)});
  }
  return deps;
}

void BuildAssetSet::merge(const std::vector<AssetRecord> &records) {
  for (const auto &record : records) {
    records_.emplace(record.build_path, record);
  }
}

std::string inject_head_tags(const std::string &html,
                             const std::vector<std::string> &style_urls,
                             const std::vector<std::string> &script_urls) {
  if (style_urls.empty() && script_urls.empty()) {
    return html;
  }

  std::string tags;
  for (const auto &url : style_urls) {
    tags += "<link rel=\"stylesheet\" href=\"" + url + "\">";
  }
  for (const auto &url : script_urls) {
    tags += "<script src=\"" + url + "\" type=\"module\"></script>";
  }

  size_t head_close = html.find("</head>");

  if (head_close != std::string::npos) {
    return html.substr(0, head_close) + tags + html.substr(head_close);
  } else {
    return html + tags;
  }
}
