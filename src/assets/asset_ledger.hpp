#ifndef ASSET_LEDGER_HPP
#define ASSET_LEDGER_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

enum class AssetKind { Script, Style, Image };

const char *asset_kind_name(AssetKind kind);
std::optional<AssetKind> asset_kind_from_name(const std::string &name);

enum class ImageFormat { Png, Jpeg, Webp, Avif, Gif };

const char *image_format_extension(ImageFormat format);
std::optional<ImageFormat> image_format_from_extension(const std::string &ext);

struct ImageOptions {
  std::optional<unsigned> width;
  std::optional<unsigned> height;
  std::optional<ImageFormat> format;
  std::optional<unsigned> quality;

  bool empty() const { return !width && !height && !format && !quality; }

  // Stable textual form, e.g. "w=400;h=;f=webp;q=80". Feeds the asset hash.
  std::string canonical() const;

  bool operator==(const ImageOptions &other) const {
    return canonical() == other.canonical();
  }
};

struct AssetRecord {
  fs::path source_path;
  AssetKind kind = AssetKind::Image;
  // Relative to the output directory, e.g. "_kiln/3fa4c1d2e9b07a55.png".
  fs::path build_path;
  ImageOptions image_options;

  std::string options_key() const;
  std::string url() const;

  bool operator<(const AssetRecord &other) const {
    return build_path < other.build_path;
  }
};

// Mtime of a dependency at the time a page used it, for fingerprints.
struct AssetDependency {
  fs::path source_path;
  long long mtime = 0;
};

// Assets touched by one page while it renders. Registration is
// bookkeeping only; nothing is copied until the build-wide merge.
class AssetLedger {
public:
  explicit AssetLedger(fs::path assets_dir) : assets_dir_(std::move(assets_dir)) {}

  const AssetRecord &add(const fs::path &source_path, AssetKind kind,
                         const ImageOptions &options = ImageOptions());

  const AssetRecord &add_image(const fs::path &path,
                               const ImageOptions &options = ImageOptions()) {
    return add(path, AssetKind::Image, options);
  }
  const AssetRecord &add_script(const fs::path &path) {
    return add(path, AssetKind::Script);
  }
  const AssetRecord &add_style(const fs::path &path) {
    return add(path, AssetKind::Style);
  }

  // Also injects a tag for the asset into the page's <head>.
  const AssetRecord &include_script(const fs::path &path);
  const AssetRecord &include_style(const fs::path &path);

  // Records in registration order.
  std::vector<AssetRecord> records() const;
  const std::vector<fs::path> &included_scripts() const {
    return included_scripts_;
  }
  const std::vector<fs::path> &included_styles() const {
    return included_styles_;
  }
  std::vector<AssetDependency> dependencies() const;

  bool empty() const { return records_.empty(); }

private:
  fs::path assets_dir_;
  std::map<std::string, AssetRecord> records_;
  std::vector<std::string> order_;
  std::vector<fs::path> included_scripts_;
  std::vector<fs::path> included_styles_;
};

// Output path for an asset: "<assets_dir>/<hash>.<ext>" where the hash
// covers the canonical source path, the kind and the options.
fs::path compute_build_path(const fs::path &assets_dir,
                            const fs::path &canonical_source, AssetKind kind,
                            const ImageOptions &options);

fs::path canonical_asset_path(const fs::path &path);

long long file_mtime(const fs::path &path);

// Build-wide, append-only set of assets keyed by build path. Filled at the
// merge barrier after each page; read once by the copy phase.
class BuildAssetSet {
public:
  void merge(const std::vector<AssetRecord> &records);

  const std::map<fs::path, AssetRecord> &records() const { return records_; }
  size_t size() const { return records_.size(); }

private:
  std::map<fs::path, AssetRecord> records_;
};

// Adds <link>/<script> tags for the included assets before </head>, or
// appends them when the document has no head.
std::string inject_head_tags(const std::string &html,
                             const std::vector<std::string> &style_urls,
                             const std::vector<std::string> &script_urls);

#endif
