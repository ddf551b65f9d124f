#ifndef BUILD_OPTIONS_HPP
#define BUILD_OPTIONS_HPP

#include "assets/asset_ledger.hpp"
#include "route_definition.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;

class AssetTransformer;

struct SitemapOptions {
  bool enabled = false;
  std::string filename = "sitemap.xml";
  size_t max_urls = 10000;
  std::optional<ChangeFreq> changefreq;
  std::optional<double> priority;
};

struct BuildOptions {
  // Relative directories below are resolved against root.
  fs::path root = ".";
  fs::path output_dir = "dist";
  // Below output_dir.
  fs::path assets_dir = "_kiln";
  fs::path static_dir = "static";
  fs::path cache_dir = ".kiln-cache";

  std::optional<std::string> base_url;

  bool dev = false;
  bool incremental = false;
  bool clean_output_dir = true;
  bool minify = false;
  // Script defining the global Terser and csso objects, evaluated in
  // QuickJS. Without it minify only touches HTML whitespace.
  fs::path minifier_bundle;
  bool quiet = false;

  // Identifies the engine build plus route set. Empty picks the running
  // binary's identity.
  std::string structural_stamp;

  SitemapOptions sitemap;

  // Per-kind overrides of the default copy/minify step.
  std::map<AssetKind, std::shared_ptr<AssetTransformer>> transformers;

  fs::path resolve(const fs::path &path) const {
    return path.is_absolute() ? path : root / path;
  }
  fs::path output_path() const { return resolve(output_dir); }
  fs::path static_path() const { return resolve(static_dir); }
  fs::path cache_path() const { return resolve(cache_dir); }
};

#endif
