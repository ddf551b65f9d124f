#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "core/build_options.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

struct SitemapConfig {
  bool enabled = false;
  std::string filename = "sitemap.xml";
  size_t max_urls = 10000;
  std::string changefreq;
  std::optional<double> priority;
};

// Contents of kiln.yaml. Every key is optional.
class SiteConfig {
public:
  std::string site_name;
  std::string author;
  std::string description;
  std::optional<std::string> base_url;

  std::string output_dir = "dist";
  std::string assets_dir = "_kiln";
  std::string static_dir = "static";
  std::string content_dir = "content";
  std::string templates_dir = "templates";
  std::string cache_dir = ".kiln-cache";

  bool incremental = false;
  bool clean_output_dir = true;
  bool minify = false;
  std::string minifier_bundle;
  // Source images, scripts and styles of the site; watched for changes.
  std::string asset_sources_dir = "assets";

  SitemapConfig sitemap;

  // Whole document, for site-specific keys read by templates.
  YAML::Node custom_yaml_data;

  // Missing file yields the defaults; unreadable or mistyped YAML is a
  // ConfigError.
  static SiteConfig load(const fs::path &config_path);
  static SiteConfig parse(const std::string &yaml_text);

  // Options rooted at `root`. The dev flag is taken from KILN_DEV.
  BuildOptions to_build_options(const fs::path &root) const;

  const YAML::Node &get_custom_data() const { return custom_yaml_data; }

private:
  static SiteConfig from_node(const YAML::Node &yaml);
};

// True when KILN_DEV is set to "true" or "1".
bool dev_mode_from_env();

#endif
