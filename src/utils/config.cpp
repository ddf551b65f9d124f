#include "config.hpp"
#include "core/errors.hpp"

#include <cstdlib>

template <typename T>
static void read_key(const YAML::Node &yaml, const char *key, T &target) {
  if (!yaml[key] || yaml[key].IsNull()) {
    return;
  }
  try {
    target = yaml[key].as<T>();
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("Invalid value for '") + key +
                      "' in kiln.yaml: " + e.what());
  }
}

SiteConfig SiteConfig::load(const fs::path &config_path) {
  if (!fs::exists(config_path)) {
    return SiteConfig();
  }

  try {
    return from_node(YAML::LoadFile(config_path.string()));
  } catch (const YAML::Exception &e) {
    throw ConfigError("Cannot parse " + config_path.string() + ": " +
                      e.what());
  }
}

SiteConfig SiteConfig::parse(const std::string &yaml_text) {
  try {
    return from_node(YAML::Load(yaml_text));
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("Cannot parse configuration: ") + e.what());
  }
}

SiteConfig SiteConfig::from_node(const YAML::Node &yaml) {
  SiteConfig config;

  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw ConfigError("kiln.yaml must be a mapping of keys to values");
  }

  config.custom_yaml_data = yaml;

  read_key(yaml, "site_name", config.site_name);
  read_key(yaml, "author", config.author);
  read_key(yaml, "description", config.description);

  if (yaml["base_url"] && !yaml["base_url"].IsNull()) {
    std::string base_url;
    read_key(yaml, "base_url", base_url);
    config.base_url = base_url;
  }

  read_key(yaml, "output_dir", config.output_dir);
  read_key(yaml, "assets_dir", config.assets_dir);
  read_key(yaml, "static_dir", config.static_dir);
  read_key(yaml, "content_dir", config.content_dir);
  read_key(yaml, "templates_dir", config.templates_dir);
  read_key(yaml, "cache_dir", config.cache_dir);

  read_key(yaml, "incremental", config.incremental);
  read_key(yaml, "clean_output_dir", config.clean_output_dir);
  read_key(yaml, "minify", config.minify);
  read_key(yaml, "minifier_bundle", config.minifier_bundle);
  read_key(yaml, "asset_sources_dir", config.asset_sources_dir);

  if (const YAML::Node sitemap = yaml["sitemap"]) {
    if (!sitemap.IsMap()) {
      throw ConfigError("'sitemap' in kiln.yaml must be a mapping");
    }
    read_key(sitemap, "enabled", config.sitemap.enabled);
    read_key(sitemap, "filename", config.sitemap.filename);
    read_key(sitemap, "max_urls", config.sitemap.max_urls);
    read_key(sitemap, "changefreq", config.sitemap.changefreq);

    if (sitemap["priority"] && !sitemap["priority"].IsNull()) {
      double priority = 0;
      read_key(sitemap, "priority", priority);
      if (priority < 0.0 || priority > 1.0) {
        throw ConfigError("sitemap.priority must be between 0.0 and 1.0");
      }
      config.sitemap.priority = priority;
    }

    if (!config.sitemap.changefreq.empty() &&
        !change_freq_from_name(config.sitemap.changefreq)) {
      throw ConfigError("Unknown sitemap.changefreq '" +
                        config.sitemap.changefreq + "'");
    }
  }

  return config;
}

BuildOptions SiteConfig::to_build_options(const fs::path &root) const {
  BuildOptions options;
  options.root = root;
  options.output_dir = output_dir;
  options.assets_dir = assets_dir;
  options.static_dir = static_dir;
  options.cache_dir = cache_dir;
  options.base_url = base_url;
  options.incremental = incremental;
  options.clean_output_dir = clean_output_dir;
  options.minify = minify;
  options.minifier_bundle = minifier_bundle;
  options.dev = dev_mode_from_env();

  options.sitemap.enabled = sitemap.enabled;
  options.sitemap.filename = sitemap.filename;
  options.sitemap.max_urls = sitemap.max_urls;
  options.sitemap.priority = sitemap.priority;
  if (!sitemap.changefreq.empty()) {
    options.sitemap.changefreq = change_freq_from_name(sitemap.changefreq);
  }

  return options;
}

bool dev_mode_from_env() {
  const char *value = std::getenv("KILN_DEV");
  if (!value) {
    return false;
  }
  std::string flag(value);
  return flag == "true" || flag == "1";
}
