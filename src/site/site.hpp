#ifndef SITE_HPP
#define SITE_HPP

#include "core/site_builder.hpp"
#include "core/template_engine.hpp"
#include "utils/config.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct ArticleMeta {
  std::string title;
  std::string date;
  std::string description;
  std::optional<std::string> lang;
  std::vector<std::string> tags;
};

namespace YAML {
template <> struct convert<ArticleMeta> {
  static bool decode(const Node &node, ArticleMeta &meta);
};
} // namespace YAML

struct ArticleParams {
  std::string slug;

  static ParamSchema<ArticleParams> schema() {
    return ParamSchema<ArticleParams>().field("slug", &ArticleParams::slug);
  }
};

struct BlogPageParams {
  // Absent on the first page, which lives at /blog/.
  std::optional<size_t> page;

  static ParamSchema<BlogPageParams> schema() {
    return ParamSchema<BlogPageParams>().field("page", &BlogPageParams::page);
  }
};

// Shared by every route of the demo site.
struct SiteEnvironment {
  SiteConfig config;
  fs::path root;
  std::shared_ptr<TemplateEngine> templates;

  fs::path asset(const std::string &name) const {
    return root / config.asset_sources_dir / name;
  }
  nlohmann::json site_data() const;
};

// Engine identity plus digests of the templates directory and the site data
// from kiln.yaml. Pages do not record which templates or site keys they used,
// so any edit to either must invalidate the whole incremental cache.
std::string site_stamp(const SiteEnvironment &env);

// Registers the "articles" content source and every route of the site.
void register_site(SiteBuilder &builder,
                   std::shared_ptr<const SiteEnvironment> env);

#endif
