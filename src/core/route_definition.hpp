#ifndef ROUTE_DEFINITION_HPP
#define ROUTE_DEFINITION_HPP

#include <optional>
#include <string>
#include <vector>

enum class RouteKind { Static, Dynamic };

enum class VariantStyle {
  // `path` replaces the base template entirely.
  Path,
  // `path` is prepended to the base template.
  Prefix
};

struct LocaleVariant {
  std::string id;
  std::string path;
  VariantStyle style = VariantStyle::Path;
};

enum class ChangeFreq { Always, Hourly, Daily, Weekly, Monthly, Yearly, Never };

const char *change_freq_name(ChangeFreq freq);
std::optional<ChangeFreq> change_freq_from_name(const std::string &name);

struct SitemapMetadata {
  bool exclude = false;
  std::optional<ChangeFreq> changefreq;
  std::optional<double> priority;
};

// Author-supplied description of a route. Built once at registration and
// never mutated afterwards.
class RouteDefinition {
public:
  static RouteDefinition static_route(const std::string &path_template);
  static RouteDefinition dynamic_route(const std::string &path_template);
  // A route with no base path: only its locale variants produce pages.
  static RouteDefinition variants_only(RouteKind kind);

  RouteDefinition &locale(const std::string &id, const std::string &path);
  RouteDefinition &locale_prefix(const std::string &id,
                                 const std::string &prefix);
  RouteDefinition &sitemap(const SitemapMetadata &metadata);

  RouteKind kind() const { return kind_; }
  const std::optional<std::string> &path_template() const {
    return path_template_;
  }
  const std::vector<LocaleVariant> &locale_variants() const {
    return variants_;
  }
  const SitemapMetadata &sitemap_metadata() const { return sitemap_; }

  // Base template, or the first variant's for variant-only routes.
  std::string display_name() const;

private:
  RouteDefinition(RouteKind kind, std::optional<std::string> path_template)
      : kind_(kind), path_template_(std::move(path_template)) {}

  RouteKind kind_;
  std::optional<std::string> path_template_;
  std::vector<LocaleVariant> variants_;
  SitemapMetadata sitemap_;
};

#endif
