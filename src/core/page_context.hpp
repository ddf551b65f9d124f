#ifndef PAGE_CONTEXT_HPP
#define PAGE_CONTEXT_HPP

#include "assets/asset_ledger.hpp"
#include "build_options.hpp"
#include "content/content_registry.hpp"
#include "route_params.hpp"

#include <any>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace fs = std::filesystem;

// A concrete page of one build: a route template resolved with one set of
// params for one variant.
struct ResolvedPage {
  std::string url;
  fs::path file_path;
  ParamMap params;
  std::any props;
  std::optional<std::string> variant_id;
};

// Read access to the content registry that remembers which sources were
// queried. The names feed the page's build fingerprint.
class ContentAccessor {
public:
  explicit ContentAccessor(const ContentRegistry &registry)
      : registry_(registry) {}

  template <typename T>
  const ContentSource<T> &get_source(const std::string &name) {
    const ContentSource<T> &source = registry_.template get_source<T>(name);
    sources_read_.insert(name);
    return source;
  }

  // Shorthand for get_source<T>(source).get_entry(id).
  template <typename T>
  const ContentEntry<T> &get_entry(const std::string &source,
                                   const std::string &id) {
    return get_source<T>(source).get_entry(id);
  }

  const std::set<std::string> &sources_read() const { return sources_read_; }

private:
  const ContentRegistry &registry_;
  std::set<std::string> sources_read_;
};

// Handed to Route::pages() once per variant of a dynamic route.
class DynamicRouteContext {
public:
  DynamicRouteContext(const ContentRegistry &registry,
                      std::optional<std::string> variant, bool dev)
      : content_(registry), variant_(std::move(variant)), dev_(dev) {}

  ContentAccessor &content() { return content_; }
  const std::optional<std::string> &variant() const { return variant_; }
  bool is_dev() const { return dev_; }

private:
  ContentAccessor content_;
  std::optional<std::string> variant_;
  bool dev_;
};

// Everything a route's render() may touch. One instance per page; never
// shared between pages.
class PageContext {
public:
  PageContext(const ResolvedPage &page, const ContentRegistry &registry,
              AssetLedger &assets, const BuildOptions &options)
      : page_(page), content_(registry), assets_(assets), options_(options) {}

  ContentAccessor &content() { return content_; }
  AssetLedger &assets() { return assets_; }

  // Decodes the raw params through T::schema().
  template <typename T> T params() const {
    return T::schema().decode(page_.params);
  }

  template <typename T> const T &props() const {
    const T *value = std::any_cast<T>(&page_.props);
    if (!value) {
      throw ParamConversionError("props", param_type_name<T>(),
                                 page_.props.has_value()
                                     ? "page props hold another type"
                                     : "page has no props");
    }
    return *value;
  }

  const ParamMap &raw_params() const { return page_.params; }
  const std::optional<std::string> &variant() const { return page_.variant_id; }
  const std::string &current_url() const { return page_.url; }

  // base_url + current_url(), or nullopt without a configured base_url.
  std::optional<std::string> canonical_url() const;

  bool is_dev() const { return options_.dev; }
  const BuildOptions &options() const { return options_; }

private:
  const ResolvedPage &page_;
  ContentAccessor content_;
  AssetLedger &assets_;
  const BuildOptions &options_;
};

PageContext make_context(const ResolvedPage &page,
                         const ContentRegistry &registry, AssetLedger &assets,
                         const BuildOptions &options);

// Joins base_url and an absolute url path without doubling the slash.
std::string join_url(const std::string &base_url, const std::string &path);

#endif
