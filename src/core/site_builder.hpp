#ifndef SITE_BUILDER_HPP
#define SITE_BUILDER_HPP

#include "assets/asset_ledger.hpp"
#include "build_options.hpp"
#include "content/content_registry.hpp"
#include "errors.hpp"
#include "route.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class AssetTransformer;
class IncrementalCache;
class ScriptMinifier;

enum class BuildState {
  Init,
  EnumeratingRoutes,
  ResolvingVariants,
  RenderingPages,
  MergingAssets,
  Writing,
  Done,
  Failed
};

const char *build_state_name(BuildState state);

struct PageOutput {
  std::string route;
  std::string url;
  fs::path file_path;
  ParamMap params;
  std::optional<std::string> variant;
  bool reused = false;
};

struct BuildOutput {
  std::vector<PageOutput> pages;
  // Build paths relative to the output directory.
  std::vector<fs::path> assets;
  std::vector<fs::path> static_files;
  std::vector<fs::path> sitemap_files;
  size_t rendered = 0;
  size_t reused = 0;
  std::chrono::nanoseconds elapsed{0};
};

struct BuildResult {
  bool ok = false;
  BuildOutput output;
  std::exception_ptr error;
  std::optional<ErrorCode> error_code;
  // Message of the first fatal error and every nested cause.
  std::string error_chain;
};

// Owns the routes and content of one site and turns them into files below
// the output directory.
class SiteBuilder {
public:
  explicit SiteBuilder(BuildOptions options);
  ~SiteBuilder();

  SiteBuilder(const SiteBuilder &) = delete;
  SiteBuilder &operator=(const SiteBuilder &) = delete;

  ContentRegistry &content() { return content_; }

  void add_route(std::unique_ptr<Route> route);

  template <typename R, typename... Args> R &add_route(Args &&...args) {
    auto route = std::make_unique<R>(std::forward<Args>(args)...);
    R &ref = *route;
    add_route(std::move(route));
    return ref;
  }

  BuildOptions &options() { return options_; }
  const BuildOptions &options() const { return options_; }

  BuildState state() const { return state_; }

  // Runs one complete build. Throws the first fatal error; the state is
  // Failed afterwards.
  BuildOutput build();

private:
  struct PlannedPage;
  struct RenderedPage;

  std::vector<PlannedPage> plan_pages();
  void check_static_collisions(const std::vector<PlannedPage> &planned);
  RenderedPage render_page(const PlannedPage &planned);
  std::optional<RenderedPage> reuse_page(const PlannedPage &planned);
  void prepare_minifier();
  void prepare_output_dir();
  void write_assets(const BuildAssetSet &assets, BuildOutput &output);
  void copy_static_files(BuildOutput &output);
  void write_sitemap(const std::vector<PlannedPage> &planned,
                     BuildOutput &output);
  std::string structural_stamp() const;
  std::shared_ptr<AssetTransformer> transformer_for(AssetKind kind) const;
  void print_build_summary(const BuildOutput &output) const;

  BuildOptions options_;
  ContentRegistry content_;
  std::vector<std::unique_ptr<Route>> routes_;
  std::unique_ptr<IncrementalCache> cache_;
  std::shared_ptr<ScriptMinifier> script_minifier_;
  fs::path script_minifier_bundle_;
  BuildState state_ = BuildState::Init;
};

// Builds and reports instead of throwing: the result carries either the
// summary or the first fatal error with its formatted cause chain.
BuildResult build_site(SiteBuilder &builder);

#endif
