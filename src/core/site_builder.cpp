#include "site_builder.hpp"
#include "assets/asset_transformer.hpp"
#include "assets/minifier.hpp"
#include "assets/script_minifier.hpp"
#include "incremental_cache.hpp"
#include "route_resolver.hpp"
#include "sitemap.hpp"
#include "utils/build_info.hpp"
#include "utils/hashing.hpp"
#include "utils/logging.hpp"
#include "variant_resolver.hpp"

#include <iomanip>
#include <iostream>
#include <map>
#include <set>
#include <system_error>
#include <termcolor/termcolor.hpp>

struct SiteBuilder::PlannedPage {
  Route *route = nullptr;
  std::string path_template;
  SitemapMetadata sitemap;
  ResolvedPage page;
  std::set<std::string> enumeration_sources;
};

struct SiteBuilder::RenderedPage {
  std::string output;
  std::vector<AssetRecord> assets;
  CachedPage cache_record;
};

const char *build_state_name(BuildState state) {
  switch (state) {
  case BuildState::Init:
    return "init";
  case BuildState::EnumeratingRoutes:
    return "enumerating routes";
  case BuildState::ResolvingVariants:
    return "resolving variants";
  case BuildState::RenderingPages:
    return "rendering pages";
  case BuildState::MergingAssets:
    return "merging assets";
  case BuildState::Writing:
    return "writing";
  case BuildState::Done:
    return "done";
  case BuildState::Failed:
    return "failed";
  }
  return "unknown";
}

static std::string contributor_name(const std::string &path_template,
                                    const std::optional<std::string> &variant) {
  return "'" + path_template + "' (" + describe_variant(variant) + ")";
}

SiteBuilder::SiteBuilder(BuildOptions options) : options_(std::move(options)) {}

SiteBuilder::~SiteBuilder() = default;

void SiteBuilder::add_route(std::unique_ptr<Route> route) {
  routes_.push_back(std::move(route));
}

std::string SiteBuilder::structural_stamp() const {
  Sha256 hasher;
  for (const auto &route : routes_) {
    RouteDefinition definition = route->definition();
    hasher.update_field(definition.kind() == RouteKind::Static ? "static"
                                                               : "dynamic");
    hasher.update_field(definition.path_template().value_or(""));
    for (const auto &variant : definition.locale_variants()) {
      hasher.update_field(variant.id);
      hasher.update_field(variant.path);
    }
  }

  // Everything a render can observe through PageContext or the output
  // pipeline besides params, content and assets.
  hasher.update_field(options_.dev ? "dev" : "release");
  hasher.update_field(options_.minify ? "minify" : "plain");
  hasher.update_field(options_.base_url.value_or(""));
  hasher.update_field(options_.assets_dir.generic_string());
  if (options_.minify && !options_.minifier_bundle.empty()) {
    hasher.update_field(
        sha256_file(options_.resolve(options_.minifier_bundle)).value_or(""));
  }

  std::string base = options_.structural_stamp.empty()
                         ? BuildInfo::getInstance().binary_stamp()
                         : options_.structural_stamp;
  return base + ":" + hasher.finish().substr(0, 16);
}

std::vector<SiteBuilder::PlannedPage> SiteBuilder::plan_pages() {
  state_ = BuildState::EnumeratingRoutes;

  std::vector<PlannedPage> planned;
  std::map<fs::path, std::string> owners;

  for (const auto &route : routes_) {
    RouteDefinition definition = route->definition();

    state_ = BuildState::ResolvingVariants;
    std::vector<VariantTemplate> variants = expand_variants(definition);

    for (const auto &variant : variants) {
      Pages pages;
      std::set<std::string> enumeration_sources;

      switch (definition.kind()) {
      case RouteKind::Static:
        if (!extract_params(variant.path_template).empty()) {
          throw MalformedTemplate(variant.path_template,
                                  "static routes cannot take parameters");
        }
        pages.emplace_back(ParamMap());
        break;

      case RouteKind::Dynamic: {
        DynamicRouteContext ctx(content_, variant.variant_id, options_.dev);
        try {
          pages = route->pages(ctx);
        } catch (...) {
          std::throw_with_nested(
              RenderError(variant.path_template, variant.variant_id));
        }
        enumeration_sources = ctx.content().sources_read();
        break;
      }
      }

      for (auto &page : pages) {
        ResolvedPath resolved = resolve_route(variant.path_template,
                                              page.params, page.optional_keys);

        std::string contributor =
            contributor_name(variant.path_template, variant.variant_id);
        auto [owner, inserted] =
            owners.emplace(resolved.file_path.lexically_normal(), contributor);
        if (!inserted) {
          throw DuplicateRoute(resolved.file_path.generic_string(),
                               owner->second, contributor);
        }

        PlannedPage entry;
        entry.route = route.get();
        entry.path_template = variant.path_template;
        entry.sitemap = definition.sitemap_metadata();
        entry.page.url = resolved.url;
        entry.page.file_path = resolved.file_path;
        entry.page.params = std::move(page.params);
        entry.page.props = std::move(page.props);
        entry.page.variant_id = variant.variant_id;
        entry.enumeration_sources = enumeration_sources;
        planned.push_back(std::move(entry));
      }
    }

    state_ = BuildState::EnumeratingRoutes;
  }

  return planned;
}

void SiteBuilder::check_static_collisions(
    const std::vector<PlannedPage> &planned) {
  std::map<fs::path, const PlannedPage *> by_file;
  for (const auto &entry : planned) {
    by_file[entry.page.file_path] = &entry;
  }

  auto check = [&by_file](const fs::path &relative, const std::string &what) {
    auto it = by_file.find(relative);
    if (it != by_file.end()) {
      throw DuplicateRoute(relative.generic_string(),
                           contributor_name(it->second->path_template,
                                            it->second->page.variant_id),
                           what);
    }
  };

  fs::path static_dir = options_.static_path();
  std::error_code ec;
  if (fs::is_directory(static_dir, ec)) {
    for (const auto &entry : fs::recursive_directory_iterator(static_dir)) {
      if (entry.is_regular_file()) {
        fs::path relative = entry.path().lexically_relative(static_dir);
        check(relative, "static file '" + relative.generic_string() + "'");
      }
    }
  }

  if (options_.sitemap.enabled && options_.base_url) {
    check(options_.sitemap.filename, "the sitemap");
  }
}

std::optional<SiteBuilder::RenderedPage>
SiteBuilder::reuse_page(const PlannedPage &planned) {
  if (!cache_) {
    return std::nullopt;
  }

  const CachedPage *cached = cache_->find(planned.page.file_path);
  if (!cached) {
    return std::nullopt;
  }

  std::vector<std::pair<std::string, std::string>> digests;
  for (const auto &name : cached->sources) {
    digests.emplace_back(name, content_.source_digest(name));
  }
  std::vector<AssetDependency> assets;
  for (const auto &path : cached->asset_sources) {
    assets.push_back({path, file_mtime(path)});
  }

  std::string fingerprint = compute_fingerprint(
      planned.page, digests, assets, cache_->structural_stamp());
  if (cache_->should_rebuild(planned.page.file_path, fingerprint)) {
    return std::nullopt;
  }

  std::optional<std::string> output =
      cache_->stored_output(planned.page.file_path);
  if (!output) {
    return std::nullopt;
  }

  RenderedPage rendered;
  rendered.output = std::move(*output);
  rendered.assets = cached->assets;
  rendered.cache_record = *cached;
  return rendered;
}

SiteBuilder::RenderedPage SiteBuilder::render_page(const PlannedPage &planned) {
  const ResolvedPage &page = planned.page;

  AssetLedger ledger(options_.assets_dir);
  PageContext ctx = make_context(page, content_, ledger, options_);

  RenderOutput result{std::string()};
  try {
    result = planned.route->render(ctx);
  } catch (...) {
    std::throw_with_nested(RenderError(page.url, page.variant_id));
  }

  RenderedPage rendered;

  switch (result.kind()) {
  case RenderOutput::Kind::Error:
    if (!result.error()) {
      throw RenderError(page.url, page.variant_id);
    }
    try {
      std::rethrow_exception(result.error());
    } catch (...) {
      std::throw_with_nested(RenderError(page.url, page.variant_id));
    }
    break;

  case RenderOutput::Kind::Bytes:
    if (!ledger.included_scripts().empty() ||
        !ledger.included_styles().empty()) {
      throw InvalidRenderResult(planned.path_template);
    }
    rendered.output.assign(result.bytes().begin(), result.bytes().end());
    break;

  case RenderOutput::Kind::Text: {
    std::vector<std::string> styles;
    for (const auto &path : ledger.included_styles()) {
      styles.push_back("/" + path.generic_string());
    }
    std::vector<std::string> scripts;
    for (const auto &path : ledger.included_scripts()) {
      scripts.push_back("/" + path.generic_string());
    }
    rendered.output = inject_head_tags(result.text(), styles, scripts);

    if (options_.minify && !options_.dev &&
        page.file_path.extension() == ".html") {
      MinifierOptions minify_options;
      if (script_minifier_) {
        std::shared_ptr<ScriptMinifier> minifier = script_minifier_;
        minify_options.inline_css = [minifier](const std::string &css) {
          return minifier->minify_css(css);
        };
        minify_options.inline_js = [minifier](const std::string &js) {
          return minifier->minify_js(js);
        };
      }
      rendered.output = Minifier::html(rendered.output, minify_options);
    }
    break;
  }
  }

  std::set<std::string> sources = ctx.content().sources_read();
  sources.insert(planned.enumeration_sources.begin(),
                 planned.enumeration_sources.end());

  std::vector<std::pair<std::string, std::string>> digests;
  for (const auto &name : sources) {
    digests.emplace_back(name, content_.source_digest(name));
  }

  std::vector<AssetDependency> asset_deps = ledger.dependencies();
  rendered.assets = ledger.records();

  CachedPage &record = rendered.cache_record;
  record.url = page.url;
  record.sources.assign(sources.begin(), sources.end());
  for (const auto &dep : asset_deps) {
    record.asset_sources.push_back(dep.source_path);
  }
  record.assets = rendered.assets;
  if (cache_) {
    record.fingerprint = compute_fingerprint(page, digests, asset_deps,
                                             cache_->structural_stamp());
  }

  return rendered;
}

void SiteBuilder::prepare_minifier() {
  if (!options_.minify || options_.dev) {
    script_minifier_.reset();
    return;
  }
  if (options_.minifier_bundle.empty()) {
    Log::warning("minify is on but no minifier_bundle is configured; scripts "
                 "and styles are copied as written");
    script_minifier_.reset();
    return;
  }

  fs::path bundle = options_.resolve(options_.minifier_bundle);
  if (script_minifier_ && script_minifier_bundle_ == bundle) {
    return;
  }

  auto minifier = std::make_shared<ScriptMinifier>();
  if (minifier->load(bundle)) {
    script_minifier_ = std::move(minifier);
    script_minifier_bundle_ = bundle;
  } else {
    Log::warning("Scripts and styles are copied as written");
    script_minifier_.reset();
  }
}

void SiteBuilder::prepare_output_dir() {
  fs::path output_dir = options_.output_path();
  std::error_code ec;

  if (options_.clean_output_dir && !options_.incremental &&
      fs::exists(output_dir)) {
    fs::remove_all(output_dir, ec);
    if (ec) {
      throw WriteError(output_dir, ec.message());
    }
  }

  fs::create_directories(output_dir, ec);
  if (ec) {
    throw WriteError(output_dir, ec.message());
  }
}

std::shared_ptr<AssetTransformer>
SiteBuilder::transformer_for(AssetKind kind) const {
  auto it = options_.transformers.find(kind);
  if (it != options_.transformers.end() && it->second) {
    return it->second;
  }
  if (kind == AssetKind::Image) {
    return std::make_shared<ImageCopyTransformer>();
  }
  if (script_minifier_) {
    return std::make_shared<MinifyTransformer>(script_minifier_);
  }
  return std::make_shared<CopyTransformer>();
}

void SiteBuilder::write_assets(const BuildAssetSet &assets,
                               BuildOutput &output) {
  if (assets.size() == 0) {
    return;
  }

  Log::title("📦 Processing assets");
  fs::path output_dir = options_.output_path();

  for (const auto &[build_path, record] : assets.records()) {
    std::string note =
        transformer_for(record.kind)->transform(record, output_dir / build_path);
    Log::asset(record.source_path.filename().string(),
               build_path.generic_string(), note);
    output.assets.push_back(build_path);
  }
}

void SiteBuilder::copy_static_files(BuildOutput &output) {
  fs::path static_dir = options_.static_path();
  std::error_code ec;
  if (!fs::is_directory(static_dir, ec)) {
    return;
  }

  Log::title("📁 Copying static files");
  fs::path output_dir = options_.output_path();

  for (const auto &entry : fs::recursive_directory_iterator(static_dir)) {
    if (!entry.is_regular_file()) {
      continue;
    }

    fs::path relative = entry.path().lexically_relative(static_dir);
    fs::path destination = output_dir / relative;

    fs::create_directories(destination.parent_path(), ec);
    if (ec) {
      throw WriteError(destination.parent_path(), ec.message());
    }
    fs::copy_file(entry.path(), destination,
                  fs::copy_options::overwrite_existing, ec);
    if (ec) {
      throw WriteError(destination, ec.message());
    }

    Log::asset(relative.generic_string(), relative.generic_string(), "");
    output.static_files.push_back(relative);
  }
}

void SiteBuilder::write_sitemap(const std::vector<PlannedPage> &planned,
                                BuildOutput &output) {
  if (!options_.sitemap.enabled) {
    return;
  }
  if (!options_.base_url || options_.base_url->empty()) {
    Log::warning("Sitemap is enabled but base_url is not set; skipping it");
    return;
  }

  std::vector<SitemapEntry> entries;
  for (const auto &entry : planned) {
    if (entry.sitemap.exclude || is_endpoint(entry.path_template)) {
      continue;
    }
    SitemapEntry sitemap_entry;
    sitemap_entry.loc = join_url(*options_.base_url, entry.page.url);
    sitemap_entry.changefreq =
        entry.sitemap.changefreq ? entry.sitemap.changefreq
                                 : options_.sitemap.changefreq;
    sitemap_entry.priority = entry.sitemap.priority ? entry.sitemap.priority
                                                    : options_.sitemap.priority;
    entries.push_back(std::move(sitemap_entry));
  }

  output.sitemap_files =
      generate_sitemap(std::move(entries), *options_.base_url,
                       options_.output_path(), options_.sitemap);
}

BuildOutput SiteBuilder::build() {
  auto build_start = std::chrono::steady_clock::now();
  state_ = BuildState::Init;
  Log::set_quiet(options_.quiet);
  BuildInfo::getInstance().generate_build_version();

  try {
    if (!Log::quiet()) {
      std::cout << "\n"
                << termcolor::bright_cyan
                << "╔═══════════════════════════════════════════╗\n"
                << "║        🚀 Building Static Site            ║\n"
                << "╚═══════════════════════════════════════════╝"
                << termcolor::reset << "\n";
      if (options_.dev) {
        Log::info("build", "Development build");
      }
    }

    content_.init_all();
    prepare_minifier();

    if (options_.incremental) {
      cache_ = std::make_unique<IncrementalCache>(options_.cache_path(),
                                                  structural_stamp());
      cache_->load();
    } else {
      cache_.reset();
    }

    std::vector<PlannedPage> planned = plan_pages();
    check_static_collisions(planned);

    state_ = BuildState::RenderingPages;
    Log::title("🔨 Building pages");

    BuildOutput output;
    BuildAssetSet assets;
    std::vector<std::pair<fs::path, std::string>> buffers;
    buffers.reserve(planned.size());

    for (const auto &entry : planned) {
      auto page_start = std::chrono::steady_clock::now();

      std::optional<RenderedPage> rendered = reuse_page(entry);
      bool reused = rendered.has_value();
      if (!reused) {
        rendered = render_page(entry);
      }

      assets.merge(rendered->assets);
      if (cache_) {
        cache_->record(entry.page.file_path, rendered->cache_record,
                       rendered->output);
      }

      Log::page(entry.page.url, entry.page.file_path.generic_string(),
                std::chrono::steady_clock::now() - page_start, reused);

      PageOutput page_output;
      page_output.route = entry.path_template;
      page_output.url = entry.page.url;
      page_output.file_path = entry.page.file_path;
      page_output.params = entry.page.params;
      page_output.variant = entry.page.variant_id;
      page_output.reused = reused;
      output.pages.push_back(std::move(page_output));

      if (reused) {
        output.reused++;
      } else {
        output.rendered++;
      }

      buffers.emplace_back(entry.page.file_path, std::move(rendered->output));
    }

    // Every render has finished; nothing below runs user code.
    state_ = BuildState::MergingAssets;
    prepare_output_dir();
    write_assets(assets, output);

    state_ = BuildState::Writing;
    fs::path output_dir = options_.output_path();
    for (const auto &[file_path, bytes] : buffers) {
      write_output_file(output_dir / file_path, bytes);
    }
    copy_static_files(output);
    write_sitemap(planned, output);

    if (cache_) {
      cache_->save();
    }

    state_ = BuildState::Done;
    output.elapsed = std::chrono::steady_clock::now() - build_start;
    print_build_summary(output);
    return output;
  } catch (...) {
    state_ = BuildState::Failed;
    throw;
  }
}

void SiteBuilder::print_build_summary(const BuildOutput &output) const {
  if (Log::quiet()) {
    return;
  }

  auto row = [](const std::string &label, const std::string &value) {
    std::cout << termcolor::bright_green << "║  " << termcolor::reset << label
              << termcolor::bright_white << std::setw(32) << std::left << value
              << termcolor::reset << termcolor::bright_green << "║"
              << termcolor::reset << "\n";
  };

  std::cout << "\n"
            << termcolor::bright_green
            << "╔═══════════════════════════════════════════╗\n"
            << "║           ✨ Build Complete!              ║\n"
            << "╠═══════════════════════════════════════════╣"
            << termcolor::reset << "\n";
  row("Output: ", options_.output_path().string());
  row("Time:   ", format_elapsed(output.elapsed));
  row("Pages:  ", std::to_string(output.pages.size()) + " (" +
                      std::to_string(output.rendered) + " rendered, " +
                      std::to_string(output.reused) + " cached)");
  row("Assets: ", std::to_string(output.assets.size()));
  std::cout << termcolor::bright_green
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n\n";
}

BuildResult build_site(SiteBuilder &builder) {
  BuildResult result;
  try {
    result.output = builder.build();
    result.ok = true;
  } catch (const KilnError &e) {
    result.error = std::current_exception();
    result.error_code = e.code();
    result.error_chain = format_error_chain(e);
    Log::error(result.error_chain);
  } catch (const std::exception &e) {
    result.error = std::current_exception();
    result.error_chain = format_error_chain(e);
    Log::error(result.error_chain);
  }
  return result;
}
