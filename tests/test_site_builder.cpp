#include <gtest/gtest.h>

#include "core/site_builder.hpp"
#include "test_helpers.hpp"
#include "utils/hashing.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>

namespace {

struct SlugParams {
  std::string slug;

  static ParamSchema<SlugParams> schema() {
    return ParamSchema<SlugParams>().field("slug", &SlugParams::slug);
  }
};

struct OptionalParams {
  std::optional<std::string> x;

  static ParamSchema<OptionalParams> schema() {
    return ParamSchema<OptionalParams>().field("x", &OptionalParams::x);
  }
};

// Route whose behaviour is supplied by the test.
class TestRoute : public Route {
public:
  using PagesFn = std::function<Pages(DynamicRouteContext &)>;
  using RenderFn = std::function<RenderOutput(PageContext &)>;

  TestRoute(RouteDefinition definition, RenderFn render_fn,
            PagesFn pages_fn = nullptr)
      : definition_(std::move(definition)), render_fn_(std::move(render_fn)),
        pages_fn_(std::move(pages_fn)) {}

  RouteDefinition definition() const override { return definition_; }

  Pages pages(DynamicRouteContext &ctx) override {
    return pages_fn_ ? pages_fn_(ctx) : Pages();
  }

  RenderOutput render(PageContext &ctx) override {
    renders++;
    return render_fn_(ctx);
  }

  int renders = 0;

private:
  RouteDefinition definition_;
  RenderFn render_fn_;
  PagesFn pages_fn_;
};

RenderOutput echo_url(PageContext &ctx) {
  return "<html><head></head><body>" + ctx.current_url() + "</body></html>";
}

BuildOptions test_options(const TempDir &dir) {
  BuildOptions options;
  options.root = dir.path();
  options.quiet = true;
  options.structural_stamp = "test-engine";
  return options;
}

std::vector<std::string> urls_of(const BuildOutput &output) {
  std::vector<std::string> urls;
  for (const auto &page : output.pages) {
    urls.push_back(page.url);
  }
  std::sort(urls.begin(), urls.end());
  return urls;
}

// Registers "posts" with one string entry per slug; `body` is read at every
// init so tests can change content between builds.
void add_posts(SiteBuilder &builder, std::shared_ptr<std::string> body,
               std::vector<std::string> slugs) {
  builder.content().add<std::string>("posts", [body, slugs]() {
    std::vector<ContentEntry<std::string>> entries;
    for (const auto &slug : slugs) {
      entries.emplace_back(slug, *body + " " + slug, std::nullopt, std::nullopt,
                           nullptr, sha256_hex(*body + slug));
    }
    return entries;
  });
}

Pages post_pages(DynamicRouteContext &ctx) {
  return ctx.content().get_source<std::string>("posts").into_pages(
      [](const ContentEntry<std::string> &entry) {
        return Page::from(SlugParams{entry.id});
      });
}

RenderOutput render_post(PageContext &ctx) {
  auto params = ctx.params<SlugParams>();
  return ctx.content().get_entry<std::string>("posts", params.slug).data;
}

} // namespace

TEST(SiteBuilderTest, StaticRouteWritesIndexFile) {
  TempDir dir;
  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(RouteDefinition::static_route("/"), echo_url);

  BuildOutput output = builder.build();

  EXPECT_EQ(builder.state(), BuildState::Done);
  ASSERT_EQ(output.pages.size(), 1u);
  EXPECT_EQ(output.pages[0].url, "/");
  EXPECT_EQ(read_file(dir / "dist/index.html"),
            "<html><head></head><body>/</body></html>");
}

TEST(SiteBuilderTest, OptionalParameterSetToNoneCollapses) {
  TempDir dir;
  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(
      RouteDefinition::dynamic_route("/a/[x]/b"), echo_url,
      [](DynamicRouteContext &) {
        return Pages{Page::from(OptionalParams{std::nullopt}),
                     Page::from(OptionalParams{"y"})};
      });

  BuildOutput output = builder.build();

  EXPECT_EQ(urls_of(output), (std::vector<std::string>{"/a/b/", "/a/y/b/"}));
  EXPECT_TRUE(fs::exists(dir / "dist/a/b/index.html"));
  EXPECT_TRUE(fs::exists(dir / "dist/a/y/b/index.html"));
}

TEST(SiteBuilderTest, LocaleVariantsEachProduceAPage) {
  TempDir dir;
  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(RouteDefinition::static_route("/about")
                                   .locale("en", "/en/about")
                                   .locale("sv", "/sv/om-oss"),
                               [](PageContext &ctx) -> RenderOutput {
                                 return ctx.variant().value_or("base");
                               });

  BuildOutput output = builder.build();

  EXPECT_EQ(output.pages.size(), 3u);
  EXPECT_EQ(read_file(dir / "dist/about/index.html"), "base");
  EXPECT_EQ(read_file(dir / "dist/en/about/index.html"), "en");
  EXPECT_EQ(read_file(dir / "dist/sv/om-oss/index.html"), "sv");
}

TEST(SiteBuilderTest, DynamicRouteEnumeratesPerVariant) {
  TempDir dir;
  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(
      RouteDefinition::dynamic_route("/articles/[slug]")
          .locale_prefix("fr", "/fr"),
      echo_url, [](DynamicRouteContext &ctx) {
        if (ctx.variant() == std::optional<std::string>("fr")) {
          return Pages{Page::from(SlugParams{"bonjour"})};
        }
        return Pages{Page::from(SlugParams{"one"}),
                     Page::from(SlugParams{"two"})};
      });

  BuildOutput output = builder.build();

  EXPECT_EQ(urls_of(output),
            (std::vector<std::string>{"/articles/one/", "/articles/two/",
                                      "/fr/articles/bonjour/"}));
  for (const auto &page : output.pages) {
    if (page.url == "/fr/articles/bonjour/") {
      EXPECT_EQ(page.variant, std::optional<std::string>("fr"));
    } else {
      EXPECT_FALSE(page.variant);
    }
  }
}

TEST(SiteBuilderTest, OneFailingRenderFailsTheBuild) {
  TempDir dir;
  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(
      RouteDefinition::dynamic_route("/p/[slug]"),
      [](PageContext &ctx) -> RenderOutput {
        if (ctx.params<SlugParams>().slug == "bad") {
          return RenderOutput::failure(std::make_exception_ptr(
              std::runtime_error("kiln temperature out of range")));
        }
        return "ok";
      },
      [](DynamicRouteContext &) {
        return Pages{Page::from(SlugParams{"a"}), Page::from(SlugParams{"bad"}),
                     Page::from(SlugParams{"c"})};
      });

  BuildResult result = build_site(builder);

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error_code, ErrorCode::RenderError);
  EXPECT_NE(result.error_chain.find("/p/bad/"), std::string::npos);
  EXPECT_NE(result.error_chain.find("kiln temperature out of range"),
            std::string::npos);
  EXPECT_EQ(builder.state(), BuildState::Failed);
  EXPECT_FALSE(fs::exists(dir / "dist/p/a/index.html"));
}

TEST(SiteBuilderTest, ThrowingRenderIsWrappedWithItsUrl) {
  TempDir dir;
  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(RouteDefinition::static_route("/broken"),
                               [](PageContext &ctx) -> RenderOutput {
                                 ctx.content().get_source<int>("missing");
                                 return "unreachable";
                               });

  try {
    builder.build();
    FAIL() << "expected a RenderError";
  } catch (const RenderError &e) {
    EXPECT_EQ(e.url, "/broken/");
    EXPECT_NE(format_error_chain(e).find("missing"), std::string::npos);
  }
}

TEST(SiteBuilderTest, DuplicateRouteIsReportedBeforeAnyRender) {
  TempDir dir;
  SiteBuilder builder(test_options(dir));
  TestRoute &first = builder.add_route<TestRoute>(
      RouteDefinition::static_route("/same"), echo_url);
  TestRoute &second = builder.add_route<TestRoute>(
      RouteDefinition::dynamic_route("/[slug]"), echo_url,
      [](DynamicRouteContext &) { return Pages{Page::from(SlugParams{"same"})}; });

  BuildResult result = build_site(builder);

  EXPECT_EQ(result.error_code, ErrorCode::DuplicateRoute);
  EXPECT_EQ(first.renders, 0);
  EXPECT_EQ(second.renders, 0);
  EXPECT_FALSE(fs::exists(dir / "dist"));
}

TEST(SiteBuilderTest, CurrentDirectorySlugIsRejected) {
  TempDir dir;
  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(RouteDefinition::static_route("/posts"),
                               echo_url);
  TestRoute &posts = builder.add_route<TestRoute>(
      RouteDefinition::dynamic_route("/posts/[slug]"), echo_url,
      [](DynamicRouteContext &) { return Pages{Page::from(SlugParams{"."})}; });

  BuildResult result = build_site(builder);

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error_code, ErrorCode::ParamConversionError);
  EXPECT_EQ(posts.renders, 0);
  EXPECT_FALSE(fs::exists(dir / "dist"));
}

TEST(SiteBuilderTest, SlugCannotWriteOutsideTheOutputDirectory) {
  TempDir dir;
  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(
      RouteDefinition::dynamic_route("/posts/[slug]"), echo_url,
      [](DynamicRouteContext &) {
        return Pages{Page::from(SlugParams{"../../../etc"})};
      });

  BuildResult result = build_site(builder);

  EXPECT_EQ(result.error_code, ErrorCode::ParamConversionError);
  EXPECT_FALSE(fs::exists(dir.path().parent_path() / "etc" / "index.html"));
  EXPECT_FALSE(fs::exists(dir / "etc"));
}

TEST(SiteBuilderTest, StaticRouteWithParametersIsMalformed) {
  TempDir dir;
  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(RouteDefinition::static_route("/p/[slug]"),
                               echo_url);

  EXPECT_THROW(builder.build(), MalformedTemplate);
}

TEST(SiteBuilderTest, SecondIncrementalBuildReusesEveryPage) {
  TempDir dir;
  BuildOptions options = test_options(dir);
  options.incremental = true;
  auto body = std::make_shared<std::string>("v1");

  SiteBuilder builder(options);
  add_posts(builder, body, {"a", "b"});
  TestRoute &route = builder.add_route<TestRoute>(
      RouteDefinition::dynamic_route("/posts/[slug]"), render_post, post_pages);

  BuildOutput first = builder.build();
  EXPECT_EQ(first.rendered, 2u);
  EXPECT_EQ(first.reused, 0u);

  BuildOutput second = builder.build();
  EXPECT_EQ(second.rendered, 0u);
  EXPECT_EQ(second.reused, 2u);
  EXPECT_EQ(route.renders, 2);
  EXPECT_EQ(read_file(dir / "dist/posts/a/index.html"), "v1 a");
}

TEST(SiteBuilderTest, ChangedContentInvalidatesDependentPages) {
  TempDir dir;
  BuildOptions options = test_options(dir);
  options.incremental = true;
  auto body = std::make_shared<std::string>("v1");

  SiteBuilder builder(options);
  add_posts(builder, body, {"a"});
  builder.add_route<TestRoute>(RouteDefinition::dynamic_route("/posts/[slug]"),
                               render_post, post_pages);
  builder.add_route<TestRoute>(RouteDefinition::static_route("/about"),
                               echo_url);

  builder.build();
  *body = "v2";
  BuildOutput output = builder.build();

  EXPECT_EQ(output.rendered, 1u);
  EXPECT_EQ(output.reused, 1u);
  EXPECT_EQ(read_file(dir / "dist/posts/a/index.html"), "v2 a");
}

TEST(SiteBuilderTest, NewEngineStampRebuildsEverything) {
  TempDir dir;
  BuildOptions options = test_options(dir);
  options.incremental = true;

  {
    SiteBuilder builder(options);
    builder.add_route<TestRoute>(RouteDefinition::static_route("/"), echo_url);
    builder.build();
  }

  options.structural_stamp = "other-engine";
  SiteBuilder builder(options);
  builder.add_route<TestRoute>(RouteDefinition::static_route("/"), echo_url);
  BuildOutput output = builder.build();

  EXPECT_EQ(output.rendered, 1u);
  EXPECT_EQ(output.reused, 0u);
}

TEST(SiteBuilderTest, SwitchingDevModeRerendersCachedPages) {
  TempDir dir;
  BuildOptions options = test_options(dir);
  options.incremental = true;

  SiteBuilder builder(options);
  TestRoute &route = builder.add_route<TestRoute>(
      RouteDefinition::static_route("/"), [](PageContext &ctx) -> RenderOutput {
        return ctx.is_dev() ? "dev" : "prod";
      });

  builder.build();
  EXPECT_EQ(read_file(dir / "dist/index.html"), "prod");

  builder.options().dev = true;
  BuildOutput output = builder.build();

  EXPECT_EQ(output.rendered, 1u);
  EXPECT_EQ(output.reused, 0u);
  EXPECT_EQ(route.renders, 2);
  EXPECT_EQ(read_file(dir / "dist/index.html"), "dev");
}

TEST(SiteBuilderTest, ChangingBaseUrlRerendersCachedPages) {
  TempDir dir;
  BuildOptions options = test_options(dir);
  options.incremental = true;
  options.base_url = "https://old.example";

  SiteBuilder builder(options);
  builder.add_route<TestRoute>(RouteDefinition::static_route("/"),
                               [](PageContext &ctx) -> RenderOutput {
                                 return ctx.canonical_url().value_or("");
                               });

  builder.build();
  builder.options().base_url = "https://new.example";
  BuildOutput output = builder.build();

  EXPECT_EQ(output.rendered, 1u);
  EXPECT_EQ(read_file(dir / "dist/index.html"), "https://new.example/");
}

TEST(SiteBuilderTest, TouchedAssetRerendersOnlyPagesUsingIt) {
  TempDir dir;
  write_file(dir / "img/logo.png", "png bytes");
  fs::path logo = dir / "img/logo.png";

  BuildOptions options = test_options(dir);
  options.incremental = true;
  SiteBuilder builder(options);
  TestRoute &with_logo = builder.add_route<TestRoute>(
      RouteDefinition::static_route("/brand"),
      [logo](PageContext &ctx) -> RenderOutput {
        return ctx.assets().add_image(logo).url();
      });
  TestRoute &plain = builder.add_route<TestRoute>(
      RouteDefinition::static_route("/about"), echo_url);

  BuildOutput first = builder.build();
  EXPECT_EQ(first.rendered, 2u);

  fs::last_write_time(logo,
                      fs::last_write_time(logo) + std::chrono::seconds(10));
  BuildOutput second = builder.build();

  EXPECT_EQ(second.rendered, 1u);
  EXPECT_EQ(second.reused, 1u);
  EXPECT_EQ(with_logo.renders, 2);
  EXPECT_EQ(plain.renders, 1);
}

TEST(SiteBuilderTest, AssetsAreWrittenOncePerBuildPath) {
  TempDir dir;
  write_file(dir / "img/logo.png", "png bytes");
  fs::path logo = dir / "img/logo.png";

  SiteBuilder builder(test_options(dir));
  auto render = [logo](PageContext &ctx) -> RenderOutput {
    const AssetRecord &record = ctx.assets().add_image(logo);
    return record.url();
  };
  builder.add_route<TestRoute>(RouteDefinition::static_route("/one"), render);
  builder.add_route<TestRoute>(RouteDefinition::static_route("/two"), render);
  builder.add_route<TestRoute>(
      RouteDefinition::static_route("/small"),
      [logo](PageContext &ctx) -> RenderOutput {
        ImageOptions options;
        options.width = 32;
        return ctx.assets().add_image(logo, options).url();
      });

  BuildOutput output = builder.build();

  ASSERT_EQ(output.assets.size(), 2u);
  std::string one = read_file(dir / "dist/one/index.html");
  EXPECT_EQ(one, read_file(dir / "dist/two/index.html"));
  EXPECT_NE(one, read_file(dir / "dist/small/index.html"));
  EXPECT_EQ(read_file(dir / "dist" / one.substr(1)), "png bytes");
}

TEST(SiteBuilderTest, IncludedStylesAreLinkedFromTheHead) {
  TempDir dir;
  write_file(dir / "assets/site.css", "body {\n  margin : 0;\n}\n");
  fs::path css = dir / "assets/site.css";

  BuildOptions options = test_options(dir);
  options.minify = true;
  SiteBuilder builder(options);
  builder.add_route<TestRoute>(RouteDefinition::static_route("/"),
                               [css](PageContext &ctx) -> RenderOutput {
                                 ctx.assets().include_style(css);
                                 return "<html><head></head><body></body></html>";
                               });

  BuildOutput output = builder.build();

  ASSERT_EQ(output.assets.size(), 1u);
  std::string href = "/" + output.assets[0].generic_string();
  EXPECT_NE(read_file(dir / "dist/index.html").find(href), std::string::npos);
  // No minifier bundle is configured, so the stylesheet is copied as written.
  EXPECT_EQ(read_file(dir / "dist" / output.assets[0]),
            "body {\n  margin : 0;\n}\n");
}

TEST(SiteBuilderTest, BytesWithIncludedAssetsAreRejected) {
  TempDir dir;
  write_file(dir / "assets/site.css", "body{}");
  fs::path css = dir / "assets/site.css";

  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(RouteDefinition::static_route("/feed.bin"),
                               [css](PageContext &ctx) -> RenderOutput {
                                 ctx.assets().include_style(css);
                                 return std::vector<uint8_t>{1, 2, 3};
                               });

  EXPECT_THROW(builder.build(), InvalidRenderResult);
}

TEST(SiteBuilderTest, EndpointsKeepTheirFileName) {
  TempDir dir;
  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(RouteDefinition::static_route("/feed.json"),
                               [](PageContext &) -> RenderOutput {
                                 return std::vector<uint8_t>{'{', '}'};
                               });

  BuildOutput output = builder.build();

  ASSERT_EQ(output.pages.size(), 1u);
  EXPECT_EQ(output.pages[0].url, "/feed.json");
  EXPECT_EQ(read_file(dir / "dist/feed.json"), "{}");
}

TEST(SiteBuilderTest, StaticFilesAreCopiedVerbatim) {
  TempDir dir;
  write_file(dir / "static/robots.txt", "User-agent: *\n");
  write_file(dir / "static/fonts/a.woff2", "font");

  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(RouteDefinition::static_route("/"), echo_url);
  BuildOutput output = builder.build();

  EXPECT_EQ(output.static_files.size(), 2u);
  EXPECT_EQ(read_file(dir / "dist/robots.txt"), "User-agent: *\n");
  EXPECT_EQ(read_file(dir / "dist/fonts/a.woff2"), "font");
}

TEST(SiteBuilderTest, StaticFileCollidingWithPageIsDuplicate) {
  TempDir dir;
  write_file(dir / "static/feed.json", "{}");

  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(RouteDefinition::static_route("/feed.json"),
                               [](PageContext &) -> RenderOutput { return "{}"; });

  EXPECT_THROW(builder.build(), DuplicateRoute);
}

TEST(SiteBuilderTest, SitemapListsPagesButNotEndpoints) {
  TempDir dir;
  BuildOptions options = test_options(dir);
  options.base_url = "https://ceramics.example/";
  options.sitemap.enabled = true;

  SiteBuilder builder(options);
  builder.add_route<TestRoute>(RouteDefinition::static_route("/"), echo_url);
  builder.add_route<TestRoute>(
      RouteDefinition::static_route("/about").sitemap(
          {false, ChangeFreq::Yearly, 0.3}),
      echo_url);
  builder.add_route<TestRoute>(
      RouteDefinition::static_route("/drafts").sitemap({true, {}, {}}),
      echo_url);
  builder.add_route<TestRoute>(RouteDefinition::static_route("/feed.json"),
                               [](PageContext &) -> RenderOutput { return "{}"; });

  BuildOutput output = builder.build();

  ASSERT_EQ(output.sitemap_files.size(), 1u);
  std::string xml = read_file(dir / "dist/sitemap.xml");
  EXPECT_NE(xml.find("<loc>https://ceramics.example/</loc>"), std::string::npos);
  EXPECT_NE(xml.find("<loc>https://ceramics.example/about/</loc>"),
            std::string::npos);
  EXPECT_NE(xml.find("<changefreq>yearly</changefreq>"), std::string::npos);
  EXPECT_EQ(xml.find("drafts"), std::string::npos);
  EXPECT_EQ(xml.find("feed.json"), std::string::npos);
}

TEST(SiteBuilderTest, SitemapNeedsABaseUrl) {
  TempDir dir;
  BuildOptions options = test_options(dir);
  options.sitemap.enabled = true;

  SiteBuilder builder(options);
  builder.add_route<TestRoute>(RouteDefinition::static_route("/"), echo_url);
  BuildOutput output = builder.build();

  EXPECT_TRUE(output.sitemap_files.empty());
  EXPECT_FALSE(fs::exists(dir / "dist/sitemap.xml"));
}

TEST(SiteBuilderTest, CleanBuildRemovesStaleOutput) {
  TempDir dir;
  write_file(dir / "dist/old/index.html", "stale");

  SiteBuilder builder(test_options(dir));
  builder.add_route<TestRoute>(RouteDefinition::static_route("/"), echo_url);
  builder.build();

  EXPECT_FALSE(fs::exists(dir / "dist/old/index.html"));
  EXPECT_TRUE(fs::exists(dir / "dist/index.html"));
}
