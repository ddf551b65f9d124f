#include <gtest/gtest.h>

#include "core/incremental_cache.hpp"
#include "test_helpers.hpp"

namespace {

ResolvedPage make_page(const std::string &url) {
  ResolvedPage page;
  page.url = url;
  page.file_path = fs::path(url.substr(1)) / "index.html";
  return page;
}

CachedPage make_record(const std::string &fingerprint) {
  CachedPage record;
  record.fingerprint = fingerprint;
  record.url = "/a/";
  record.sources = {"posts"};
  AssetRecord asset;
  asset.source_path = "/src/logo.png";
  asset.kind = AssetKind::Image;
  asset.build_path = "_kiln/0123456789abcdef.webp";
  asset.image_options.width = 64;
  asset.image_options.format = ImageFormat::Webp;
  record.assets = {asset};
  record.asset_sources = {asset.source_path};
  return record;
}

} // namespace

TEST(FingerprintTest, DependsOnEveryInput) {
  ResolvedPage page = make_page("/a/");
  std::vector<std::pair<std::string, std::string>> digests = {{"posts", "d1"}};
  std::vector<AssetDependency> assets = {{"/src/logo.png", 10}};

  std::string base = compute_fingerprint(page, digests, assets, "stamp");
  EXPECT_EQ(base, compute_fingerprint(page, digests, assets, "stamp"));

  EXPECT_NE(base, compute_fingerprint(page, {{"posts", "d2"}}, assets, "stamp"));
  EXPECT_NE(base, compute_fingerprint(page, digests, {{"/src/logo.png", 11}},
                                      "stamp"));
  EXPECT_NE(base, compute_fingerprint(page, digests, assets, "other"));

  ResolvedPage variant = page;
  variant.variant_id = "fr";
  EXPECT_NE(base, compute_fingerprint(variant, digests, assets, "stamp"));

  ResolvedPage with_params = page;
  with_params.params = {{"slug", "a"}};
  EXPECT_NE(base, compute_fingerprint(with_params, digests, assets, "stamp"));
}

TEST(IncrementalCacheTest, EmptyCacheRebuildsEverything) {
  TempDir dir;
  IncrementalCache cache(dir / "cache", "stamp");
  cache.load();
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_TRUE(cache.should_rebuild("a/index.html", "fp"));
}

TEST(IncrementalCacheTest, RoundTripsRecordsAndOutput) {
  TempDir dir;
  {
    IncrementalCache cache(dir / "cache", "stamp");
    cache.load();
    cache.record("a/index.html", make_record("fp1"), "<p>a</p>");
    cache.save();
  }

  IncrementalCache cache(dir / "cache", "stamp");
  cache.load();
  EXPECT_FALSE(cache.should_rebuild("a/index.html", "fp1"));
  EXPECT_TRUE(cache.should_rebuild("a/index.html", "fp2"));
  EXPECT_TRUE(cache.should_rebuild("b/index.html", "fp1"));

  const CachedPage *record = cache.find("a/index.html");
  ASSERT_NE(record, nullptr);
  ASSERT_EQ(record->assets.size(), 1u);
  EXPECT_EQ(record->assets[0].image_options.width, 64u);
  EXPECT_EQ(record->assets[0].image_options.format, ImageFormat::Webp);
  EXPECT_EQ(cache.stored_output("a/index.html"), "<p>a</p>");
}

TEST(IncrementalCacheTest, StructuralStampMismatchRebuildsEverything) {
  TempDir dir;
  {
    IncrementalCache cache(dir / "cache", "old-binary");
    cache.load();
    cache.record("a/index.html", make_record("fp1"), "x");
    cache.save();
  }

  IncrementalCache cache(dir / "cache", "new-binary");
  cache.load();
  EXPECT_FALSE(cache.stamp_matches());
  EXPECT_TRUE(cache.should_rebuild("a/index.html", "fp1"));
}

TEST(IncrementalCacheTest, CorruptFileDegradesToEmpty) {
  TempDir dir;
  write_file(dir / "cache" / "kiln-cache.json", "{ not json");

  IncrementalCache cache(dir / "cache", "stamp");
  EXPECT_NO_THROW(cache.load());
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_TRUE(cache.should_rebuild("a/index.html", "fp1"));
}

TEST(IncrementalCacheTest, VersionMismatchDegradesToEmpty) {
  TempDir dir;
  write_file(dir / "cache" / "kiln-cache.json",
             R"({"version": 999, "structural_stamp": "stamp", "pages": {}})");

  IncrementalCache cache(dir / "cache", "stamp");
  EXPECT_NO_THROW(cache.load());
  EXPECT_EQ(cache.size(), 0u);
}

TEST(IncrementalCacheTest, MissingBlobIsAMiss) {
  TempDir dir;
  {
    IncrementalCache cache(dir / "cache", "stamp");
    cache.load();
    cache.record("a/index.html", make_record("fp1"), "x");
    cache.save();
  }

  IncrementalCache cache(dir / "cache", "stamp");
  cache.load();
  fs::remove(cache.blob_path("a/index.html"));
  EXPECT_FALSE(cache.stored_output("a/index.html"));
}
