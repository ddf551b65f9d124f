#include <gtest/gtest.h>

#include "core/sitemap.hpp"
#include "test_helpers.hpp"

TEST(SitemapTest, EscapesXml) {
  EXPECT_EQ(xml_escape("a&b<c>\"d'"), "a&amp;b&lt;c&gt;&quot;d&apos;");
}

TEST(SitemapTest, SortsEntriesAndWritesOptionalFields) {
  std::string xml = render_urlset({{"https://x.org/b/", ChangeFreq::Weekly, 0.5},
                                   {"https://x.org/a/", std::nullopt, std::nullopt}});
  EXPECT_NE(xml.find("<url><loc>https://x.org/b/</loc><changefreq>weekly"
                     "</changefreq><priority>0.5</priority></url>"),
            std::string::npos);

  TempDir dir;
  SitemapOptions options;
  options.enabled = true;
  auto written = generate_sitemap({{"https://x.org/b/", std::nullopt, std::nullopt},
                                   {"https://x.org/a/", std::nullopt, std::nullopt}},
                                  "https://x.org", dir.path(), options);
  ASSERT_EQ(written.size(), 1u);
  std::string out = read_file(dir / "sitemap.xml");
  EXPECT_LT(out.find("https://x.org/a/"), out.find("https://x.org/b/"));
}

TEST(SitemapTest, SplitsIntoChunksWithIndex) {
  TempDir dir;
  SitemapOptions options;
  options.enabled = true;
  options.max_urls = 2;

  std::vector<SitemapEntry> entries;
  for (int i = 0; i < 5; ++i) {
    entries.push_back({"https://x.org/p" + std::to_string(i) + "/",
                       std::nullopt, std::nullopt});
  }

  auto written = generate_sitemap(entries, "https://x.org/", dir.path(), options);
  EXPECT_EQ(written.size(), 4u);
  EXPECT_TRUE(fs::exists(dir / "sitemap-3.xml"));

  std::string index = read_file(dir / "sitemap.xml");
  EXPECT_NE(index.find("<sitemapindex"), std::string::npos);
  EXPECT_NE(index.find("<loc>https://x.org/sitemap-1.xml</loc>"),
            std::string::npos);
}

TEST(SitemapTest, DisabledWritesNothing) {
  TempDir dir;
  SitemapOptions options;
  auto written = generate_sitemap({{"https://x.org/", std::nullopt, std::nullopt}},
                                  "https://x.org", dir.path(), options);
  EXPECT_TRUE(written.empty());
  EXPECT_FALSE(fs::exists(dir / "sitemap.xml"));
}
