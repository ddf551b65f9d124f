#include <gtest/gtest.h>

#include "core/route_params.hpp"

namespace {

struct PostParams {
  std::string slug;
  int year = 0;
  std::optional<int> page;

  static ParamSchema<PostParams> schema() {
    return ParamSchema<PostParams>()
        .field("slug", &PostParams::slug)
        .field("year", &PostParams::year)
        .field("page", &PostParams::page);
  }
};

} // namespace

TEST(ParamSchemaTest, DecodesTypedFields) {
  ParamMap raw = {{"slug", "kilns"}, {"year", "2024"}, {"page", "3"}};
  PostParams params = PostParams::schema().decode(raw);
  EXPECT_EQ(params.slug, "kilns");
  EXPECT_EQ(params.year, 2024);
  ASSERT_TRUE(params.page);
  EXPECT_EQ(*params.page, 3);
}

TEST(ParamSchemaTest, AbsentOptionalDecodesToNullopt) {
  ParamMap raw = {{"slug", "kilns"}, {"year", "2024"}, {"page", std::nullopt}};
  EXPECT_FALSE(PostParams::schema().decode(raw).page);

  raw.erase("page");
  EXPECT_FALSE(PostParams::schema().decode(raw).page);
}

TEST(ParamSchemaTest, ConversionFailureNamesFieldAndType) {
  ParamMap raw = {{"slug", "kilns"}, {"year", "soon"}};
  try {
    PostParams::schema().decode(raw);
    FAIL() << "expected ParamConversionError";
  } catch (const ParamConversionError &e) {
    EXPECT_EQ(e.field, "year");
    EXPECT_EQ(e.expected_type, "int");
    EXPECT_EQ(e.code(), ErrorCode::ParamConversionError);
  }
}

TEST(ParamSchemaTest, MissingRequiredField) {
  EXPECT_THROW(PostParams::schema().decode({{"year", "1"}}),
               ParamConversionError);
}

TEST(ParamSchemaTest, EncodeMarksOptionalKeys) {
  PostParams params{"glaze", 2023, std::nullopt};
  ParamMap raw = PostParams::schema().encode(params);
  EXPECT_EQ(raw.at("slug"), std::optional<std::string>("glaze"));
  EXPECT_EQ(raw.at("year"), std::optional<std::string>("2023"));
  EXPECT_FALSE(raw.at("page"));

  Page page = Page::from(params);
  EXPECT_EQ(page.optional_keys, std::set<std::string>{"page"});
}

TEST(PaginateTest, SplitsItemsIntoPages) {
  std::vector<int> items = {1, 2, 3, 4, 5};
  Pages pages = paginate(items, 2, [](size_t index) {
    PostParams params;
    params.slug = "list";
    params.year = 2024;
    if (index > 0) {
      params.page = static_cast<int>(index + 1);
    }
    return params;
  });

  ASSERT_EQ(pages.size(), 3u);
  EXPECT_FALSE(pages[0].params.at("page"));
  EXPECT_EQ(pages[2].params.at("page"), std::optional<std::string>("3"));

  const auto &last = std::any_cast<const PaginationPage<int> &>(pages[2].props);
  EXPECT_EQ(last.items, std::vector<int>{5});
  EXPECT_EQ(last.total_pages, 3u);
  EXPECT_TRUE(last.has_prev);
  EXPECT_FALSE(last.has_next);
  EXPECT_EQ(last.start_index, 4u);
  EXPECT_EQ(last.end_index, 5u);
}

TEST(PaginateTest, EmptyInputYieldsNoPages) {
  std::vector<int> items;
  EXPECT_TRUE(paginate(items, 10, [](size_t) { return PostParams{}; }).empty());
}
