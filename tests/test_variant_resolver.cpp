#include <gtest/gtest.h>

#include "core/variant_resolver.hpp"
#include "core/errors.hpp"

TEST(VariantResolverTest, BaseFirstThenDeclarationOrder) {
  auto route = RouteDefinition::static_route("/about")
                   .locale("en", "/en/about")
                   .locale("sv", "/sv/om-oss");

  auto variants = expand_variants(route);
  ASSERT_EQ(variants.size(), 3u);
  EXPECT_FALSE(variants[0].variant_id);
  EXPECT_EQ(variants[0].path_template, "/about");
  EXPECT_EQ(*variants[1].variant_id, "en");
  EXPECT_EQ(variants[1].path_template, "/en/about");
  EXPECT_EQ(*variants[2].variant_id, "sv");
  EXPECT_EQ(variants[2].path_template, "/sv/om-oss");
}

TEST(VariantResolverTest, PrefixVariantJoinsBaseTemplate) {
  auto route = RouteDefinition::dynamic_route("/articles/[slug]")
                   .locale_prefix("fr", "/fr/");
  auto variants = expand_variants(route);
  ASSERT_EQ(variants.size(), 2u);
  EXPECT_EQ(variants[1].path_template, "/fr/articles/[slug]");
}

TEST(VariantResolverTest, VariantOnlyRouteHasNoBase) {
  auto route = RouteDefinition::variants_only(RouteKind::Static)
                   .locale("en", "/en/contact")
                   .locale("de", "/de/kontakt");
  auto variants = expand_variants(route);
  ASSERT_EQ(variants.size(), 2u);
  EXPECT_EQ(*variants[0].variant_id, "en");
}

TEST(VariantResolverTest, PrefixWithoutBaseIsMalformed) {
  auto route = RouteDefinition::variants_only(RouteKind::Static)
                   .locale_prefix("fr", "/fr");
  EXPECT_THROW(expand_variants(route), MalformedTemplate);
}

TEST(VariantResolverTest, CollidingTemplatesNameBothContributors) {
  auto route = RouteDefinition::static_route("/about")
                   .locale("en", "/about/");
  try {
    expand_variants(route);
    FAIL() << "expected DuplicateRoute";
  } catch (const DuplicateRoute &e) {
    EXPECT_EQ(e.first, "base route");
    EXPECT_EQ(e.second, "variant 'en'");
  }
}

TEST(VariantResolverTest, RouteWithoutPathOrVariants) {
  auto route = RouteDefinition::variants_only(RouteKind::Dynamic);
  EXPECT_THROW(expand_variants(route), MalformedTemplate);
}
