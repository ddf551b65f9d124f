#ifndef VARIANT_RESOLVER_HPP
#define VARIANT_RESOLVER_HPP

#include "route_definition.hpp"

#include <optional>
#include <string>
#include <vector>

struct VariantTemplate {
  std::optional<std::string> variant_id;
  std::string path_template;
};

std::string describe_variant(const std::optional<std::string> &variant_id);

// Base entry first (unless the route is variant-only), then each locale
// variant in declaration order. Two entries with the same normalized
// template throw DuplicateRoute; a route with neither a base path nor
// variants, or a prefix variant without a base, throws MalformedTemplate.
std::vector<VariantTemplate> expand_variants(const RouteDefinition &route);

#endif
