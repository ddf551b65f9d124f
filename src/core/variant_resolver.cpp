#include "variant_resolver.hpp"
#include "errors.hpp"
#include "route_resolver.hpp"

#include <unordered_map>
#include <unordered_set>

std::string describe_variant(const std::optional<std::string> &variant_id) {
  return variant_id ? "variant '" + *variant_id + "'" : "base route";
}

static std::string apply_prefix(const std::string &prefix,
                                const std::string &base) {
  std::string joined = prefix + "/" + base;
  std::string normalized = normalize_path(joined);

  // Keep an explicit trailing slash the author wrote on the base template.
  if (!base.empty() && base.back() == '/' && normalized.back() != '/') {
    normalized += '/';
  }
  return normalized;
}

std::vector<VariantTemplate> expand_variants(const RouteDefinition &route) {
  std::vector<VariantTemplate> expanded;

  if (!route.path_template() && route.locale_variants().empty()) {
    throw MalformedTemplate("<none>",
                            "route declares neither a path nor any variant");
  }

  if (route.path_template()) {
    expanded.push_back({std::nullopt, *route.path_template()});
  }

  std::unordered_set<std::string> ids;
  for (const auto &variant : route.locale_variants()) {
    if (variant.id.empty()) {
      throw MalformedTemplate(variant.path, "variant id must not be empty");
    }
    if (!ids.insert(variant.id).second) {
      throw MalformedTemplate(variant.path, "variant '" + variant.id +
                                                "' is declared twice");
    }

    if (variant.style == VariantStyle::Prefix) {
      if (!route.path_template()) {
        throw MalformedTemplate(variant.path,
                                "prefix variant '" + variant.id +
                                    "' requires a base path");
      }
      expanded.push_back(
          {variant.id, apply_prefix(variant.path, *route.path_template())});
    } else {
      expanded.push_back({variant.id, variant.path});
    }
  }

  std::unordered_map<std::string, const VariantTemplate *> seen;
  for (const auto &entry : expanded) {
    // Validates placeholders before any comparison.
    extract_params(entry.path_template);

    std::string key = normalize_path(entry.path_template);
    auto [it, inserted] = seen.emplace(key, &entry);
    if (!inserted) {
      throw DuplicateRoute(key, describe_variant(it->second->variant_id),
                           describe_variant(entry.variant_id));
    }
  }

  return expanded;
}
