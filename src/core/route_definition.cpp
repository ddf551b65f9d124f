#include "route_definition.hpp"

const char *change_freq_name(ChangeFreq freq) {
  switch (freq) {
  case ChangeFreq::Always:
    return "always";
  case ChangeFreq::Hourly:
    return "hourly";
  case ChangeFreq::Daily:
    return "daily";
  case ChangeFreq::Weekly:
    return "weekly";
  case ChangeFreq::Monthly:
    return "monthly";
  case ChangeFreq::Yearly:
    return "yearly";
  case ChangeFreq::Never:
    return "never";
  }
  return "never";
}

std::optional<ChangeFreq> change_freq_from_name(const std::string &name) {
  for (ChangeFreq freq :
       {ChangeFreq::Always, ChangeFreq::Hourly, ChangeFreq::Daily,
        ChangeFreq::Weekly, ChangeFreq::Monthly, ChangeFreq::Yearly,
        ChangeFreq::Never}) {
    if (name == change_freq_name(freq)) {
      return freq;
    }
  }
  return std::nullopt;
}

RouteDefinition RouteDefinition::static_route(const std::string &path_template) {
  return RouteDefinition(RouteKind::Static, path_template);
}

RouteDefinition
RouteDefinition::dynamic_route(const std::string &path_template) {
  return RouteDefinition(RouteKind::Dynamic, path_template);
}

RouteDefinition RouteDefinition::variants_only(RouteKind kind) {
  return RouteDefinition(kind, std::nullopt);
}

RouteDefinition &RouteDefinition::locale(const std::string &id,
                                         const std::string &path) {
  variants_.push_back({id, path, VariantStyle::Path});
  return *this;
}

RouteDefinition &RouteDefinition::locale_prefix(const std::string &id,
                                                const std::string &prefix) {
  variants_.push_back({id, prefix, VariantStyle::Prefix});
  return *this;
}

RouteDefinition &RouteDefinition::sitemap(const SitemapMetadata &metadata) {
  sitemap_ = metadata;
  return *this;
}

std::string RouteDefinition::display_name() const {
  if (path_template_) {
    return *path_template_;
  }
  if (!variants_.empty()) {
    return variants_.front().path;
  }
  return "<unnamed route>";
}
