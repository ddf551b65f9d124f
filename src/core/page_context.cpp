#include "page_context.hpp"

std::string join_url(const std::string &base_url, const std::string &path) {
  std::string base = base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  if (path.empty() || path.front() != '/') {
    return base + "/" + path;
  }
  return base + path;
}

std::optional<std::string> PageContext::canonical_url() const {
  if (!options_.base_url || options_.base_url->empty()) {
    return std::nullopt;
  }
  return join_url(*options_.base_url, page_.url);
}

PageContext make_context(const ResolvedPage &page,
                         const ContentRegistry &registry, AssetLedger &assets,
                         const BuildOptions &options) {
  return PageContext(page, registry, assets, options);
}
