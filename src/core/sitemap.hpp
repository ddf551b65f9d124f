#ifndef SITEMAP_HPP
#define SITEMAP_HPP

#include "build_options.hpp"
#include "route_definition.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct SitemapEntry {
  // Absolute url.
  std::string loc;
  std::optional<ChangeFreq> changefreq;
  std::optional<double> priority;
};

std::string xml_escape(const std::string &text);

std::string render_urlset(const std::vector<SitemapEntry> &entries);
std::string render_sitemap_index(const std::vector<std::string> &locations);

// Writes options.filename below output_root; above options.max_urls entries
// it writes sitemap-N.xml chunks and turns options.filename into an index.
// Returns the written paths relative to output_root.
std::vector<fs::path> generate_sitemap(std::vector<SitemapEntry> entries,
                                       const std::string &base_url,
                                       const fs::path &output_root,
                                       const SitemapOptions &options);

#endif
