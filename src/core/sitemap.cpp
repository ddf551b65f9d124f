#include "sitemap.hpp"
#include "assets/asset_transformer.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

static const char *SITEMAP_XMLNS = "http://www.sitemaps.org/schemas/sitemap/0.9";

std::string xml_escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&apos;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string render_urlset(const std::vector<SitemapEntry> &entries) {
  std::ostringstream xml;
  xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      << "<urlset xmlns=\"" << SITEMAP_XMLNS << "\">";

  for (const auto &entry : entries) {
    xml << "<url><loc>" << xml_escape(entry.loc) << "</loc>";
    if (entry.changefreq) {
      xml << "<changefreq>" << change_freq_name(*entry.changefreq)
          << "</changefreq>";
    }
    if (entry.priority) {
      xml << "<priority>" << std::fixed << std::setprecision(1)
          << *entry.priority << "</priority>";
    }
    xml << "</url>";
  }

  xml << "</urlset>";
  return xml.str();
}

std::string render_sitemap_index(const std::vector<std::string> &locations) {
  std::ostringstream xml;
  xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      << "<sitemapindex xmlns=\"" << SITEMAP_XMLNS << "\">";
  for (const auto &loc : locations) {
    xml << "<sitemap><loc>" << xml_escape(loc) << "</loc></sitemap>";
  }
  xml << "</sitemapindex>";
  return xml.str();
}

std::vector<fs::path> generate_sitemap(std::vector<SitemapEntry> entries,
                                       const std::string &base_url,
                                       const fs::path &output_root,
                                       const SitemapOptions &options) {
  std::vector<fs::path> written;
  if (!options.enabled || entries.empty()) {
    return written;
  }

  std::sort(entries.begin(), entries.end(),
            [](const SitemapEntry &a, const SitemapEntry &b) {
              return a.loc < b.loc;
            });

  size_t per_file = std::max<size_t>(options.max_urls, 1);

  if (entries.size() <= per_file) {
    write_output_file(output_root / options.filename, render_urlset(entries));
    written.push_back(options.filename);
    Log::info("sitemap", "Generated sitemap with " +
                             std::to_string(entries.size()) + " URLs");
    return written;
  }

  std::string base = base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }

  std::vector<std::string> locations;
  for (size_t start = 0, n = 1; start < entries.size(); start += per_file, ++n) {
    size_t end = std::min(start + per_file, entries.size());
    std::vector<SitemapEntry> chunk(entries.begin() + start,
                                    entries.begin() + end);

    std::string filename = "sitemap-" + std::to_string(n) + ".xml";
    write_output_file(output_root / filename, render_urlset(chunk));
    written.push_back(filename);
    locations.push_back(base + "/" + filename);
  }

  write_output_file(output_root / options.filename,
                    render_sitemap_index(locations));
  written.push_back(options.filename);

  Log::info("sitemap", "Generated sitemap index with " +
                           std::to_string(locations.size()) + " sitemaps (" +
                           std::to_string(entries.size()) + " total URLs)");
  return written;
}
