#ifndef MARKDOWN_LOADER_HPP
#define MARKDOWN_LOADER_HPP

#include "content_source.hpp"
#include "frontmatter.hpp"
#include "markdown.hpp"
#include "utils/hashing.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Sorted list of the .md files below `dir`. A missing directory yields an
// empty list.
std::vector<fs::path> find_markdown_files(const fs::path &dir);

std::string read_text_file(const fs::path &path);

// Loads every Markdown file below `dir` as one entry. The entry id is the
// file stem, the front matter is decoded into T through YAML::convert<T>
// and the body is rendered to HTML on first render().
template <typename T>
std::vector<ContentEntry<T>> load_markdown(const fs::path &dir) {
  std::vector<ContentEntry<T>> entries;

  for (const auto &path : find_markdown_files(dir)) {
    std::string raw = read_text_file(path);
    auto [fm, body] = FrontMatter::parse(raw);

    T data;
    try {
      data = fm.template as<T>();
    } catch (const YAML::Exception &e) {
      throw ConfigError("Invalid front matter in " + path.string() + ": " +
                        e.what());
    }

    entries.emplace_back(path.stem().string(), std::move(data), body, path,
                         &MarkdownProcessor::to_html, sha256_hex(raw));
  }

  return entries;
}

// Init function for ContentRegistry::add<T>.
template <typename T>
typename ContentSource<T>::InitFn markdown_source(const fs::path &dir) {
  return [dir]() { return load_markdown<T>(dir); };
}

#endif
