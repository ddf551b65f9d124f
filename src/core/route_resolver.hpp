#ifndef ROUTE_RESOLVER_HPP
#define ROUTE_RESOLVER_HPP

#include "route_params.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct ParameterDef {
  std::string key;
  size_t index = 0;
  size_t length = 0;

  bool operator==(const ParameterDef &other) const {
    return key == other.key && index == other.index && length == other.length;
  }
};

struct ResolvedPath {
  std::string url;
  fs::path file_path;
};

// Placeholders in template order. Brackets escaped with '\' are skipped;
// an unterminated '[' throws MalformedTemplate.
std::vector<ParameterDef> extract_params(const std::string &path_template);

// True when the final segment of the template carries a file extension,
// e.g. "/feed.xml" or "/api/[id].json".
bool is_endpoint(const std::string &path_template);

// Joins non-empty segments with single slashes, with a leading slash.
std::string normalize_path(const std::string &path);

// Substitutes params into the template. Absent or empty values elide the
// placeholder; a missing key not listed in `optional_keys` is a
// MalformedTemplate. file_path is relative to the output directory.
ResolvedPath resolve_route(const std::string &path_template,
                           const ParamMap &params,
                           const std::set<std::string> &optional_keys = {});

#endif
