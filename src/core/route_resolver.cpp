#include "route_resolver.hpp"

#include <sstream>

static size_t preceding_backslashes(const std::string &text, size_t pos) {
  size_t count = 0;
  while (pos > count && text[pos - count - 1] == '\\') {
    ++count;
  }
  return count;
}

std::vector<ParameterDef> extract_params(const std::string &path_template) {
  std::vector<ParameterDef> params;
  size_t start = 0;

  while (true) {
    size_t open = path_template.find('[', start);
    if (open == std::string::npos) {
      break;
    }

    if (preceding_backslashes(path_template, open) % 2 == 1) {
      start = open + 1;
      continue;
    }

    size_t close = path_template.find(']', open + 1);
    if (close == std::string::npos) {
      throw MalformedTemplate(path_template, "unterminated '[' at position " +
                                                 std::to_string(open));
    }

    std::string key = path_template.substr(open + 1, close - open - 1);
    if (key.empty()) {
      throw MalformedTemplate(path_template, "empty parameter name");
    }
    if (key.find('/') != std::string::npos ||
        key.find('[') != std::string::npos) {
      throw MalformedTemplate(path_template,
                              "invalid parameter name '" + key + "'");
    }

    params.push_back({key, open, close - open + 1});
    start = close + 1;
  }

  return params;
}

bool is_endpoint(const std::string &path_template) {
  size_t slash = path_template.find_last_of('/');
  std::string last = slash == std::string::npos
                         ? path_template
                         : path_template.substr(slash + 1);

  size_t dot = last.find_last_of('.');
  return dot != std::string::npos && dot > 0 && dot + 1 < last.size();
}

std::string normalize_path(const std::string &path) {
  std::string result;
  std::istringstream iss(path);
  std::string segment;

  while (std::getline(iss, segment, '/')) {
    if (segment.empty()) {
      continue;
    }
    result += "/" + segment;
  }

  return result.empty() ? "/" : result;
}

static bool is_dot_segment(const std::string &segment) {
  return segment == "." || segment == "..";
}

// Values may span several segments, but none of them may step outside the
// page's own directory.
static void check_param_segments(const std::string &key,
                                 const std::string &value) {
  std::istringstream iss(value);
  std::string segment;
  while (std::getline(iss, segment, '/')) {
    if (is_dot_segment(segment)) {
      throw ParamConversionError(key, "path segment",
                                 "'" + value + "' contains '" + segment + "'");
    }
  }
}

static std::string unescape_brackets(const std::string &text) {
  std::string result;
  result.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\\' && i + 1 < text.size() &&
        (text[i + 1] == '[' || text[i + 1] == ']')) {
      continue;
    }
    result += text[i];
  }
  return result;
}

ResolvedPath resolve_route(const std::string &path_template,
                           const ParamMap &params,
                           const std::set<std::string> &optional_keys) {
  auto defs = extract_params(path_template);
  bool endpoint = is_endpoint(path_template);

  // Replace from the back so earlier indices stay valid.
  std::string route = path_template;
  for (auto it = defs.rbegin(); it != defs.rend(); ++it) {
    auto value = params.find(it->key);
    std::string replacement;

    if (value == params.end()) {
      if (optional_keys.count(it->key) == 0) {
        throw MalformedTemplate(path_template, "missing required parameter '" +
                                                   it->key + "'");
      }
    } else if (value->second) {
      replacement = *value->second;
      check_param_segments(it->key, replacement);
    }

    route.replace(it->index, it->length, replacement);
  }

  std::string normalized = normalize_path(unescape_brackets(route));

  ResolvedPath resolved;
  resolved.url = normalized;
  if (!endpoint && resolved.url.back() != '/') {
    resolved.url += '/';
  }

  fs::path file_path;
  std::istringstream iss(normalized);
  std::string segment;
  while (std::getline(iss, segment, '/')) {
    if (is_dot_segment(segment)) {
      throw MalformedTemplate(path_template,
                              "'" + segment + "' is not a valid path segment");
    }
    if (!segment.empty()) {
      file_path /= segment;
    }
  }
  if (!endpoint) {
    file_path /= "index.html";
  }
  resolved.file_path = file_path;

  return resolved;
}
