#include "frontmatter.hpp"

#include <stdexcept>

static void collect_fields(const YAML::Node &node, FrontMatter &fm) {
  if (!node.IsMap()) {
    return;
  }

  for (auto it = node.begin(); it != node.end(); ++it) {
    std::string key = it->first.as<std::string>();

    if (it->second.IsSequence()) {
      std::vector<std::string> arr;
      for (const auto &item : it->second) {
        if (item.IsScalar()) {
          arr.push_back(item.as<std::string>());
        }
      }
      fm.arrays[key] = arr;

      if (key == "tags") {
        fm.tags = arr;
      }
    } else if (it->second.IsScalar()) {
      fm.data[key] = it->second.as<std::string>();
    }
  }
}

std::pair<FrontMatter, std::string>
FrontMatter::parse(const std::string &content) {
  FrontMatter fm;

  if (content.compare(0, 3, "---") != 0) {
    return {fm, content};
  }

  size_t first_line_end = content.find('\n');
  if (first_line_end == std::string::npos) {
    return {fm, content};
  }

  size_t end_pos = content.find("\n---", first_line_end);
  if (end_pos == std::string::npos) {
    return {fm, content};
  }

  std::string yaml_str =
      content.substr(first_line_end + 1, end_pos - first_line_end - 1);

  size_t body_start = content.find('\n', end_pos + 4);
  std::string body =
      body_start == std::string::npos ? "" : content.substr(body_start + 1);

  try {
    fm.node = YAML::Load(yaml_str);
    collect_fields(fm.node, fm);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
  }

  return {fm, body};
}

std::string FrontMatter::get(const std::string &key,
                             const std::string &default_val) const {
  auto it = data.find(key);
  return (it != data.end()) ? it->second : default_val;
}

bool FrontMatter::has(const std::string &key) const {
  return data.find(key) != data.end() || arrays.find(key) != arrays.end();
}

bool YAML::convert<FrontMatter>::decode(const Node &node, FrontMatter &fm) {
  fm = FrontMatter();
  fm.node = node;
  collect_fields(node, fm);
  return true;
}
