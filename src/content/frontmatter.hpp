#ifndef FRONTMATTER_HPP
#define FRONTMATTER_HPP

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

// YAML block delimited by '---' lines at the top of a content file.
class FrontMatter {
public:
  YAML::Node node;
  std::map<std::string, std::string> data;
  std::unordered_map<std::string, std::vector<std::string>> arrays;
  std::vector<std::string> tags;

  // Returns the front matter and the remaining body. Content without a
  // leading '---' yields an empty front matter and the full text.
  static std::pair<FrontMatter, std::string> parse(const std::string &content);

  std::string get(const std::string &key,
                  const std::string &default_val = "") const;
  bool has(const std::string &key) const;

  // Decodes the whole block through YAML::convert<T>.
  template <typename T> T as() const {
    if (!node || node.IsNull()) {
      return YAML::Node(YAML::NodeType::Map).as<T>();
    }
    return node.as<T>();
  }
};

namespace YAML {
template <> struct convert<FrontMatter> {
  static bool decode(const Node &node, FrontMatter &fm);
};
} // namespace YAML

#endif
