#ifndef TEMPLATE_ENGINE_HPP
#define TEMPLATE_ENGINE_HPP

#include "page_context.hpp"

#include <ctime>
#include <filesystem>
#include <string>
#include <inja/inja.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

// inja environment rooted at the site's templates directory, with the
// date/truncate/slice/limit helpers available in every template.
class TemplateEngine {
public:
  using json = nlohmann::json;

  explicit TemplateEngine(const fs::path &templates_dir = fs::path());

  // Renders a file below the templates directory, e.g. "article.html".
  std::string render_file(const std::string &name, const json &data);
  std::string render(const std::string &template_content, const json &data);

  // Drops parsed layouts and partials so edited files are read again.
  void reload();

  // {"url", "variant", "params", "canonical_url", "dev"} for one page.
  static json page_data(const PageContext &ctx);

  static json yaml_to_json(const YAML::Node &node);

  // Accepts YYYY-MM-DD, YYYY/MM/DD, DD-MM-YYYY and MM/DD/YYYY.
  static bool parse_date(const std::string &date_str, std::tm &tm);

  // Formats with "long", "short", "iso" or a yyyy/MMMM/MMM/MM/dd pattern.
  static std::string format_date(const std::string &date_str,
                                 std::string format);

private:
  void setup_custom_filters();

  fs::path templates_dir_;
  inja::Environment env;
};

#endif
