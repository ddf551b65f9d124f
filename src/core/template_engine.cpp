#include "template_engine.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

static std::string env_root(const fs::path &templates_dir) {
  if (templates_dir.empty()) {
    return "./";
  }
  std::string root = templates_dir.string();
  if (root.back() != '/') {
    root += '/';
  }
  return root;
}

TemplateEngine::TemplateEngine(const fs::path &templates_dir)
    : templates_dir_(templates_dir), env(env_root(templates_dir)) {
  env.set_trim_blocks(true);
  env.set_lstrip_blocks(true);
  setup_custom_filters();
}

void TemplateEngine::reload() {
  env = inja::Environment(env_root(templates_dir_));
  env.set_trim_blocks(true);
  env.set_lstrip_blocks(true);
  setup_custom_filters();
}

std::string TemplateEngine::render_file(const std::string &name,
                                        const json &data) {
  try {
    return env.render_file(name, data);
  } catch (const inja::InjaError &e) {
    throw std::runtime_error("Template error in " + name + ": " + e.what());
  }
}

std::string TemplateEngine::render(const std::string &template_content,
                                   const json &data) {
  try {
    return env.render(template_content, data);
  } catch (const inja::InjaError &e) {
    throw std::runtime_error(std::string("Template render error: ") +
                             e.what());
  }
}

TemplateEngine::json TemplateEngine::page_data(const PageContext &ctx) {
  json params = json::object();
  for (const auto &[key, value] : ctx.raw_params()) {
    params[key] = value ? json(*value) : json(nullptr);
  }

  json page = {{"url", ctx.current_url()},
               {"params", params},
               {"dev", ctx.is_dev()}};
  page["variant"] = ctx.variant() ? json(*ctx.variant()) : json(nullptr);

  auto canonical = ctx.canonical_url();
  page["canonical_url"] = canonical ? json(*canonical) : json(nullptr);
  return page;
}

TemplateEngine::json TemplateEngine::yaml_to_json(const YAML::Node &node) {
  if (!node || node.IsNull()) {
    return nullptr;
  }

  if (node.IsScalar()) {
    // Quoted scalars stay strings.
    if (node.Tag() == "!") {
      return node.Scalar();
    }
    long long integer = 0;
    if (YAML::convert<long long>::decode(node, integer)) {
      return integer;
    }
    double number = 0;
    if (YAML::convert<double>::decode(node, number)) {
      return number;
    }
    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag)) {
      return flag;
    }
    return node.Scalar();
  }

  if (node.IsSequence()) {
    json result = json::array();
    for (const auto &item : node) {
      result.push_back(yaml_to_json(item));
    }
    return result;
  }

  json result = json::object();
  for (auto it = node.begin(); it != node.end(); ++it) {
    result[it->first.as<std::string>()] = yaml_to_json(it->second);
  }
  return result;
}

bool TemplateEngine::parse_date(const std::string &date_str, std::tm &tm) {
  static const char *formats[] = {"%Y-%m-%d", "%Y/%m/%d", "%d-%m-%Y",
                                  "%m/%d/%Y"};
  for (const char *format : formats) {
    tm = {};
    std::istringstream ss(date_str);
    ss >> std::get_time(&tm, format);
    if (!ss.fail()) {
      return true;
    }
  }
  return false;
}

static void replace_token(std::string &text, const std::string &token,
                          const std::string &value) {
  size_t pos = text.find(token);
  if (pos != std::string::npos) {
    text.replace(pos, token.size(), value);
  }
}

static std::string two_digits(int value) {
  std::string digits = std::to_string(value);
  return digits.size() == 1 ? "0" + digits : digits;
}

std::string TemplateEngine::format_date(const std::string &date_str,
                                        std::string format) {
  std::tm tm = {};
  if (!parse_date(date_str, tm)) {
    return date_str;
  }

  static const char *month_names[] = {
      "January", "February", "March",     "April",   "May",      "June",
      "July",    "August",   "September", "October", "November", "December"};
  static const char *month_names_short[] = {"Jan", "Feb", "Mar", "Apr",
                                            "May", "Jun", "Jul", "Aug",
                                            "Sep", "Oct", "Nov", "Dec"};

  if (format == "long") {
    format = "MMMM d, yyyy";
  } else if (format == "short") {
    format = "MMM d, yyyy";
  } else if (format == "iso") {
    format = "yyyy-MM-dd";
  }

  // Month names first so their letters are not taken for day tokens.
  std::string month;
  if (format.find("MMMM") != std::string::npos) {
    replace_token(format, "MMMM", "\x01");
    month = month_names[tm.tm_mon];
  } else if (format.find("MMM") != std::string::npos) {
    replace_token(format, "MMM", "\x01");
    month = month_names_short[tm.tm_mon];
  } else if (format.find("MM") != std::string::npos) {
    replace_token(format, "MM", "\x01");
    month = two_digits(tm.tm_mon + 1);
  }

  replace_token(format, "yyyy", std::to_string(1900 + tm.tm_year));
  if (format.find("dd") != std::string::npos) {
    replace_token(format, "dd", two_digits(tm.tm_mday));
  } else {
    replace_token(format, "d", std::to_string(tm.tm_mday));
  }
  replace_token(format, "\x01", month);
  return format;
}

void TemplateEngine::setup_custom_filters() {
  env.add_callback("date", 2, [](inja::Arguments &args) {
    return format_date(args.at(0)->get<std::string>(),
                       args.at(1)->get<std::string>());
  });

  env.add_callback("truncate", 2, [](inja::Arguments &args) {
    std::string str = args.at(0)->get<std::string>();
    int len = args.at(1)->get<int>();
    if (len >= 0 && str.length() > static_cast<size_t>(len)) {
      return str.substr(0, len) + "...";
    }
    return str;
  });

  env.add_callback("slice", 3, [](inja::Arguments &args) {
    const json &arr = *args.at(0);
    int start = std::max(args.at(1)->get<int>(), 0);
    int end = args.at(2)->get<int>();

    json result = json::array();
    if (!arr.is_array()) {
      return result;
    }
    end = std::min(end, static_cast<int>(arr.size()));
    for (int i = start; i < end; ++i) {
      result.push_back(arr[i]);
    }
    return result;
  });

  env.add_callback("limit", 2, [](inja::Arguments &args) {
    const json &arr = *args.at(0);
    int count = args.at(1)->get<int>();

    json result = json::array();
    if (!arr.is_array()) {
      return result;
    }
    for (int i = 0; i < count && i < static_cast<int>(arr.size()); ++i) {
      result.push_back(arr[i]);
    }
    return result;
  });
}
