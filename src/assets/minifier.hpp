#ifndef MINIFIER_HPP
#define MINIFIER_HPP

#include <functional>
#include <optional>
#include <string>

using InlineMinifier =
    std::function<std::optional<std::string>(const std::string &)>;

struct MinifierOptions {
  bool remove_comments = true;
  bool collapse_whitespace = true;
  // Applied to inline <style> and JavaScript <script> bodies. A body is kept
  // as written when its hook is unset or returns nullopt.
  InlineMinifier inline_css;
  InlineMinifier inline_js;
};

// Whitespace and comment stripping for generated pages.
class Minifier {
public:
  using Options = MinifierOptions;

  static std::string html(const std::string &html,
                          const Options &opts = Options());

private:
  static bool is_whitespace(char c);
  static bool preserves_whitespace(const std::string &tag);
  static bool is_inline(const std::string &tag);
  static bool is_void(const std::string &tag);
  static bool is_javascript(const std::string &open_tag);
  static std::string trim(const std::string &text);
};

#endif
