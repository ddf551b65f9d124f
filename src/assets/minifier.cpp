#include "minifier.hpp"

#include <cctype>
#include <regex>
#include <unordered_set>
#include <vector>

bool Minifier::is_whitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool Minifier::preserves_whitespace(const std::string &tag) {
  return tag == "pre" || tag == "textarea";
}

bool Minifier::is_inline(const std::string &tag) {
  static const std::unordered_set<std::string> inline_tags = {
      "a",     "span", "strong", "em",   "b",   "i",      "u",
      "small", "code", "abbr",   "cite", "kbd", "mark",   "q",
      "s",     "sub",  "sup",    "time", "var", "button", "label"};
  return inline_tags.count(tag) > 0;
}

bool Minifier::is_void(const std::string &tag) {
  static const std::unordered_set<std::string> void_tags = {
      "area",  "base", "br",   "col",   "embed",  "hr",    "img",
      "input", "link", "meta", "param", "source", "track", "wbr"};
  return void_tags.count(tag) > 0;
}

std::string Minifier::trim(const std::string &text) {
  size_t start = 0;
  while (start < text.size() && is_whitespace(text[start])) {
    start++;
  }
  size_t end = text.size();
  while (end > start && is_whitespace(text[end - 1])) {
    end--;
  }
  return text.substr(start, end - start);
}

bool Minifier::is_javascript(const std::string &open_tag) {
  static const std::regex type_attr(
      R"(\stype\s*=\s*["']?([^"'\s>]+))", std::regex::icase);
  std::smatch match;
  if (!std::regex_search(open_tag, match, type_attr)) {
    return true;
  }
  std::string type = match[1].str();
  for (auto &c : type) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return type == "module" || type == "text/javascript" ||
         type == "application/javascript";
}

std::string Minifier::html(const std::string &html, const Options &opts) {
  std::string out;
  out.reserve(html.size());

  std::vector<std::string> open_tags;
  bool pending_space = false;
  size_t i = 0;
  const size_t len = html.size();

  auto inside = [&open_tags](bool (*predicate)(const std::string &)) {
    for (const auto &tag : open_tags) {
      if (predicate(tag)) {
        return true;
      }
    }
    return false;
  };

  auto drop_trailing_space = [&out]() {
    if (!out.empty() && out.back() == ' ') {
      out.pop_back();
    }
  };

  while (i < len) {
    if (html.compare(i, 4, "<!--") == 0) {
      size_t end = html.find("-->", i + 4);
      bool conditional = i + 4 < len && html[i + 4] == '[';
      if (end == std::string::npos) {
        out.append(html, i, std::string::npos);
        break;
      }
      if (!opts.remove_comments || conditional) {
        out.append(html, i, end + 3 - i);
      }
      i = end + 3;
      continue;
    }

    if (html.compare(i, 2, "<!") == 0) {
      size_t end = html.find('>', i);
      if (end == std::string::npos) {
        out.append(html, i, std::string::npos);
        break;
      }
      out.append(html, i, end + 1 - i);
      i = end + 1;
      pending_space = false;
      continue;
    }

    char c = html[i];

    if (c == '<') {
      pending_space = false;
      size_t tag_start = out.size();
      out += c;
      i++;

      bool closing = i < len && html[i] == '/';
      if (closing) {
        out += '/';
        i++;
      }

      std::string tag;
      while (i < len && !is_whitespace(html[i]) && html[i] != '>' &&
             html[i] != '/') {
        tag += static_cast<char>(std::tolower(static_cast<unsigned char>(html[i])));
        out += html[i];
        i++;
      }

      if (closing) {
        if (!open_tags.empty() && open_tags.back() == tag) {
          open_tags.pop_back();
        }
      } else if (!is_void(tag)) {
        open_tags.push_back(tag);
      }

      char quote = '\0';
      bool self_closed = false;
      while (i < len && (quote || html[i] != '>')) {
        char ch = html[i];
        if (quote) {
          out += ch;
          if (ch == quote) {
            quote = '\0';
          }
        } else if (ch == '"' || ch == '\'') {
          quote = ch;
          out += ch;
        } else if (ch == '/' && i + 1 < len && html[i + 1] == '>') {
          drop_trailing_space();
          out += '/';
          self_closed = true;
        } else if (opts.collapse_whitespace && is_whitespace(ch)) {
          if (out.back() != ' ') {
            out += ' ';
          }
        } else {
          out += ch;
        }
        i++;
      }

      if (self_closed && !open_tags.empty() && open_tags.back() == tag) {
        open_tags.pop_back();
      }

      if (i < len) {
        drop_trailing_space();
        out += '>';
        i++;
      }

      if (!closing && !self_closed && (tag == "script" || tag == "style")) {
        std::string end_tag = "</" + tag + ">";
        size_t end = html.find(end_tag, i);
        if (end != std::string::npos) {
          std::string body = trim(html.substr(i, end - i));
          InlineMinifier hook;
          if (tag == "style") {
            hook = opts.inline_css;
          } else if (is_javascript(out.substr(tag_start))) {
            hook = opts.inline_js;
          }
          if (!body.empty() && hook) {
            if (auto minified = hook(body)) {
              body = std::move(*minified);
            }
          }
          out += body;
          i = end;
        }
      }
      continue;
    }

    if (inside(&Minifier::preserves_whitespace)) {
      out += c;
      i++;
      continue;
    }

    if (opts.collapse_whitespace && is_whitespace(c)) {
      pending_space = true;
      i++;
      continue;
    }

    if (pending_space && !out.empty() && out.back() != '>') {
      out += ' ';
    } else if (pending_space && !out.empty() && inside(&Minifier::is_inline)) {
      out += ' ';
    }
    pending_space = false;
    out += c;
    i++;
  }

  return out;
}
