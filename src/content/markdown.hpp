#ifndef MARKDOWN_HPP
#define MARKDOWN_HPP

#include <string>

class MarkdownProcessor {
public:
  // GitHub-flavored Markdown to HTML. Throws std::runtime_error when md4c
  // rejects the input.
  static std::string to_html(const std::string &markdown);
};

#endif
