#ifndef ROUTE_HPP
#define ROUTE_HPP

#include "page_context.hpp"
#include "route_definition.hpp"
#include "route_params.hpp"

#include <cstdint>
#include <exception>
#include <string>
#include <variant>
#include <vector>

// What a render produced: an HTML/text document, raw bytes (images, feeds
// built elsewhere) or a captured failure.
class RenderOutput {
public:
  enum class Kind { Text, Bytes, Error };

  RenderOutput(std::string text) : value_(std::move(text)) {}
  RenderOutput(const char *text) : value_(std::string(text)) {}
  RenderOutput(std::vector<uint8_t> bytes) : value_(std::move(bytes)) {}

  static RenderOutput failure(std::exception_ptr error) {
    RenderOutput output{std::string()};
    output.value_ = std::move(error);
    return output;
  }

  Kind kind() const { return static_cast<Kind>(value_.index()); }

  const std::string &text() const { return std::get<std::string>(value_); }
  const std::vector<uint8_t> &bytes() const {
    return std::get<std::vector<uint8_t>>(value_);
  }
  const std::exception_ptr &error() const {
    return std::get<std::exception_ptr>(value_);
  }

private:
  std::variant<std::string, std::vector<uint8_t>, std::exception_ptr> value_;
};

// A user page. definition() is read once per build; pages() is called once
// per variant for dynamic routes.
class Route {
public:
  virtual ~Route() = default;

  virtual RouteDefinition definition() const = 0;

  virtual Pages pages(DynamicRouteContext &ctx) {
    (void)ctx;
    return {};
  }

  virtual RenderOutput render(PageContext &ctx) = 0;
};

#endif
