#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <exception>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

enum class ErrorCode {
  MalformedTemplate,
  DuplicateRoute,
  SourceNotInitialized,
  SourceNotFound,
  EntryNotFound,
  ParamConversionError,
  AssetReadError,
  RenderError,
  WriteError,
  CacheCorrupt,
  InvalidRenderResult,
  ConfigError
};

const char *error_code_name(ErrorCode code);

class KilnError : public std::runtime_error {
public:
  KilnError(ErrorCode code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

class MalformedTemplate : public KilnError {
public:
  MalformedTemplate(const std::string &path_template,
                    const std::string &reason)
      : KilnError(ErrorCode::MalformedTemplate,
                  "Malformed route template '" + path_template +
                      "': " + reason),
        path_template(path_template) {}

  std::string path_template;
};

// `first` and `second` name the two contributors (route template plus
// variant id, or a static file) that produced the same output.
class DuplicateRoute : public KilnError {
public:
  DuplicateRoute(const std::string &path, const std::string &first,
                 const std::string &second)
      : KilnError(ErrorCode::DuplicateRoute,
                  "Duplicate route '" + path + "' produced by " + first +
                      " and " + second),
        path(path), first(first), second(second) {}

  std::string path;
  std::string first;
  std::string second;
};

class SourceNotInitialized : public KilnError {
public:
  explicit SourceNotInitialized(const std::string &source)
      : KilnError(ErrorCode::SourceNotInitialized,
                  "Content source '" + source +
                      "' was queried before initialization"),
        source(source) {}

  std::string source;
};

class SourceNotFound : public KilnError {
public:
  explicit SourceNotFound(const std::string &source,
                          const std::string &detail = "")
      : KilnError(ErrorCode::SourceNotFound,
                  "Content source '" + source + "' not found" +
                      (detail.empty() ? "" : " (" + detail + ")")),
        source(source) {}

  std::string source;
};

class EntryNotFound : public KilnError {
public:
  EntryNotFound(const std::string &source, const std::string &id)
      : KilnError(ErrorCode::EntryNotFound, "Entry '" + id +
                                                "' not found in source '" +
                                                source + "'"),
        source(source), id(id) {}

  std::string source;
  std::string id;
};

class ParamConversionError : public KilnError {
public:
  ParamConversionError(const std::string &field,
                       const std::string &expected_type,
                       const std::string &detail)
      : KilnError(ErrorCode::ParamConversionError,
                  "Cannot convert parameter '" + field + "' to " +
                      expected_type + ": " + detail),
        field(field), expected_type(expected_type) {}

  std::string field;
  std::string expected_type;
};

class AssetReadError : public KilnError {
public:
  AssetReadError(const fs::path &path, const std::string &reason)
      : KilnError(ErrorCode::AssetReadError,
                  "Failed to read asset " + path.string() + ": " + reason),
        path(path) {}

  fs::path path;
};

class RenderError : public KilnError {
public:
  RenderError(const std::string &url, const std::optional<std::string> &variant)
      : KilnError(ErrorCode::RenderError,
                  "Failed to render page " + url +
                      (variant ? " (variant " + *variant + ")" : "")),
        url(url), variant(variant) {}

  std::string url;
  std::optional<std::string> variant;
};

class WriteError : public KilnError {
public:
  WriteError(const fs::path &path, const std::string &reason)
      : KilnError(ErrorCode::WriteError,
                  "Cannot write " + path.string() + ": " + reason),
        path(path) {}

  fs::path path;
};

class CacheCorrupt : public KilnError {
public:
  explicit CacheCorrupt(const std::string &reason)
      : KilnError(ErrorCode::CacheCorrupt,
                  "Incremental cache unusable: " + reason) {}
};

class InvalidRenderResult : public KilnError {
public:
  explicit InvalidRenderResult(const std::string &route)
      : KilnError(ErrorCode::InvalidRenderResult,
                  "'" + route +
                      "' returned raw bytes but included styles or scripts, "
                      "which can only be injected into HTML text") {}
};

class ConfigError : public KilnError {
public:
  explicit ConfigError(const std::string &message)
      : KilnError(ErrorCode::ConfigError, message) {}
};

// Renders an exception and every std::nested_exception cause below it, one
// per line, outermost first.
std::string format_error_chain(const std::exception &e);
std::string format_error_chain(std::exception_ptr error);

#endif
