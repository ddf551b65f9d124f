#ifndef SCRIPT_MINIFIER_HPP
#define SCRIPT_MINIFIER_HPP

#include <filesystem>
#include <optional>
#include <string>

#include <quickjs.h>

namespace fs = std::filesystem;

// Terser and csso running in an embedded QuickJS runtime. The bundle that
// defines the global `Terser` and `csso` objects is evaluated by load().
class ScriptMinifier {
private:
  JSRuntime *rt;
  JSContext *ctx;
  bool initialized;

  std::optional<std::string> call(const char *function,
                                  const std::string &code);
  std::string take_exception();

public:
  ScriptMinifier();
  ~ScriptMinifier();

  ScriptMinifier(const ScriptMinifier &) = delete;
  ScriptMinifier &operator=(const ScriptMinifier &) = delete;

  // Logs a warning and returns false when the bundle cannot be read or
  // evaluated.
  bool load(const fs::path &bundle_path);
  bool ready() const { return initialized; }

  // nullopt when the minifier is not loaded or rejects the input.
  std::optional<std::string> minify_js(const std::string &code);
  std::optional<std::string> minify_css(const std::string &code);
};

#endif
