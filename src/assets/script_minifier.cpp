#include "script_minifier.hpp"
#include "utils/logging.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

static const char *SETUP_CODE = R"(
  globalThis.__kilnMinifyJS = function(code) {
    const state = { code: null, error: null };
    Terser.minify(code, {
      compress: { dead_code: true, drop_debugger: true, keep_fargs: true },
      mangle: { toplevel: false },
      format: { comments: false }
    }).then(r => { state.code = r.code; })
      .catch(e => { state.error = String(e && e.message ? e.message : e); });
    return state;
  };

  globalThis.__kilnMinifyCSS = function(code) {
    const result = csso.minify(code, {
      restructure: true,
      forceMediaMerge: false,
      comments: false
    });
    return { code: result.css, error: null };
  };
)";

// Promise jobs run per call; Terser settles well within this.
static const int MAX_PENDING_JOBS = 1000;

ScriptMinifier::ScriptMinifier() : rt(nullptr), ctx(nullptr), initialized(false) {}

ScriptMinifier::~ScriptMinifier() {
  if (ctx) {
    JS_FreeContext(ctx);
  }
  if (rt) {
    JS_FreeRuntime(rt);
  }
}

std::string ScriptMinifier::take_exception() {
  JSValue exception = JS_GetException(ctx);
  const char *text = JS_ToCString(ctx, exception);
  std::string message = text ? text : "unknown error";
  JS_FreeCString(ctx, text);
  JS_FreeValue(ctx, exception);
  return message;
}

bool ScriptMinifier::load(const fs::path &bundle_path) {
  initialized = false;

  std::ifstream file(bundle_path, std::ios::binary);
  if (!file.is_open()) {
    Log::warning("Cannot open minifier bundle " + bundle_path.string() + ": " +
                 std::strerror(errno));
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  std::string bundle = buffer.str();

  if (!rt) {
    rt = JS_NewRuntime();
    if (!rt) {
      Log::warning("Failed to create QuickJS runtime");
      return false;
    }
  }
  if (!ctx) {
    ctx = JS_NewContext(rt);
    if (!ctx) {
      Log::warning("Failed to create QuickJS context");
      return false;
    }
  }

  std::string name = bundle_path.filename().string();
  JSValue result = JS_Eval(ctx, bundle.c_str(), bundle.size(), name.c_str(),
                           JS_EVAL_TYPE_GLOBAL);
  if (JS_IsException(result)) {
    Log::warning("Error loading " + name + ": " + take_exception());
    JS_FreeValue(ctx, result);
    return false;
  }
  JS_FreeValue(ctx, result);

  JSValue setup = JS_Eval(ctx, SETUP_CODE, std::strlen(SETUP_CODE), "<setup>",
                          JS_EVAL_TYPE_GLOBAL);
  if (JS_IsException(setup)) {
    Log::warning("Error setting up minifiers: " + take_exception());
    JS_FreeValue(ctx, setup);
    return false;
  }
  JS_FreeValue(ctx, setup);

  initialized = true;
  return true;
}

std::optional<std::string> ScriptMinifier::call(const char *function,
                                                const std::string &code) {
  if (!initialized) {
    return std::nullopt;
  }

  JSValue global = JS_GetGlobalObject(ctx);
  JSValue func = JS_GetPropertyStr(ctx, global, function);
  if (!JS_IsFunction(ctx, func)) {
    JS_FreeValue(ctx, func);
    JS_FreeValue(ctx, global);
    Log::warning(std::string(function) + " is not defined");
    return std::nullopt;
  }

  JSValue args[1] = {JS_NewStringLen(ctx, code.c_str(), code.size())};
  JSValue state = JS_Call(ctx, func, global, 1, args);
  JS_FreeValue(ctx, args[0]);
  JS_FreeValue(ctx, func);
  JS_FreeValue(ctx, global);

  if (JS_IsException(state)) {
    Log::warning("Minification failed: " + take_exception());
    JS_FreeValue(ctx, state);
    return std::nullopt;
  }

  JSContext *job_ctx = nullptr;
  for (int i = 0; i < MAX_PENDING_JOBS; ++i) {
    int status = JS_ExecutePendingJob(rt, &job_ctx);
    if (status == 0) {
      break;
    }
    if (status < 0) {
      Log::warning("Minification failed: " + take_exception());
      JS_FreeValue(ctx, state);
      return std::nullopt;
    }
  }

  std::optional<std::string> output;
  JSValue error = JS_GetPropertyStr(ctx, state, "error");
  JSValue result = JS_GetPropertyStr(ctx, state, "code");

  if (!JS_IsNull(error) && !JS_IsUndefined(error)) {
    const char *text = JS_ToCString(ctx, error);
    Log::warning(std::string("Minification failed: ") +
                 (text ? text : "unknown error"));
    JS_FreeCString(ctx, text);
  } else if (JS_IsString(result)) {
    const char *text = JS_ToCString(ctx, result);
    if (text) {
      output = std::string(text);
    }
    JS_FreeCString(ctx, text);
  }

  JS_FreeValue(ctx, result);
  JS_FreeValue(ctx, error);
  JS_FreeValue(ctx, state);
  return output;
}

std::optional<std::string> ScriptMinifier::minify_js(const std::string &code) {
  return call("__kilnMinifyJS", code);
}

std::optional<std::string> ScriptMinifier::minify_css(const std::string &code) {
  return call("__kilnMinifyCSS", code);
}
