#include "errors.hpp"

#include <sstream>

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::MalformedTemplate:
    return "MalformedTemplate";
  case ErrorCode::DuplicateRoute:
    return "DuplicateRoute";
  case ErrorCode::SourceNotInitialized:
    return "SourceNotInitialized";
  case ErrorCode::SourceNotFound:
    return "SourceNotFound";
  case ErrorCode::EntryNotFound:
    return "EntryNotFound";
  case ErrorCode::ParamConversionError:
    return "ParamConversionError";
  case ErrorCode::AssetReadError:
    return "AssetReadError";
  case ErrorCode::RenderError:
    return "RenderError";
  case ErrorCode::WriteError:
    return "WriteError";
  case ErrorCode::CacheCorrupt:
    return "CacheCorrupt";
  case ErrorCode::InvalidRenderResult:
    return "InvalidRenderResult";
  case ErrorCode::ConfigError:
    return "ConfigError";
  }
  return "Unknown";
}

static void append_chain(std::ostringstream &out, const std::exception &e,
                         int depth) {
  if (depth > 0) {
    out << "\n" << std::string(depth * 2, ' ') << "caused by: ";
  }
  out << e.what();

  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception &cause) {
    append_chain(out, cause, depth + 1);
  } catch (...) {
    out << "\n"
        << std::string((depth + 1) * 2, ' ') << "caused by: unknown error";
  }
}

std::string format_error_chain(const std::exception &e) {
  std::ostringstream out;
  append_chain(out, e, 0);
  return out.str();
}

std::string format_error_chain(std::exception_ptr error) {
  if (!error) {
    return "";
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return format_error_chain(e);
  } catch (...) {
    return "unknown error";
  }
}
