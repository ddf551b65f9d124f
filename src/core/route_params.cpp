#include "route_params.hpp"

std::string describe_params(const ParamMap &params) {
  std::string result = "{";
  bool first = true;
  for (const auto &[key, value] : params) {
    if (!first) {
      result += ", ";
    }
    first = false;
    result += key + ": " + (value ? "\"" + *value + "\"" : "None");
  }
  result += "}";
  return result;
}
