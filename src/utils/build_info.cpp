#include "build_info.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

const std::string &BuildInfo::binary_stamp() {
  if (!binary_stamp_.empty()) {
    return binary_stamp_;
  }

  binary_stamp_ = std::string("kiln-") + KILN_VERSION;

  std::error_code ec;
  fs::path exe = fs::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return binary_stamp_;
  }

  auto size = fs::file_size(exe, ec);
  if (ec) {
    return binary_stamp_;
  }
  auto mtime = fs::last_write_time(exe, ec);
  if (ec) {
    return binary_stamp_;
  }

  binary_stamp_ += ":" + std::to_string(size) + ":" +
                   std::to_string(mtime.time_since_epoch().count());
  return binary_stamp_;
}
