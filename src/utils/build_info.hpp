#ifndef BUILD_INFO_HPP
#define BUILD_INFO_HPP

#include <chrono>
#include <cstdint>
#include <string>

#define KILN_VERSION "0.4.0"

// Process-wide identity of the running site binary.
class BuildInfo {
private:
  uint64_t build_version_ = 0;
  std::string binary_stamp_;

  BuildInfo() {}

public:
  BuildInfo(const BuildInfo &) = delete;
  BuildInfo &operator=(const BuildInfo &) = delete;

  static BuildInfo &getInstance() {
    static BuildInfo instance;
    return instance;
  }

  // Millisecond timestamp of the latest (re)build started by this process.
  const uint64_t &getVersion() const { return build_version_; }

  void setVersion(const uint64_t &new_version) { build_version_ = new_version; }

  void generate_build_version() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    setVersion(std::chrono::duration_cast<std::chrono::milliseconds>(duration)
                   .count());
  }

  // Changes whenever the site binary is relinked: size and mtime of the
  // executable, falling back to the engine version where /proc is absent.
  const std::string &binary_stamp();
};

#endif
