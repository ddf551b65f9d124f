#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <chrono>
#include <ostream>
#include <string>

struct ElapsedThresholds {
  long long millis_yellow = 100;
  long long millis_red = 500;
  long long secs_yellow = 1;
  long long secs_red = 2;
};

// Console output in the build's house style. Informational lines go to
// stdout and can be silenced; warnings and errors always go to stderr.
class Log {
public:
  static void set_quiet(bool quiet);
  static bool quiet();

  static void title(const std::string &text);
  static void success(const std::string &text);
  static void info(const std::string &target, const std::string &text);
  static void warning(const std::string &text);
  static void error(const std::string &text);

  // "  ✓ /url → file (+12ms)"
  static void page(const std::string &url, const std::string &file,
                   std::chrono::nanoseconds elapsed, bool reused);
  static void asset(const std::string &source, const std::string &dest,
                    const std::string &note);
};

std::string format_elapsed(std::chrono::nanoseconds elapsed);

// Writes the elapsed time colored by how slow it was.
void write_elapsed(std::ostream &out, std::chrono::nanoseconds elapsed,
                   const ElapsedThresholds &thresholds = ElapsedThresholds());

#endif
