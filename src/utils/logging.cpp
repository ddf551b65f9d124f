#include "logging.hpp"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <termcolor/termcolor.hpp>

static std::atomic<bool> quiet_output{false};

void Log::set_quiet(bool quiet) { quiet_output = quiet; }

bool Log::quiet() { return quiet_output; }

void Log::title(const std::string &text) {
  if (quiet_output) {
    return;
  }
  std::cout << "\n"
            << termcolor::bright_cyan << termcolor::bold << text
            << termcolor::reset << "\n";
}

void Log::success(const std::string &text) {
  if (quiet_output) {
    return;
  }
  std::cout << termcolor::bright_green << "✓ " << termcolor::reset << text
            << "\n";
}

void Log::info(const std::string &target, const std::string &text) {
  if (quiet_output) {
    return;
  }
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm = *std::localtime(&now);

  std::cout << termcolor::bright_blue << std::put_time(&tm, "%H:%M:%S")
            << termcolor::reset << " " << termcolor::bright_yellow << target
            << termcolor::reset << " " << text << "\n";
}

void Log::warning(const std::string &text) {
  std::cerr << termcolor::yellow << "⚠ Warning: " << termcolor::reset << text
            << "\n";
}

void Log::error(const std::string &text) {
  std::cerr << termcolor::bright_red << "✗ Error: " << termcolor::reset << text
            << "\n";
}

void Log::page(const std::string &url, const std::string &file,
               std::chrono::nanoseconds elapsed, bool reused) {
  if (quiet_output) {
    return;
  }
  std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
            << termcolor::white << url << termcolor::reset
            << termcolor::bright_blue << " → " << file << termcolor::reset;
  if (reused) {
    std::cout << termcolor::bright_magenta << " (cached)" << termcolor::reset;
  } else {
    std::cout << " (+";
    write_elapsed(std::cout, elapsed);
    std::cout << ")";
  }
  std::cout << "\n";
}

void Log::asset(const std::string &source, const std::string &dest,
                const std::string &note) {
  if (quiet_output) {
    return;
  }
  std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
            << termcolor::white << source << termcolor::reset
            << termcolor::bright_blue << " → " << dest << termcolor::reset;
  if (!note.empty()) {
    std::cout << termcolor::bright_blue << " (" << note << ")"
              << termcolor::reset;
  }
  std::cout << "\n";
}

std::string format_elapsed(std::chrono::nanoseconds elapsed) {
  using namespace std::chrono;

  auto secs = duration_cast<seconds>(elapsed).count();
  if (secs >= 60) {
    return std::to_string(secs / 60) + "m";
  }
  if (secs > 0) {
    return std::to_string(secs) + "s";
  }
  auto millis = duration_cast<milliseconds>(elapsed).count();
  if (millis > 0) {
    return std::to_string(millis) + "ms";
  }
  return std::to_string(duration_cast<microseconds>(elapsed).count()) + "μs";
}

void write_elapsed(std::ostream &out, std::chrono::nanoseconds elapsed,
                   const ElapsedThresholds &thresholds) {
  using namespace std::chrono;

  auto secs = duration_cast<seconds>(elapsed).count();
  auto millis = duration_cast<milliseconds>(elapsed).count();
  std::string text = format_elapsed(elapsed);

  if (secs > thresholds.secs_red ||
      (secs == 0 && millis > thresholds.millis_red)) {
    out << termcolor::red << text << termcolor::reset;
  } else if (secs > thresholds.secs_yellow ||
             (secs == 0 && millis > thresholds.millis_yellow)) {
    out << termcolor::yellow << text << termcolor::reset;
  } else {
    out << text;
  }
}
