#include "file_watcher_listener.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <termcolor/termcolor.hpp>

namespace fs = std::filesystem;

RebuildListener::RebuildListener(const fs::path &root, const fs::path &output)
    : project_root(root), output_dir(output),
      watched_extensions({".md", ".yaml", ".yml", ".html", ".css", ".js",
                          ".json", ".png", ".jpg", ".jpeg", ".webp", ".svg",
                          ".gif"}) {}

bool RebuildListener::is_watched(const fs::path &path) const {
  std::string filename = path.filename().string();
  if (filename.empty() || filename[0] == '.' || filename[0] == '~') {
    return false;
  }

  // Writes of the build itself must not retrigger it.
  fs::path relative = path.lexically_relative(output_dir);
  if (!relative.empty() && *relative.begin() != "..") {
    return false;
  }

  return watched_extensions.count(path.extension().string()) > 0;
}

void RebuildListener::handleFileAction(efsw::WatchID watchid,
                                       const std::string &dir,
                                       const std::string &filename,
                                       efsw::Action action,
                                       std::string oldFilename) {
  (void)watchid;
  (void)oldFilename;

  fs::path modified = fs::path(dir) / filename;
  if (!is_watched(modified)) {
    return;
  }

  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm = *std::localtime(&time);

  std::cout << "\n"
            << termcolor::bright_blue << std::put_time(&tm, "%H:%M:%S")
            << termcolor::reset << " ";

  switch (action) {
  case efsw::Actions::Add:
    std::cout << termcolor::bright_green << "➕ Added" << termcolor::reset;
    break;
  case efsw::Actions::Delete:
    std::cout << termcolor::bright_red << "➖ Removed" << termcolor::reset;
    break;
  case efsw::Actions::Moved:
    std::cout << termcolor::bright_yellow << "🔀 Moved" << termcolor::reset;
    break;
  default:
    std::cout << termcolor::bright_cyan << "📝 Modified" << termcolor::reset;
    break;
  }

  std::cout << " " << termcolor::bright_white
            << modified.lexically_relative(project_root).string()
            << termcolor::reset << "\n";

  changed = true;
}
