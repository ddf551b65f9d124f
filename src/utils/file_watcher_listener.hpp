#pragma once

#include <atomic>
#include <efsw/efsw.hpp>
#include <filesystem>
#include <string>
#include <unordered_set>

// Flags a rebuild when a watched source file is added, modified or
// removed. The rebuild itself runs on the thread that polls take_change().
class RebuildListener : public efsw::FileWatchListener {
private:
  std::filesystem::path project_root;
  std::filesystem::path output_dir;
  std::unordered_set<std::string> watched_extensions;
  std::atomic<bool> changed{false};

public:
  RebuildListener(const std::filesystem::path &root,
                  const std::filesystem::path &output);

  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename = "") override;

  // True once per batch of changes since the previous call.
  bool take_change() { return changed.exchange(false); }

  bool is_watched(const std::filesystem::path &path) const;
};
