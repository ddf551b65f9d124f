#include "watch.hpp"
#include "utils/build_info.hpp"
#include "utils/file_watcher_listener.hpp"
#include "utils/logging.hpp"

#include <atomic>
#include <chrono>
#include <efsw/efsw.hpp>
#include <iostream>
#include <termcolor/termcolor.hpp>
#include <thread>
#include <vector>

static BuildResult rebuild(SiteBuilder &builder, const SiteEnvironment &env) {
  env.templates->reload();
  builder.options().structural_stamp = site_stamp(env);
  return build_site(builder);
}

int run_watch(SiteBuilder &builder, const SiteEnvironment &env) {
  const fs::path &project_root = env.root;
  builder.options().incremental = true;
  builder.options().clean_output_dir = false;

  BuildResult initial = rebuild(builder, env);
  if (!initial.ok) {
    Log::warning("Initial build failed; waiting for changes");
  }

  std::cout << "\n"
            << termcolor::bright_cyan << "👁️  Setting up file watchers"
            << termcolor::reset << "\n";

  efsw::FileWatcher fileWatcher;
  RebuildListener listener(project_root, builder.options().output_path());

  std::vector<fs::path> folders = {
      env.config.content_dir, env.config.templates_dir, env.config.static_dir,
      env.config.asset_sources_dir};
  int watch_count = 0;

  for (const auto &folder : folders) {
    fs::path folder_path = project_root / folder;
    if (!fs::exists(folder_path)) {
      std::cout << termcolor::bright_yellow << "  ⚠ " << termcolor::reset
                << "Skipping " << termcolor::bright_blue << folder.string()
                << termcolor::reset << " (not found)\n";
      continue;
    }

    efsw::WatchID id =
        fileWatcher.addWatch(folder_path.string(), &listener, true);
    if (id < 0) {
      Log::warning("Cannot watch " + folder_path.string() + ": " +
                   efsw::Errors::Log::getLastErrorLog());
      continue;
    }
    std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
              << "Watching " << termcolor::bright_white << folder.string()
              << termcolor::reset << "\n";
    watch_count++;
  }

  if (watch_count == 0) {
    Log::error("Nothing to watch below " + project_root.string());
    return 1;
  }

  fileWatcher.watch();

  std::atomic<bool> stop{false};
  std::thread rebuild_thread([&]() {
    while (!stop) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      if (!listener.take_change()) {
        continue;
      }

      std::cout << termcolor::bright_cyan << "  🔨 Rebuilding site..."
                << termcolor::reset << "\n";
      auto start = std::chrono::steady_clock::now();
      BuildResult result = rebuild(builder, env);
      if (result.ok) {
        std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
                  << "Rebuild complete in " << termcolor::bright_white
                  << format_elapsed(std::chrono::steady_clock::now() - start)
                  << termcolor::reset << termcolor::bright_blue << " (v"
                  << BuildInfo::getInstance().getVersion() << ")"
                  << termcolor::reset << "\n\n";
      }
    }
  });

  std::cout << termcolor::bright_blue << "Press ENTER to stop watching..."
            << termcolor::reset << "\n\n";
  std::cin.get();

  stop = true;
  rebuild_thread.join();
  return 0;
}
