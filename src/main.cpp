#include "cli/watch.hpp"
#include "core/site_builder.hpp"
#include "site/site.hpp"
#include "utils/build_info.hpp"
#include "utils/config.hpp"
#include "utils/logging.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

void print_usage() {
  std::cout << "Kiln " << KILN_VERSION << " - static site builder\n\n";
  std::cout << "Commands:\n";
  std::cout << "  kiln-site build [options]     Build the site into output_dir\n";
  std::cout << "  kiln-site watch [options]     Rebuild on every change\n";
  std::cout << "  kiln-site --help              Show this help\n\n";
  std::cout << "Options:\n";
  std::cout << "  --root DIR                    Project root (default: .)\n";
  std::cout << "  --dev                         Development build\n";
  std::cout << "  --incremental                 Reuse unchanged pages\n";
  std::cout << "  --quiet                       Only print warnings and errors\n";
}

struct CliOptions {
  std::string command;
  fs::path root = fs::current_path();
  bool dev = false;
  bool incremental = false;
  bool quiet = false;
};

static bool parse_args(int argc, char *argv[], CliOptions &cli) {
  cli.command = argv[1];
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--dev") {
      cli.dev = true;
    } else if (arg == "--incremental") {
      cli.incremental = true;
    } else if (arg == "--quiet") {
      cli.quiet = true;
    } else if (arg == "--root" && i + 1 < argc) {
      cli.root = argv[++i];
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      return false;
    }
  }
  return true;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  CliOptions cli;
  if (!parse_args(argc, argv, cli)) {
    print_usage();
    return 1;
  }

  if (cli.command != "build" && cli.command != "watch") {
    std::cerr << "Unknown command: " << cli.command << std::endl;
    print_usage();
    return 1;
  }

  try {
    auto env = std::make_shared<SiteEnvironment>();
    env->root = fs::absolute(cli.root);
    env->config = SiteConfig::load(env->root / "kiln.yaml");
    env->templates = std::make_shared<TemplateEngine>(
        env->root / env->config.templates_dir);

    BuildOptions options = env->config.to_build_options(env->root);
    options.dev = options.dev || cli.dev;
    options.incremental = options.incremental || cli.incremental;
    options.quiet = cli.quiet;
    options.structural_stamp = site_stamp(*env);

    SiteBuilder builder(std::move(options));
    register_site(builder, env);

    if (cli.command == "watch") {
      return run_watch(builder, *env);
    }

    BuildResult result = build_site(builder);
    return result.ok ? 0 : 1;
  } catch (const std::exception &e) {
    Log::error(format_error_chain(e));
    return 1;
  }
}
