#ifndef WATCH_HPP
#define WATCH_HPP

#include "core/site_builder.hpp"
#include "site/site.hpp"

#include <filesystem>

namespace fs = std::filesystem;

// Builds once, then rebuilds incrementally whenever a file below the
// content, templates, static or assets folders changes. Returns when ENTER
// is pressed.
int run_watch(SiteBuilder &builder, const SiteEnvironment &env);

#endif
