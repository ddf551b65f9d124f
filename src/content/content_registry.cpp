#include "content_registry.hpp"
#include "utils/hashing.hpp"
#include "utils/logging.hpp"

#include <chrono>

const std::string &ContentSourceBase::digest() const {
  require_initialized();
  return digest_;
}

std::string ContentSourceBase::compute_digest(
    const std::vector<std::pair<std::string, std::string>> &id_hashes) {
  Sha256 hasher;
  for (const auto &[id, hash] : id_hashes) {
    hasher.update_field(id);
    hasher.update_field(hash);
  }
  return hasher.finish();
}

void ContentRegistry::insert(std::unique_ptr<ContentSourceBase> source) {
  const std::string &name = source->name();
  if (index_by_name_.count(name) > 0) {
    throw ConfigError("Content source '" + name + "' is registered twice");
  }
  index_by_name_[name] = sources_.size();
  sources_.push_back(std::move(source));
}

void ContentRegistry::init_all() {
  if (sources_.empty()) {
    return;
  }

  Log::title("📚 Initializing content sources");
  auto all_start = std::chrono::steady_clock::now();

  for (auto &source : sources_) {
    auto start = std::chrono::steady_clock::now();
    source->init();
    Log::info("content", source->name() + " initialized with " +
                             std::to_string(source->size()) + " entries in " +
                             format_elapsed(std::chrono::steady_clock::now() -
                                            start));
  }

  Log::success("Content sources initialized in " +
               format_elapsed(std::chrono::steady_clock::now() - all_start));
}

bool ContentRegistry::has_source(const std::string &name) const {
  return index_by_name_.count(name) > 0;
}

std::vector<std::string> ContentRegistry::source_names() const {
  std::vector<std::string> names;
  names.reserve(sources_.size());
  for (const auto &source : sources_) {
    names.push_back(source->name());
  }
  return names;
}

const ContentSourceBase &
ContentRegistry::get_untyped(const std::string &name) const {
  auto it = index_by_name_.find(name);
  if (it == index_by_name_.end()) {
    throw SourceNotFound(name);
  }
  return *sources_[it->second];
}

std::string ContentRegistry::source_digest(const std::string &name) const {
  auto it = index_by_name_.find(name);
  if (it == index_by_name_.end() || !sources_[it->second]->initialized()) {
    return "";
  }
  return sources_[it->second]->digest();
}
