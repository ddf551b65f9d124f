#ifndef INCREMENTAL_CACHE_HPP
#define INCREMENTAL_CACHE_HPP

#include "assets/asset_ledger.hpp"
#include "page_context.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// What a page depended on when it was last rendered.
struct CachedPage {
  std::string fingerprint;
  std::string url;
  std::vector<std::string> sources;
  std::vector<fs::path> asset_sources;
  std::vector<AssetRecord> assets;
};

// SHA-256 over the page identity (url, params, variant), the digests of the
// content sources it read, the mtimes of the assets it touched and the
// structural stamp.
std::string
compute_fingerprint(const ResolvedPage &page,
                    const std::vector<std::pair<std::string, std::string>>
                        &source_digests,
                    const std::vector<AssetDependency> &assets,
                    const std::string &structural_stamp);

// Fingerprints and rendered bytes of the previous successful build, stored
// as "<cache_dir>/kiln-cache.json" plus one blob per page under
// "<cache_dir>/pages/". Problems reading it never fail a build; they only
// cause pages to be rendered again.
class IncrementalCache {
public:
  static constexpr int FORMAT_VERSION = 1;

  IncrementalCache(fs::path cache_dir, std::string structural_stamp);

  void load();

  const CachedPage *find(const fs::path &file_path) const;

  bool should_rebuild(const fs::path &file_path,
                      const std::string &fingerprint) const;

  // Stored output of the previous build, or nullopt when the blob is gone.
  std::optional<std::string> stored_output(const fs::path &file_path) const;

  void record(const fs::path &file_path, CachedPage page, std::string output);

  // Replaces the stored state with this build's records. Failures are
  // logged as warnings.
  void save();

  size_t size() const { return previous_.size(); }
  bool stamp_matches() const { return loaded_stamp_ == stamp_; }
  const std::string &structural_stamp() const { return stamp_; }

  fs::path index_path() const { return cache_dir_ / "kiln-cache.json"; }
  fs::path blob_path(const fs::path &file_path) const;

private:
  void read_index();
  void write_index();

  fs::path cache_dir_;
  std::string stamp_;
  std::string loaded_stamp_;
  std::map<std::string, CachedPage> previous_;
  std::map<std::string, std::pair<CachedPage, std::string>> current_;
};

#endif
