#include "incremental_cache.hpp"
#include "assets/asset_transformer.hpp"
#include "errors.hpp"
#include "utils/hashing.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

void to_json(json &j, const AssetRecord &record) {
  j = json{{"source_path", record.source_path.generic_string()},
           {"kind", asset_kind_name(record.kind)},
           {"build_path", record.build_path.generic_string()}};

  const ImageOptions &options = record.image_options;
  json opts = json::object();
  if (options.width) {
    opts["width"] = *options.width;
  }
  if (options.height) {
    opts["height"] = *options.height;
  }
  if (options.format) {
    opts["format"] = image_format_extension(*options.format);
  }
  if (options.quality) {
    opts["quality"] = *options.quality;
  }
  j["options"] = opts;
}

void from_json(const json &j, AssetRecord &record) {
  record.source_path = j.at("source_path").get<std::string>();
  record.build_path = j.at("build_path").get<std::string>();

  auto kind = asset_kind_from_name(j.at("kind").get<std::string>());
  if (!kind) {
    throw CacheCorrupt("unknown asset kind " + j.at("kind").dump());
  }
  record.kind = *kind;

  const json &opts = j.at("options");
  if (opts.contains("width")) {
    record.image_options.width = opts["width"].get<unsigned>();
  }
  if (opts.contains("height")) {
    record.image_options.height = opts["height"].get<unsigned>();
  }
  if (opts.contains("format")) {
    record.image_options.format =
        image_format_from_extension(opts["format"].get<std::string>());
  }
  if (opts.contains("quality")) {
    record.image_options.quality = opts["quality"].get<unsigned>();
  }
}

std::string
compute_fingerprint(const ResolvedPage &page,
                    const std::vector<std::pair<std::string, std::string>>
                        &source_digests,
                    const std::vector<AssetDependency> &assets,
                    const std::string &structural_stamp) {
  Sha256 hasher;
  hasher.update_field(structural_stamp);
  hasher.update_field(page.url);
  hasher.update_field(page.variant_id.value_or(""));
  hasher.update_field(page.variant_id ? "variant" : "base");

  for (const auto &[key, value] : page.params) {
    hasher.update_field(key);
    hasher.update_field(value ? "=" + *value : "none");
  }

  auto sources = source_digests;
  std::sort(sources.begin(), sources.end());
  for (const auto &[name, digest] : sources) {
    hasher.update_field(name);
    hasher.update_field(digest);
  }

  std::vector<std::pair<std::string, long long>> asset_stamps;
  for (const auto &dep : assets) {
    asset_stamps.emplace_back(dep.source_path.generic_string(), dep.mtime);
  }
  std::sort(asset_stamps.begin(), asset_stamps.end());
  asset_stamps.erase(std::unique(asset_stamps.begin(), asset_stamps.end()),
                     asset_stamps.end());
  for (const auto &[path, mtime] : asset_stamps) {
    hasher.update_field(path);
    hasher.update_field(std::to_string(mtime));
  }

  return hasher.finish();
}

IncrementalCache::IncrementalCache(fs::path cache_dir,
                                   std::string structural_stamp)
    : cache_dir_(std::move(cache_dir)), stamp_(std::move(structural_stamp)) {}

fs::path IncrementalCache::blob_path(const fs::path &file_path) const {
  return cache_dir_ / "pages" / sha256_hex(file_path.generic_string());
}

void IncrementalCache::load() {
  previous_.clear();
  current_.clear();
  loaded_stamp_.clear();

  if (!fs::exists(index_path())) {
    Log::info("cache", "No previous build cache, rendering every page");
    return;
  }

  try {
    read_index();
  } catch (const CacheCorrupt &e) {
    previous_.clear();
    loaded_stamp_.clear();
    Log::warning(std::string(e.what()) + "; rendering every page");
    return;
  }

  if (!stamp_matches()) {
    Log::info("cache", "Engine or route set changed, rendering every page");
  } else {
    Log::info("cache", "Loaded " + std::to_string(previous_.size()) +
                           " cached pages");
  }
}

void IncrementalCache::read_index() {
  std::ifstream file(index_path());
  if (!file.is_open()) {
    throw CacheCorrupt("cannot open " + index_path().string());
  }

  try {
    json root = json::parse(file);

    int version = root.at("version").get<int>();
    if (version != FORMAT_VERSION) {
      throw CacheCorrupt("cache format version " + std::to_string(version) +
                         ", expected " + std::to_string(FORMAT_VERSION));
    }

    loaded_stamp_ = root.at("structural_stamp").get<std::string>();

    for (const auto &[file_path, entry] : root.at("pages").items()) {
      CachedPage page;
      page.fingerprint = entry.at("fingerprint").get<std::string>();
      page.url = entry.at("url").get<std::string>();
      page.sources = entry.at("sources").get<std::vector<std::string>>();
      for (const auto &path : entry.at("asset_sources")) {
        page.asset_sources.emplace_back(path.get<std::string>());
      }
      page.assets = entry.at("assets").get<std::vector<AssetRecord>>();
      previous_.emplace(file_path, std::move(page));
    }
  } catch (const json::exception &e) {
    throw CacheCorrupt(e.what());
  }
}

const CachedPage *IncrementalCache::find(const fs::path &file_path) const {
  auto it = previous_.find(file_path.generic_string());
  return it == previous_.end() ? nullptr : &it->second;
}

bool IncrementalCache::should_rebuild(const fs::path &file_path,
                                      const std::string &fingerprint) const {
  if (!stamp_matches()) {
    return true;
  }
  const CachedPage *cached = find(file_path);
  return !cached || cached->fingerprint != fingerprint;
}

std::optional<std::string>
IncrementalCache::stored_output(const fs::path &file_path) const {
  std::ifstream file(blob_path(file_path), std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  return content;
}

void IncrementalCache::record(const fs::path &file_path, CachedPage page,
                              std::string output) {
  current_[file_path.generic_string()] = {std::move(page), std::move(output)};
}

void IncrementalCache::write_index() {
  json pages = json::object();
  std::set<std::string> blobs;

  for (const auto &[file_path, stored] : current_) {
    const CachedPage &page = stored.first;

    json asset_sources = json::array();
    for (const auto &path : page.asset_sources) {
      asset_sources.push_back(path.generic_string());
    }

    pages[file_path] = json{{"fingerprint", page.fingerprint},
                            {"url", page.url},
                            {"sources", page.sources},
                            {"asset_sources", asset_sources},
                            {"assets", page.assets}};

    fs::path blob = blob_path(file_path);
    write_output_file(blob, stored.second);
    blobs.insert(blob.filename().string());
  }

  json root = {{"version", FORMAT_VERSION},
               {"structural_stamp", stamp_},
               {"pages", pages}};

  fs::path tmp = index_path();
  tmp += ".tmp";
  write_output_file(tmp, root.dump(2));

  std::error_code ec;
  fs::rename(tmp, index_path(), ec);
  if (ec) {
    throw WriteError(index_path(), ec.message());
  }

  // Blobs of pages that no longer exist.
  fs::path blob_dir = cache_dir_ / "pages";
  for (const auto &entry : fs::directory_iterator(blob_dir, ec)) {
    if (blobs.count(entry.path().filename().string()) == 0) {
      std::error_code remove_ec;
      fs::remove(entry.path(), remove_ec);
    }
  }
}

void IncrementalCache::save() {
  try {
    write_index();
    Log::info("cache", "Saved " + std::to_string(current_.size()) +
                           " page fingerprints");
  } catch (const KilnError &e) {
    Log::warning(std::string("Could not save the build cache: ") + e.what());
  } catch (const fs::filesystem_error &e) {
    Log::warning(std::string("Could not save the build cache: ") + e.what());
  }
}
