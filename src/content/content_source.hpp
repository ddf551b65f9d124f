#ifndef CONTENT_SOURCE_HPP
#define CONTENT_SOURCE_HPP

#include "core/errors.hpp"
#include "core/route_params.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

template <typename T> class ContentEntry {
public:
  using RenderFn = std::function<std::string(const std::string &)>;

  ContentEntry(std::string id, T data,
               std::optional<std::string> raw_content = std::nullopt,
               std::optional<fs::path> file_path = std::nullopt,
               RenderFn render_fn = nullptr, std::string content_hash = "")
      : id(std::move(id)), data(std::move(data)),
        raw_content(std::move(raw_content)), file_path(std::move(file_path)),
        content_hash(std::move(content_hash)),
        render_fn_(std::move(render_fn)) {}

  std::string id;
  T data;
  std::optional<std::string> raw_content;
  std::optional<fs::path> file_path;
  // Hash of whatever the entry was loaded from; feeds the source digest.
  std::string content_hash;

  bool renderable() const { return render_fn_ && raw_content; }

  // Rendered once on first call. Sources are read on a single thread.
  const std::string &render() const {
    if (!rendered_) {
      if (!renderable()) {
        throw std::runtime_error("Entry '" + id + "' has no renderable body");
      }
      rendered_ = render_fn_(*raw_content);
    }
    return *rendered_;
  }

private:
  RenderFn render_fn_;
  mutable std::optional<std::string> rendered_;
};

class ContentSourceBase {
public:
  explicit ContentSourceBase(std::string name) : name_(std::move(name)) {}
  virtual ~ContentSourceBase() = default;

  const std::string &name() const { return name_; }
  bool initialized() const { return initialized_; }

  virtual void init() = 0;
  virtual size_t size() const = 0;
  virtual std::vector<std::string> entry_ids() const = 0;

  // SHA-256 over entry ids and content hashes, computed at init.
  const std::string &digest() const;

protected:
  void set_digest(std::string digest) {
    digest_ = std::move(digest);
    initialized_ = true;
  }

  void require_initialized() const {
    if (!initialized_) {
      throw SourceNotInitialized(name_);
    }
  }

  static std::string compute_digest(
      const std::vector<std::pair<std::string, std::string>> &id_hashes);

private:
  std::string name_;
  std::string digest_;
  bool initialized_ = false;
};

template <typename T> class ContentSource : public ContentSourceBase {
public:
  using InitFn = std::function<std::vector<ContentEntry<T>>()>;

  ContentSource(std::string name, InitFn init_fn)
      : ContentSourceBase(std::move(name)), init_fn_(std::move(init_fn)) {}

  void init() override {
    entries_ = init_fn_();
    index_by_id_.clear();

    std::vector<std::pair<std::string, std::string>> id_hashes;
    for (size_t i = 0; i < entries_.size(); ++i) {
      const auto &entry = entries_[i];
      if (!index_by_id_.emplace(entry.id, i).second) {
        throw ConfigError("Duplicate entry id '" + entry.id +
                          "' in content source '" + name() + "'");
      }
      id_hashes.emplace_back(entry.id, entry.content_hash);
    }

    set_digest(compute_digest(id_hashes));
  }

  size_t size() const override { return entries_.size(); }

  std::vector<std::string> entry_ids() const override {
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto &entry : entries_) {
      ids.push_back(entry.id);
    }
    return ids;
  }

  const std::vector<ContentEntry<T>> &entries() const {
    require_initialized();
    return entries_;
  }

  const ContentEntry<T> &get_entry(const std::string &id) const {
    const ContentEntry<T> *entry = find_entry(id);
    if (!entry) {
      throw EntryNotFound(name(), id);
    }
    return *entry;
  }

  const ContentEntry<T> *find_entry(const std::string &id) const {
    require_initialized();
    auto it = index_by_id_.find(id);
    return it == index_by_id_.end() ? nullptr : &entries_[it->second];
  }

  // Maps every entry to a Page, e.g. for a dynamic route's enumeration.
  template <typename Fn> Pages into_pages(Fn fn) const {
    Pages pages;
    for (const auto &entry : entries()) {
      pages.push_back(fn(entry));
    }
    return pages;
  }

private:
  InitFn init_fn_;
  std::vector<ContentEntry<T>> entries_;
  std::unordered_map<std::string, size_t> index_by_id_;
};

#endif
