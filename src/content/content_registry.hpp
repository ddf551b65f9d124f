#ifndef CONTENT_REGISTRY_HPP
#define CONTENT_REGISTRY_HPP

#include "content_source.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

// Named content sources. Sources are registered up front and loaded by
// init_all(); any query before that fails with SourceNotInitialized.
class ContentRegistry {
public:
  template <typename T>
  ContentSource<T> &add(const std::string &name,
                        typename ContentSource<T>::InitFn init_fn) {
    auto source = std::make_unique<ContentSource<T>>(name, std::move(init_fn));
    ContentSource<T> &ref = *source;
    insert(std::move(source));
    return ref;
  }

  // Runs every source's loader in registration order.
  void init_all();

  bool has_source(const std::string &name) const;
  std::vector<std::string> source_names() const;

  const ContentSourceBase &get_untyped(const std::string &name) const;

  template <typename T>
  const ContentSource<T> &get_source(const std::string &name) const {
    const ContentSourceBase &base = get_untyped(name);
    auto typed = dynamic_cast<const ContentSource<T> *>(&base);
    if (!typed) {
      throw SourceNotFound(name, "source holds entries of a different type "
                                 "than " + param_type_name<T>());
    }
    if (!typed->initialized()) {
      throw SourceNotInitialized(name);
    }
    return *typed;
  }

  // Digest of a source, or an empty string for unknown names.
  std::string source_digest(const std::string &name) const;

private:
  void insert(std::unique_ptr<ContentSourceBase> source);

  std::vector<std::unique_ptr<ContentSourceBase>> sources_;
  std::map<std::string, size_t> index_by_name_;
};

#endif
