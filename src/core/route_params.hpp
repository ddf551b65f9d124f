#ifndef ROUTE_PARAMS_HPP
#define ROUTE_PARAMS_HPP

#include "errors.hpp"

#include <algorithm>
#include <any>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

#include <boost/core/demangle.hpp>
#include <boost/lexical_cast.hpp>

// Raw route parameters. A key mapped to nullopt is an optional parameter
// explicitly set to None.
using ParamMap = std::map<std::string, std::optional<std::string>>;

std::string describe_params(const ParamMap &params);

template <typename V> std::string param_type_name() {
  return boost::core::demangle(typeid(V).name());
}

template <> inline std::string param_type_name<std::string>() {
  return "string";
}

namespace param_detail {

template <typename V> struct is_optional : std::false_type {};
template <typename V> struct is_optional<std::optional<V>> : std::true_type {
  using value_type = V;
};

template <typename V> V parse_value(const std::string &field,
                                    const std::string &raw) {
  if constexpr (std::is_same_v<V, std::string>) {
    return raw;
  } else {
    try {
      return boost::lexical_cast<V>(raw);
    } catch (const boost::bad_lexical_cast &) {
      throw ParamConversionError(field, param_type_name<V>(),
                                 "invalid value '" + raw + "'");
    }
  }
}

template <typename V> std::string format_value(const V &value) {
  if constexpr (std::is_same_v<V, std::string>) {
    return value;
  } else {
    return boost::lexical_cast<std::string>(value);
  }
}

} // namespace param_detail

// Describes how a params struct maps onto a ParamMap. Each field is either
// required (plain member) or optional (std::optional member).
//
//   struct ArticleParams {
//     std::string slug;
//     static ParamSchema<ArticleParams> schema() {
//       return ParamSchema<ArticleParams>().field("slug", &ArticleParams::slug);
//     }
//   };
template <typename T> class ParamSchema {
public:
  template <typename V> ParamSchema &field(const std::string &name, V T::*member) {
    Field f;
    f.name = name;

    if constexpr (param_detail::is_optional<V>::value) {
      using Inner = typename param_detail::is_optional<V>::value_type;
      f.optional = true;
      f.decode = [name, member](T &target, const ParamMap &params) {
        auto it = params.find(name);
        if (it == params.end() || !it->second || it->second->empty()) {
          target.*member = std::nullopt;
          return;
        }
        target.*member = param_detail::parse_value<Inner>(name, *it->second);
      };
      f.encode = [name, member](const T &source, ParamMap &params) {
        const auto &value = source.*member;
        params[name] = value ? std::optional<std::string>(
                                   param_detail::format_value<Inner>(*value))
                             : std::nullopt;
      };
    } else {
      f.optional = false;
      f.decode = [name, member](T &target, const ParamMap &params) {
        auto it = params.find(name);
        if (it == params.end() || !it->second) {
          throw ParamConversionError(name, param_type_name<V>(),
                                     "required parameter is missing");
        }
        target.*member = param_detail::parse_value<V>(name, *it->second);
      };
      f.encode = [name, member](const T &source, ParamMap &params) {
        params[name] = param_detail::format_value<V>(source.*member);
      };
    }

    fields_.push_back(std::move(f));
    return *this;
  }

  T decode(const ParamMap &params) const {
    T result{};
    for (const auto &f : fields_) {
      f.decode(result, params);
    }
    return result;
  }

  ParamMap encode(const T &value) const {
    ParamMap params;
    for (const auto &f : fields_) {
      f.encode(value, params);
    }
    return params;
  }

  std::set<std::string> optional_keys() const {
    std::set<std::string> keys;
    for (const auto &f : fields_) {
      if (f.optional) {
        keys.insert(f.name);
      }
    }
    return keys;
  }

private:
  struct Field {
    std::string name;
    bool optional = false;
    std::function<void(T &, const ParamMap &)> decode;
    std::function<void(const T &, ParamMap &)> encode;
  };

  std::vector<Field> fields_;
};

// One concrete page returned by a dynamic route's enumeration.
struct Page {
  ParamMap params;
  std::set<std::string> optional_keys;
  std::any props;

  Page() = default;
  Page(ParamMap p, std::any pr = {}) : params(std::move(p)), props(std::move(pr)) {}

  template <typename Params> static Page from(const Params &params) {
    auto schema = Params::schema();
    Page page(schema.encode(params));
    page.optional_keys = schema.optional_keys();
    return page;
  }

  template <typename Params, typename Props>
  static Page from(const Params &params, Props props) {
    Page page = from(params);
    page.props = std::move(props);
    return page;
  }
};

using Pages = std::vector<Page>;

template <typename T> struct PaginationPage {
  size_t page = 0;
  size_t per_page = 0;
  size_t total_items = 0;
  size_t total_pages = 0;
  bool has_next = false;
  bool has_prev = false;
  size_t start_index = 0;
  size_t end_index = 0;
  std::vector<T> items;
};

// One Page per chunk of `per_page` items, with a PaginationPage<T> as props.
// `params_fn` receives the zero-based page number.
template <typename T, typename ParamsFn>
Pages paginate(const std::vector<T> &items, size_t per_page,
               ParamsFn params_fn) {
  Pages pages;
  if (items.empty() || per_page == 0) {
    return pages;
  }

  size_t total_items = items.size();
  size_t total_pages = (total_items + per_page - 1) / per_page;

  for (size_t index = 0; index < total_pages; ++index) {
    PaginationPage<T> props;
    props.page = index;
    props.per_page = per_page;
    props.total_items = total_items;
    props.total_pages = total_pages;
    props.has_next = index + 1 < total_pages;
    props.has_prev = index > 0;
    props.start_index = index * per_page;
    props.end_index = std::min((index + 1) * per_page, total_items);
    props.items.assign(items.begin() + props.start_index,
                       items.begin() + props.end_index);

    pages.push_back(Page::from(params_fn(index), std::move(props)));
  }

  return pages;
}

#endif
