#include "site.hpp"
#include "content/markdown_loader.hpp"
#include "utils/build_info.hpp"
#include "utils/hashing.hpp"

#include <algorithm>

bool YAML::convert<ArticleMeta>::decode(const Node &node, ArticleMeta &meta) {
  if (!node.IsMap() || !node["title"]) {
    return false;
  }
  meta.title = node["title"].as<std::string>();
  if (node["date"]) {
    meta.date = node["date"].as<std::string>();
  }
  if (node["description"]) {
    meta.description = node["description"].as<std::string>();
  }
  if (node["lang"]) {
    meta.lang = node["lang"].as<std::string>();
  }
  if (node["tags"]) {
    meta.tags = node["tags"].as<std::vector<std::string>>();
  }
  return true;
}

nlohmann::json SiteEnvironment::site_data() const {
  nlohmann::json site = TemplateEngine::yaml_to_json(config.get_custom_data());
  if (!site.is_object()) {
    site = nlohmann::json::object();
  }
  site["name"] = config.site_name;
  site["description"] = config.description;
  site["author"] = config.author;
  return site;
}

std::string site_stamp(const SiteEnvironment &env) {
  std::string templates =
      sha256_directory(env.root / env.config.templates_dir);
  std::string site = sha256_hex(env.site_data().dump());
  return BuildInfo::getInstance().binary_stamp() + "+tpl-" +
         templates.substr(0, 16) + "+site-" + site.substr(0, 16);
}

using Article = ContentEntry<ArticleMeta>;

static const char *ARTICLES = "articles";

static nlohmann::json article_json(const Article &article) {
  return {{"id", article.id},
          {"title", article.data.title},
          {"date", article.data.date},
          {"description", article.data.description},
          {"tags", article.data.tags},
          {"url", "/articles/" + article.id + "/"}};
}

// Newest first; entries written in French only appear under /fr/.
static std::vector<const Article *>
articles_for(ContentAccessor &content, const std::optional<std::string> &lang) {
  std::vector<const Article *> result;
  for (const auto &article :
       content.get_source<ArticleMeta>(ARTICLES).entries()) {
    if (article.data.lang == lang) {
      result.push_back(&article);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const Article *a, const Article *b) {
              return a->data.date > b->data.date;
            });
  return result;
}

class SiteRoute : public Route {
public:
  explicit SiteRoute(std::shared_ptr<const SiteEnvironment> env)
      : env_(std::move(env)) {}

protected:
  nlohmann::json base_data(PageContext &ctx) const {
    ctx.assets().include_style(env_->asset("style.css"));
    return {{"site", env_->site_data()},
            {"page", TemplateEngine::page_data(ctx)}};
  }

  std::string render_template(const std::string &name,
                              const nlohmann::json &data) const {
    return env_->templates->render_file(name, data);
  }

  std::shared_ptr<const SiteEnvironment> env_;
};

class IndexRoute : public SiteRoute {
public:
  using SiteRoute::SiteRoute;

  RouteDefinition definition() const override {
    return RouteDefinition::static_route("/").sitemap(
        {false, ChangeFreq::Daily, 1.0});
  }

  RenderOutput render(PageContext &ctx) override {
    nlohmann::json data = base_data(ctx);
    data["logo"] = ctx.assets().add_image(env_->asset("logo.svg")).url();
    data["articles"] = nlohmann::json::array();
    for (const Article *article : articles_for(ctx.content(), std::nullopt)) {
      data["articles"].push_back(article_json(*article));
    }
    return render_template("index.html", data);
  }
};

class AboutRoute : public SiteRoute {
public:
  using SiteRoute::SiteRoute;

  RouteDefinition definition() const override {
    return RouteDefinition::static_route("/about")
        .locale("en", "/en/about")
        .locale("sv", "/sv/om-oss");
  }

  RenderOutput render(PageContext &ctx) override {
    nlohmann::json data = base_data(ctx);
    std::string lang = ctx.variant().value_or("en");
    data["lang"] = lang;
    data["title"] = lang == "sv" ? "Om oss" : "About";
    return render_template("about.html", data);
  }
};

class ArticleRoute : public SiteRoute {
public:
  using SiteRoute::SiteRoute;

  RouteDefinition definition() const override {
    return RouteDefinition::dynamic_route("/articles/[slug]")
        .locale_prefix("fr", "/fr")
        .sitemap({false, ChangeFreq::Monthly, 0.8});
  }

  Pages pages(DynamicRouteContext &ctx) override {
    Pages pages;
    for (const Article *article : articles_for(ctx.content(), ctx.variant())) {
      pages.push_back(Page::from(ArticleParams{article->id}));
    }
    return pages;
  }

  RenderOutput render(PageContext &ctx) override {
    auto params = ctx.params<ArticleParams>();
    const Article &article =
        ctx.content().get_entry<ArticleMeta>(ARTICLES, params.slug);

    nlohmann::json data = base_data(ctx);
    data["article"] = article_json(article);
    data["content"] = article.render();
    return render_template("article.html", data);
  }
};

class BlogRoute : public SiteRoute {
public:
  using SiteRoute::SiteRoute;

  static constexpr size_t PER_PAGE = 5;

  RouteDefinition definition() const override {
    return RouteDefinition::dynamic_route("/blog/[page]");
  }

  Pages pages(DynamicRouteContext &ctx) override {
    std::vector<std::string> ids;
    for (const Article *article : articles_for(ctx.content(), std::nullopt)) {
      ids.push_back(article->id);
    }
    return paginate(ids, PER_PAGE, [](size_t index) {
      BlogPageParams params;
      if (index > 0) {
        params.page = index + 1;
      }
      return params;
    });
  }

  RenderOutput render(PageContext &ctx) override {
    const auto &listing = ctx.props<PaginationPage<std::string>>();
    const auto &source = ctx.content().get_source<ArticleMeta>(ARTICLES);

    nlohmann::json data = base_data(ctx);
    data["articles"] = nlohmann::json::array();
    for (const auto &id : listing.items) {
      data["articles"].push_back(article_json(source.get_entry(id)));
    }
    data["page_number"] = listing.page + 1;
    data["total_pages"] = listing.total_pages;
    data["prev_url"] = listing.has_prev
                           ? (listing.page == 1
                                  ? "/blog/"
                                  : "/blog/" + std::to_string(listing.page) + "/")
                           : "";
    data["next_url"] = listing.has_next
                           ? "/blog/" + std::to_string(listing.page + 2) + "/"
                           : "";
    return render_template("blog.html", data);
  }
};

class FeedRoute : public SiteRoute {
public:
  using SiteRoute::SiteRoute;

  RouteDefinition definition() const override {
    return RouteDefinition::static_route("/feed.json");
  }

  RenderOutput render(PageContext &ctx) override {
    nlohmann::json items = nlohmann::json::array();
    for (const Article *article : articles_for(ctx.content(), std::nullopt)) {
      nlohmann::json item = article_json(*article);
      if (ctx.options().base_url) {
        item["url"] = join_url(*ctx.options().base_url,
                               item["url"].get<std::string>());
      }
      items.push_back(item);
    }

    nlohmann::json feed = {{"version", "https://jsonfeed.org/version/1.1"},
                           {"title", env_->config.site_name},
                           {"items", items}};
    if (auto home = ctx.canonical_url()) {
      feed["feed_url"] = *home;
    }
    return feed.dump(2);
  }
};

void register_site(SiteBuilder &builder,
                   std::shared_ptr<const SiteEnvironment> env) {
  builder.content().add<ArticleMeta>(
      ARTICLES, markdown_source<ArticleMeta>(env->root /
                                             env->config.content_dir /
                                             "articles"));

  builder.add_route<IndexRoute>(env);
  builder.add_route<AboutRoute>(env);
  builder.add_route<ArticleRoute>(env);
  builder.add_route<BlogRoute>(env);
  builder.add_route<FeedRoute>(env);
}
