#include "factory.hpp"

#include <chrono>
#include <string>
#include <vector>

#include "internal/core/field_index.hpp"
#include "internal/core/lookup_pool.hpp"
#include "internal/core/resolver.hpp"
#include "internal/db/relation_factory.hpp"
#include "internal/http/query_handler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fieldlink::factory {

using namespace fieldlink;

namespace {

core::ResolverOptions BuildResolverOptions(const fieldlink::runtime::config::ResolverConfig& config) {
  core::ResolverOptions options;
  if (config.max_depth() > 0) {
    options.max_depth = config.max_depth();
  }
  options.request_timeout = std::chrono::milliseconds(config.request_timeout_ms());
  return options;
}

core::FieldIndex::RelationList OpenRelations(const fieldlink::runtime::config::RuntimeConfig& config,
                                             std::size_t                                      max_connections) {
  core::FieldIndex::RelationList relations;
  relations.reserve(config.relations_size());

  for (const auto& relation : config.relations()) {
    try {
      relations.push_back(db::OpenRelation(relation, max_connections));
    } catch (const util::ConnectionError& e) {
      throw util::ConnectionError("error loading relation `" + relation.name() + "`: " + e.what());
    }
  }
  return relations;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const fieldlink::runtime::config::RuntimeConfig& config) {
  Application app;

  const std::size_t threads =
      config.resolver().lookup_threads() > 0 ? config.resolver().lookup_threads() : kDefaultLookupThreads;

  // ------------------------------------------------------------------
  // Relations and routing index
  // ------------------------------------------------------------------
  app.index = std::make_shared<core::FieldIndex>(config.fields(), OpenRelations(config, threads));

  // ------------------------------------------------------------------
  // Resolver
  // ------------------------------------------------------------------
  app.lookup_pool = std::make_shared<core::LookupPool>(threads);

  const auto options = BuildResolverOptions(config.resolver());
  app.resolver       = std::make_shared<core::Resolver>(app.index, app.lookup_pool, options);
  app.handler        = std::make_shared<http::QueryHandler>(app.resolver);

  FIELDLINK_LOG_INFO("Application built",
                     {observability::IntField("fields", config.fields_size()),
                      observability::IntField("relations", config.relations_size()),
                      observability::IntField("lookup_threads", static_cast<std::int64_t>(threads)),
                      observability::IntField("max_depth", options.max_depth),
                      observability::IntField("request_timeout_ms", options.request_timeout.count())});
  return app;
}

} // namespace fieldlink::factory
