#pragma once

#include <memory>

#include "config/config.pb.h"

namespace fieldlink::core {
class FieldIndex;
class LookupPool;
class Resolver;
} // namespace fieldlink::core

namespace fieldlink::http {
class QueryHandler;
}

namespace fieldlink::factory {

constexpr unsigned kDefaultLookupThreads = 8;

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process and is immutable
  after Build() returns.
*/
struct Application {
  std::shared_ptr<const core::FieldIndex>   index;
  std::shared_ptr<core::LookupPool>         lookup_pool;
  std::shared_ptr<const core::Resolver>     resolver;
  std::shared_ptr<const http::QueryHandler> handler;
};

/*
  Build

  Connects every relation eagerly and assembles the resolver. The first
  relation that cannot be opened aborts startup with util::ConnectionError.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const fieldlink::runtime::config::RuntimeConfig& config);

} // namespace fieldlink::factory
