#include "internal/core/resolver.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>
#include <tuple>
#include <utility>

#include "internal/core/field_index.hpp"
#include "internal/core/lookup_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fieldlink::core {

using fieldlink::observability::BoolField;
using fieldlink::observability::IntField;
using fieldlink::observability::StringField;
using fieldlink::util::LookupError;
using fieldlink::util::RequestCancelled;
using fieldlink::util::RequestTimeout;
using fieldlink::util::UnknownFieldError;

using Clock = std::chrono::steady_clock;

namespace {

// upper bound on how long a cancelled request keeps waiting on its round
constexpr std::chrono::milliseconds kCancelPollInterval{20};

/*
  Outcome of one round, filled in by the lookup tasks in completion order.
  Only the first failure is kept.
*/
struct RoundResults {
  explicit RoundResults(std::size_t size) : found(size) {
  }

  std::mutex              mutex;
  std::condition_variable cv;

  std::vector<db::FieldValues> found;
  std::size_t                  completed = 0;
  std::optional<std::size_t>   failed;
  std::string                  error;
};

} // namespace

bool Resolver::LookupUnit::operator<(const LookupUnit& other) const {
  return std::tie(relation->Name(), field, value) < std::tie(other.relation->Name(), other.field, other.value);
}

// Per-request traversal state. Never shared between requests.
struct Resolver::State {
  std::set<LookupUnit> pending;
  std::set<LookupUnit> visited;
  db::FieldValues      discovered;

  std::set<std::pair<std::string, std::string>> seeds;

  int         round   = 0;
  std::size_t lookups = 0;

  std::optional<Clock::time_point> deadline;
  CancelToken                      cancelled;
};

Resolver::Resolver(std::shared_ptr<const FieldIndex> index, std::shared_ptr<LookupPool> pool, ResolverOptions options)
    : index_(std::move(index)), pool_(std::move(pool)), options_(options) {
}

Resolution Resolver::Resolve(const Seeds& seeds, CancelToken cancel) const {
  State state;
  state.cancelled = cancel ? std::move(cancel) : std::make_shared<std::atomic<bool>>(false);
  if (options_.request_timeout.count() > 0) {
    state.deadline = Clock::now() + options_.request_timeout;
  }

  Resolution resolution;
  bool       depth_limit_exceeded = false;

  try {
    // seed fields may be non-distinct; they are still used as the first condition
    Seed(state, seeds);

    while (!state.pending.empty()) {
      if (state.round >= options_.max_depth) {
        depth_limit_exceeded = true;
        break;
      }
      RunRound(state);
      ++state.round;
    }
  } catch (const UnknownFieldError& e) {
    resolution.message = e.what();
  } catch (const LookupError& e) {
    resolution.message = e.what();
  } catch (const RequestTimeout& e) {
    resolution.message = e.what();
  } catch (const RequestCancelled& e) {
    resolution.message = e.what();
  } catch (const std::exception& e) {
    FIELDLINK_LOG_ERROR("Resolver failed", {StringField("error", e.what())});
    resolution.message = std::string("internal error: ") + e.what();
  }

  resolution.rounds  = state.round;
  resolution.lookups = state.lookups;

  if (!resolution.message.empty()) {
    // stop queued lookups of this request; whatever they return is discarded
    state.cancelled->store(true);
    FIELDLINK_LOG_WARN("Resolve failed", {StringField("error", resolution.message), IntField("rounds", state.round),
                                          IntField("lookups", static_cast<std::int64_t>(state.lookups))});
    return resolution;
  }

  resolution.success = true;
  if (depth_limit_exceeded) {
    resolution.message = kDepthLimitExceeded;
    FIELDLINK_LOG_WARN("Depth limit exceeded", {IntField("max_depth", options_.max_depth),
                                                IntField("pending", static_cast<std::int64_t>(state.pending.size()))});
  }

  // seed values are known to the caller and never reported back
  for (const auto& [field, values] : state.discovered) {
    std::vector<std::string> reported;
    for (const auto& value : values) {
      if (state.seeds.count({field, value}) == 0) {
        reported.push_back(value);
      }
    }
    if (!reported.empty()) {
      resolution.data.emplace(field, std::move(reported));
    }
  }

  FIELDLINK_LOG_INFO("Resolved", {IntField("rounds", state.round), IntField("lookups", static_cast<std::int64_t>(state.lookups)),
                                  IntField("fields", static_cast<std::int64_t>(resolution.data.size())),
                                  BoolField("depth_limit_exceeded", depth_limit_exceeded)});
  return resolution;
}

void Resolver::Seed(State& state, const Seeds& seeds) const {
  for (const auto& [field, value] : seeds) {
    state.seeds.emplace(field, value);
    Enqueue(state, field, value);
  }
}

void Resolver::Enqueue(State& state, const std::string& field, const std::string& value) const {
  const auto* relations = index_->RelationsFor(field);
  if (!relations) {
    throw UnknownFieldError("no relation has field `" + field + "`");
  }

  for (const auto& relation : *relations) {
    LookupUnit unit{relation, field, value};
    if (state.visited.count(unit) == 0) {
      state.pending.insert(std::move(unit));
    }
  }
}

void Resolver::RunRound(State& state) const {
  if (state.cancelled->load()) {
    throw RequestCancelled("request cancelled");
  }

  // frozen worklist; discoveries of this round go to the next pending set
  std::vector<LookupUnit> worklist;
  worklist.reserve(state.pending.size());
  for (const auto& unit : state.pending) {
    if (state.visited.insert(unit).second) {
      worklist.push_back(unit);
    }
  }
  state.pending.clear();

  auto round = std::make_shared<RoundResults>(worklist.size());
  for (std::size_t i = 0; i < worklist.size(); ++i) {
    const auto& unit = worklist[i];
    FIELDLINK_LOG_DEBUG("visit", {StringField("relation", unit.relation->Name()), StringField("field", unit.field),
                                  StringField("value", unit.value), IntField("round", state.round)});

    pool_->Submit([round, i, relation = unit.relation, field = unit.field, value = unit.value,
                   cancelled = state.cancelled] {
      db::FieldValues found;
      std::string     error;
      bool            ok = false;
      if (cancelled->load()) {
        error = "request cancelled";
      } else {
        try {
          found = relation->Lookup(field, value);
          ok    = true;
        } catch (const std::exception& e) {
          error = e.what();
        } catch (...) {
          error = "unknown lookup failure";
        }
      }

      {
        std::lock_guard lock(round->mutex);
        if (ok) {
          round->found[i] = std::move(found);
        } else if (!round->failed) {
          round->failed = i;
          round->error  = std::move(error);
        }
        ++round->completed;
      }
      round->cv.notify_all();
    });
    ++state.lookups;
  }

  {
    std::unique_lock lock(round->mutex);
    for (;;) {
      if (state.cancelled->load()) {
        throw RequestCancelled("request cancelled");
      }
      if (round->failed) {
        const auto& unit = worklist[*round->failed];
        throw LookupError("failed to query relation `" + unit.relation->Name() + "` with field `" + unit.field +
                          "`, value `" + unit.value + "`: " + round->error);
      }
      if (round->completed == worklist.size()) {
        break;
      }

      auto wake = Clock::now() + kCancelPollInterval;
      if (state.deadline) {
        if (Clock::now() >= *state.deadline) {
          throw RequestTimeout("request timed out after " + std::to_string(options_.request_timeout.count()) + " ms");
        }
        wake = std::min(wake, *state.deadline);
      }
      round->cv.wait_until(lock, wake);
    }
  }

  // every task has reported; merge order does not depend on completion order
  for (const auto& found : round->found) {
    Merge(state, found);
  }
}

void Resolver::Merge(State& state, const db::FieldValues& found) const {
  for (const auto& [field, values] : found) {
    state.discovered[field].insert(values.begin(), values.end());

    // non-distinct fields are reported but never expanded
    if (!index_->IsDistinct(field)) {
      continue;
    }

    for (const auto& value : values) {
      Enqueue(state, field, value);
    }
  }
}

} // namespace fieldlink::core
