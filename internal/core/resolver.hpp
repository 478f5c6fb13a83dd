#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/relation.hpp"

namespace fieldlink::core {

class FieldIndex;
class LookupPool;

constexpr int kDefaultMaxDepth = 10;

constexpr char kDepthLimitExceeded[] = "depth length limit exceeded";

struct ResolverOptions {
  int                       max_depth = kDefaultMaxDepth;
  std::chrono::milliseconds request_timeout{0};  // zero: no timeout
};

// Known (field, value) pairs. A field may appear more than once.
using Seeds = std::vector<std::pair<std::string, std::string>>;

// Set by the caller to abandon a request, e.g. when its client goes away.
using CancelToken = std::shared_ptr<std::atomic<bool>>;

struct Resolution {
  bool                                            success = false;
  std::string                                     message;
  std::map<std::string, std::vector<std::string>> data;  // values sorted, distinct

  int         rounds  = 0;
  std::size_t lookups = 0;
};

/*
  Resolver

  Bounded breadth-first traversal over (relation, field, value) lookup units.

    seeds -> pending units (one per relation exposing the seed field)
    each round:
      freeze pending into a worklist, mark every unit visited
      run all lookups of the worklist concurrently on the LookupPool
      fail as soon as any lookup fails, whatever its worklist position
      once all succeeded, merge discoveries in worklist order:
        every value is added to the result
        values of distinct fields become pending units for every relation
        exposing the field, unless already visited

  Stops at the fixpoint (nothing pending) or after max_depth rounds. Running
  out of rounds still succeeds with kDepthLimitExceeded as the message.
  Seed (field, value) pairs are left out of the reported data.

  Any lookup failure, unknown field, timeout or cancellation fails the whole
  request with empty data. Lookups of a failed request that have not started
  yet are skipped. Stateless across requests; safe to call concurrently.
*/
class Resolver {
 public:
  Resolver(std::shared_ptr<const FieldIndex> index, std::shared_ptr<LookupPool> pool, ResolverOptions options = {});

  // `cancel` may be null. It is also set when the request fails.
  Resolution Resolve(const Seeds& seeds, CancelToken cancel = nullptr) const;

 private:
  struct LookupUnit {
    std::shared_ptr<db::Relation> relation;
    std::string                   field;
    std::string                   value;

    bool operator<(const LookupUnit& other) const;
  };

  struct State;

  void Seed(State& state, const Seeds& seeds) const;
  void RunRound(State& state) const;
  void Merge(State& state, const db::FieldValues& found) const;
  void Enqueue(State& state, const std::string& field, const std::string& value) const;

  std::shared_ptr<const FieldIndex> index_;
  std::shared_ptr<LookupPool>       pool_;
  ResolverOptions                   options_;
};

} // namespace fieldlink::core
