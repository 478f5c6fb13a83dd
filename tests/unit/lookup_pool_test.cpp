#include "internal/core/lookup_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using fieldlink::core::LookupPool;
using fieldlink::core::LookupQueue;

void TestQueueIsFifoAndRejectsAfterShutdown() {
  LookupQueue      queue;
  std::vector<int> order;

  assert(queue.Enqueue([&] { order.push_back(1); }));
  assert(queue.Enqueue([&] { order.push_back(2); }));
  queue.Shutdown();
  assert(!queue.Enqueue([&] { order.push_back(3); }));

  // queued work is still drained after shutdown
  while (auto task = queue.Dequeue()) {
    (*task)();
  }
  assert((order == std::vector<int>{1, 2}));
}

void TestZeroThreadsStillRuns() {
  LookupPool pool(0);
  assert(pool.Size() == 1);

  std::promise<std::string> done;
  auto                      result = done.get_future();
  pool.Submit([&done] { done.set_value("ran"); });
  assert(result.get() == "ran");
}

void TestEveryTaskRuns() {
  LookupPool pool(4);

  std::vector<std::promise<int>> promises(32);
  std::vector<std::future<int>>  results;
  for (auto& promise : promises) {
    results.push_back(promise.get_future());
  }
  for (int i = 0; i < 32; ++i) {
    pool.Submit([&promises, i] { promises[i].set_value(i * i); });
  }
  for (int i = 0; i < 32; ++i) {
    assert(results[i].get() == i * i);
  }
}

void TestLookupsRunConcurrently() {
  LookupPool pool(4);

  std::atomic<int> running{0};
  std::atomic<int> peak{0};

  std::vector<std::promise<void>> finished(4);
  std::vector<std::future<void>>  waits;
  for (auto& done : finished) {
    waits.push_back(done.get_future());
  }
  for (auto& done : finished) {
    pool.Submit([&running, &peak, &done] {
      const int now  = ++running;
      int       seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      --running;
      done.set_value();
    });
  }
  for (auto& wait : waits) {
    wait.wait();
  }
  assert(peak.load() > 1);
}

void TestStopDrainsQueuedTasks() {
  std::atomic<int> ran{0};
  {
    LookupPool pool(1);
    for (int i = 0; i < 8; ++i) {
      pool.Submit([&ran] {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        ++ran;
      });
    }
    pool.Stop();
  }
  assert(ran.load() == 8);
}

void TestSubmitAfterStopThrows() {
  LookupPool pool(2);
  pool.Stop();

  bool threw = false;
  try {
    pool.Submit([] {});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  // idempotent
  pool.Stop();
}

} // namespace

int main() {
  TestQueueIsFifoAndRejectsAfterShutdown();
  TestZeroThreadsStillRuns();
  TestEveryTaskRuns();
  TestLookupsRunConcurrently();
  TestStopDrainsQueuedTasks();
  TestSubmitAfterStopThrows();

  std::cout << "fieldlink_unit_lookup_pool: pass\n";
  return 0;
}
