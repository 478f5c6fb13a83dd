#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace fieldlink::core {

/*
  Thread-safe blocking queue of lookup tasks.
*/
class LookupQueue {
 public:
  using Task = std::function<void()>;

  // Returns false once the queue is shut down.
  bool Enqueue(Task task);

  // blocking wait
  std::optional<Task> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

/*
  Fixed set of worker threads executing relation lookups.

  Shared by all requests. A request submits one task per lookup of a round;
  each task reports its outcome to the round that submitted it. Tasks must
  not throw.
*/
class LookupPool {
 public:
  explicit LookupPool(std::size_t threads);
  ~LookupPool();

  LookupPool(const LookupPool&)            = delete;
  LookupPool& operator=(const LookupPool&) = delete;

  // Throws std::runtime_error once the pool is stopped.
  void Submit(LookupQueue::Task task);

  // Drains queued tasks and joins the workers.
  void Stop();

  std::size_t Size() const {
    return workers_.size();
  }

 private:
  void Run();

  LookupQueue              queue_;
  std::vector<std::thread> workers_;
};

} // namespace fieldlink::core
