#include "internal/core/lookup_pool.hpp"

#include <stdexcept>

namespace fieldlink::core {

bool LookupQueue::Enqueue(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<LookupQueue::Task> LookupQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Task task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void LookupQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

LookupPool::LookupPool(std::size_t threads) {
  if (threads == 0) threads = 1;
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back(&LookupPool::Run, this);
  }
}

LookupPool::~LookupPool() {
  Stop();
}

void LookupPool::Submit(LookupQueue::Task task) {
  if (!queue_.Enqueue(std::move(task))) {
    throw std::runtime_error("lookup pool is stopped");
  }
}

void LookupPool::Stop() {
  queue_.Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable())
      worker.join();
  }
}

void LookupPool::Run() {
  while (auto task = queue_.Dequeue()) {
    (*task)();
  }
}

} // namespace fieldlink::core
