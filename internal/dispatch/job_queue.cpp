#include "job_queue.hpp"

namespace labfleet::dispatch {

void JobQueue::Enqueue(std::size_t index) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(index);
  }
  cv_.notify_one();
}

std::optional<std::size_t> JobQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  std::size_t index = queue_.front();
  queue_.pop();
  return index;
}

void JobQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace labfleet::dispatch
