#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace labfleet::dispatch {

/*
  Thread-safe blocking queue of job indices for dispatcher workers.

  After Shutdown, Dequeue keeps handing out queued work and returns nullopt
  once the queue is empty.
*/
class JobQueue {
 public:
  void Enqueue(std::size_t index);

  // blocking wait
  std::optional<std::size_t> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<std::size_t> queue_;
  bool                    shutdown_ = false;
};

} // namespace labfleet::dispatch
