#include "operation_queue.hpp"

namespace feedstore::store {

bool OperationQueue::Enqueue(Operation op) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(op));
  }
  cv_.notify_one();
  return true;
}

std::optional<OperationQueue::Operation> OperationQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Operation op = std::move(queue_.front());
  queue_.pop();
  return op;
}

void OperationQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace feedstore::store
