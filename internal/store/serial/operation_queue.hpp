#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace feedstore::store {

/*
  Thread-safe blocking FIFO of store operations.

  Enqueue order is submission order. After Shutdown() no new operation is
  accepted, but everything already queued is still handed out.
*/
class OperationQueue {
 public:
  using Operation = std::function<void()>;

  // Returns false once the queue has been shut down.
  bool Enqueue(Operation op);

  // blocking wait; nullopt only when shut down and drained
  std::optional<Operation> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Operation>   queue_;
  bool                    shutdown_ = false;
};

} // namespace feedstore::store
