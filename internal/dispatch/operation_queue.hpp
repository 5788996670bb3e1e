#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/dispatch/operation.hpp"

namespace fleet::dispatch {

/*
  Thread-safe FIFO of operations waiting for an executor slot.
*/
class OperationQueue {
 public:
  void Enqueue(Operation op);

  // blocking wait; nullopt once shut down
  std::optional<Operation> Dequeue();

  // Removes and returns every queued operation of the fleet.
  std::vector<Operation> CancelPending(const std::string& fleet);

  // Wakes all waiters and returns whatever was still queued.
  std::vector<Operation> Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<Operation>   queue_;
  bool                    shutdown_ = false;
};

} // namespace fleet::dispatch
