#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/dispatch/operation_queue.hpp"

namespace fleet::dispatch {

/*
  Process-wide bounded dispatcher for lifecycle operations.

  A fixed set of worker threads, one per permitted in-flight operation, drain a
  shared FIFO queue; the thread count is the global concurrency bound shared
  by every fleet. Operations that were never started can be cancelled per
  fleet; their cancel callback runs on the caller's thread.
*/
class OperationExecutor {
 public:
  explicit OperationExecutor(std::size_t max_concurrent_operations);
  ~OperationExecutor();

  OperationExecutor(const OperationExecutor&)            = delete;
  OperationExecutor& operator=(const OperationExecutor&) = delete;

  void Start();
  // Cancels everything still queued and joins the worker threads.
  void Stop();

  // Throws util::InvalidState once stopped.
  void Submit(Operation op);

  // Returns the number of operations cancelled.
  std::size_t CancelPending(const std::string& fleet);

  std::size_t Concurrency() const {
    return concurrency_;
  }

  std::size_t InFlight() const {
    return in_flight_.load();
  }

  std::size_t Queued() const {
    return queue_.Size();
  }

 private:
  void Run();
  static void Cancel(std::vector<Operation> ops);

  std::size_t              concurrency_;
  OperationQueue           queue_;
  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
  std::atomic<std::size_t> in_flight_{0};
};

} // namespace fleet::dispatch
