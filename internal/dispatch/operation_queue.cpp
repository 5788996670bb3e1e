#include "operation_queue.hpp"

#include "internal/util/errors.hpp"

namespace fleet::dispatch {

void OperationQueue::Enqueue(Operation op) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::InvalidState("operation queue is shut down");
    }
    queue_.push_back(std::move(op));
  }
  cv_.notify_one();
}

std::optional<Operation> OperationQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  Operation op = std::move(queue_.front());
  queue_.pop_front();
  return op;
}

std::vector<Operation> OperationQueue::CancelPending(const std::string& fleet) {
  std::vector<Operation> removed;
  std::lock_guard        lock(mutex_);
  for (auto it = queue_.begin(); it != queue_.end();) {
    if (it->fleet == fleet) {
      removed.push_back(std::move(*it));
      it = queue_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

std::vector<Operation> OperationQueue::Shutdown() {
  std::vector<Operation> remaining;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    remaining.assign(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
    queue_.clear();
  }
  cv_.notify_all();
  return remaining;
}

std::size_t OperationQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace fleet::dispatch
