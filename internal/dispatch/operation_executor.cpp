#include "operation_executor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleet::dispatch {

using observability::StringField;

OperationExecutor::OperationExecutor(std::size_t max_concurrent_operations) : concurrency_(max_concurrent_operations) {
  if (concurrency_ == 0) {
    throw util::InvalidArgument("max_concurrent_operations must be > 0");
  }
}

OperationExecutor::~OperationExecutor() {
  Stop();
}

void OperationExecutor::Start() {
  if (running_.exchange(true)) {
    return;
  }
  threads_.reserve(concurrency_);
  for (std::size_t i = 0; i < concurrency_; ++i) {
    threads_.emplace_back(&OperationExecutor::Run, this);
  }
}

void OperationExecutor::Stop() {
  running_ = false;
  Cancel(queue_.Shutdown());
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void OperationExecutor::Submit(Operation op) {
  if (!running_) {
    throw util::InvalidState("operation executor is not running");
  }
  queue_.Enqueue(std::move(op));
}

std::size_t OperationExecutor::CancelPending(const std::string& fleet) {
  auto removed = queue_.CancelPending(fleet);
  const auto count = removed.size();
  Cancel(std::move(removed));
  return count;
}

void OperationExecutor::Cancel(std::vector<Operation> ops) {
  for (auto& op : ops) {
    if (!op.cancel) continue;
    try {
      op.cancel();
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("Operation cancel callback failed",
                      {StringField("fleet", op.fleet), StringField("kind", ToString(op.kind)), StringField("error", e.what())});
    }
  }
}

void OperationExecutor::Run() {
  while (running_) {
    auto op = queue_.Dequeue();
    if (!op) break;

    ++in_flight_;
    try {
      op->run();
    } catch (const std::exception& e) {
      FLEET_LOG_ERROR("Operation failed",
                      {StringField("fleet", op->fleet), StringField("kind", ToString(op->kind)), StringField("error", e.what())});
    }
    --in_flight_;
  }
}

} // namespace fleet::dispatch
