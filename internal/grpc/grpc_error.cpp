#include "grpc_error.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/sanitize.hpp"

namespace fleet::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace fleet::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const DeadlineExceeded*>(&e)) {
    return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
  }
  if (dynamic_cast<const TransportError*>(&e) || dynamic_cast<const QueueObservationError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  // foreign exceptions were not sanitized on construction
  return {::grpc::StatusCode::INTERNAL, SanitizeSecrets(e.what())};
}

} // namespace fleet::grpc
