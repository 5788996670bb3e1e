#pragma once

#include <stdexcept>
#include <string>

#include "internal/util/sanitize.hpp"

namespace fleet::util {

/*
  Central error types.

  Messages are scrubbed of credential-shaped substrings on construction so
  that nothing thrown from the provider or compute layers can leak a token
  into logs or RPC status details. These get translated later to gRPC status
  codes.
*/

class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& msg) : std::runtime_error(SanitizeSecrets(msg)) {
  }
};

class InvalidArgument : public Error {
 public:
  explicit InvalidArgument(const std::string& msg) : Error(msg) {
  }
};

class NotFound : public Error {
 public:
  explicit NotFound(const std::string& msg) : Error(msg) {
  }
};

class AlreadyExists : public Error {
 public:
  explicit AlreadyExists(const std::string& msg) : Error(msg) {
  }
};

class InvalidState : public Error {
 public:
  explicit InvalidState(const std::string& msg) : Error(msg) {
  }
};

class DeadlineExceeded : public Error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : Error(msg) {
  }
};

// Network failure talking to an external endpoint (DNS, TLS, reset, ...).
class TransportError : public Error {
 public:
  explicit TransportError(const std::string& msg) : Error(msg) {
  }
};

// ------------------------------------------------------------
// Worker lifecycle
// ------------------------------------------------------------

class ProvisioningError : public Error {
 public:
  explicit ProvisioningError(const std::string& msg) : Error(msg) {
  }
};

class RegistrationTokenError : public ProvisioningError {
 public:
  explicit RegistrationTokenError(const std::string& msg) : ProvisioningError(msg) {
  }
};

class WorkerRegistrationError : public ProvisioningError {
 public:
  explicit WorkerRegistrationError(const std::string& msg) : ProvisioningError(msg) {
  }
};

class WorkerDeregistrationError : public ProvisioningError {
 public:
  explicit WorkerDeregistrationError(const std::string& msg) : ProvisioningError(msg) {
  }
};

class ComputeProvisioningError : public ProvisioningError {
 public:
  explicit ComputeProvisioningError(const std::string& msg) : ProvisioningError(msg) {
  }
};

// ------------------------------------------------------------
// Queue / registry lookups
// ------------------------------------------------------------

class QueueObservationError : public Error {
 public:
  explicit QueueObservationError(const std::string& msg) : Error(msg) {
  }
};

class WorkerNotFound : public NotFound {
 public:
  explicit WorkerNotFound(const std::string& msg) : NotFound(msg) {
  }
};

} // namespace fleet::util
