#pragma once

#include <cstdint>

#include "internal/model/fleet_config.hpp"
#include "internal/model/registration_token.hpp"
#include "internal/model/worker.hpp"

namespace fleet::registry {

/*
  Worker identities registered with the CI provider.

  GetRegistrationToken  throws util::RegistrationTokenError
  Register              throws util::WorkerRegistrationError; consumes the token
  Deregister            idempotent, an already removed worker is success;
                        throws util::WorkerDeregistrationError
  Status                throws util::WorkerNotFound for unknown ids
*/
class WorkerRegistry {
 public:
  virtual ~WorkerRegistry() = default;

  virtual model::RegistrationToken GetRegistrationToken(const model::FleetConfig& fleet) = 0;

  // The worker is registered under target.name.
  virtual int64_t Register(const model::ComputeHandle& target, const model::FleetConfig& fleet, model::RegistrationToken token) = 0;

  virtual void Deregister(const model::FleetConfig& fleet, int64_t worker_id) = 0;

  virtual model::WorkerInfo Status(const model::FleetConfig& fleet, int64_t worker_id) = 0;
};

} // namespace fleet::registry
