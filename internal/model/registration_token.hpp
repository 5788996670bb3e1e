#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace fleet::model {

/*
  Short-lived single-use secret that binds a worker process to the provider.

  Move-only and never printable; the backing buffer is wiped when the token is
  destroyed or moved from, so the secret does not outlive the registration
  call that consumes it.
*/
class RegistrationToken {
 public:
  RegistrationToken(std::string value, util::TimePoint expires_at);
  ~RegistrationToken();

  RegistrationToken(const RegistrationToken&)            = delete;
  RegistrationToken& operator=(const RegistrationToken&) = delete;

  RegistrationToken(RegistrationToken&& other) noexcept;
  RegistrationToken& operator=(RegistrationToken&& other) noexcept;

  const std::string& Value() const {
    return value_;
  }

  util::TimePoint ExpiresAt() const {
    return expires_at_;
  }

  bool Empty() const {
    return value_.empty();
  }

  bool ExpiredAt(util::TimePoint now) const {
    return now >= expires_at_;
  }

 private:
  void Wipe() noexcept;

  std::string     value_;
  util::TimePoint expires_at_;
};

} // namespace fleet::model
