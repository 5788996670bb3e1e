#include "registration_token.hpp"

#include <utility>

namespace fleet::model {

RegistrationToken::RegistrationToken(std::string value, util::TimePoint expires_at) : value_(std::move(value)), expires_at_(expires_at) {
}

RegistrationToken::~RegistrationToken() {
  Wipe();
}

RegistrationToken::RegistrationToken(RegistrationToken&& other) noexcept : expires_at_(other.expires_at_) {
  value_.swap(other.value_);
  other.Wipe();
}

RegistrationToken& RegistrationToken::operator=(RegistrationToken&& other) noexcept {
  if (this != &other) {
    Wipe();
    value_.swap(other.value_);
    expires_at_ = other.expires_at_;
    other.Wipe();
  }
  return *this;
}

void RegistrationToken::Wipe() noexcept {
  volatile char* p = value_.data();
  for (std::size_t i = 0; i < value_.size(); ++i) {
    p[i] = '\0';
  }
  value_.clear();
}

} // namespace fleet::model
