#include "sanitize.hpp"

#include <mutex>
#include <regex>
#include <vector>

namespace fleet::util {
namespace {

constexpr std::string_view kRedacted        = "[REDACTED]";
constexpr std::size_t      kMinSecretLength = 8;

std::mutex& SecretsMutex() {
  static std::mutex mutex;
  return mutex;
}

std::vector<std::string>& Secrets() {
  static std::vector<std::string> secrets;
  return secrets;
}

struct Rule {
  std::regex  pattern;
  std::string replacement;
};

const std::vector<Rule>& Rules() {
  static const std::vector<Rule> rules = {
      {std::regex(R"re((Authorization:\s*)(Bearer\s+|token\s+|Basic\s+)?[^\s"',]+)re", std::regex::icase), "$1[REDACTED]"},
      {std::regex(R"re(\b(Bearer)\s+[A-Za-z0-9._~+/=-]+)re", std::regex::icase), "$1 [REDACTED]"},
      {std::regex(R"re((--token)(\s+|=)('[^']*'|"[^"]*"|\S+))re"), "$1$2[REDACTED]"},
      {std::regex(R"re(("token"\s*:\s*)"[^"]*")re"), "$1\"[REDACTED]\""},
      {std::regex(R"re(\bgh[pousr]_[A-Za-z0-9]+)re"), "[REDACTED]"},
      {std::regex(R"re(\bgithub_pat_[A-Za-z0-9_]+)re"), "[REDACTED]"},
  };
  return rules;
}

void ReplaceAll(std::string& text, const std::string& needle) {
  std::size_t pos = 0;
  while ((pos = text.find(needle, pos)) != std::string::npos) {
    text.replace(pos, needle.size(), kRedacted);
    pos += kRedacted.size();
  }
}

} // namespace

std::string SanitizeSecrets(std::string_view text) {
  std::string out(text);

  {
    std::lock_guard lock(SecretsMutex());
    for (const auto& secret : Secrets()) {
      ReplaceAll(out, secret);
    }
  }

  for (const auto& rule : Rules()) {
    out = std::regex_replace(out, rule.pattern, rule.replacement);
  }
  return out;
}

void RegisterSecret(const std::string& secret) {
  if (secret.size() < kMinSecretLength) {
    return;
  }
  std::lock_guard lock(SecretsMutex());
  for (const auto& existing : Secrets()) {
    if (existing == secret) {
      return;
    }
  }
  Secrets().push_back(secret);
}

void ClearRegisteredSecrets() {
  std::lock_guard lock(SecretsMutex());
  Secrets().clear();
}

} // namespace fleet::util
