#include "http_client.hpp"

#include <cctype>

namespace fleet::http {

std::optional<std::string> HttpResponse::Header(std::string_view name) const {
  std::string key;
  key.reserve(name.size());
  for (unsigned char c : name)
    key.push_back(static_cast<char>(std::tolower(c)));

  auto it = headers.find(key);
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace fleet::http
