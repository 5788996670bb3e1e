#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fleet::http {

struct HttpRequest {
  std::string                                      method = "GET";
  std::string                                      url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string                                      body;
  std::chrono::milliseconds                        timeout{30'000};
};

struct HttpResponse {
  long                               status = 0;
  std::map<std::string, std::string> headers; // keys lower-cased
  std::string                        body;

  std::optional<std::string> Header(std::string_view name) const;

  bool Ok() const {
    return status >= 200 && status < 300;
  }
};

/*
  Blocking HTTP transport.

  Send returns any HTTP status as a response; only transport failures throw:
    util::DeadlineExceeded  request did not complete within timeout
    util::TransportError    DNS / connect / TLS / protocol failures
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Send(const HttpRequest& request) = 0;
};

} // namespace fleet::http
