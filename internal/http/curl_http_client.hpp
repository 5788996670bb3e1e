#pragma once

#include "internal/http/http_client.hpp"

namespace fleet::http {

/*
  libcurl easy-handle transport. One handle per request; safe to share
  between threads. Only https is permitted and peer verification is always on.
*/
class CurlHttpClient final : public HttpClient {
 public:
  CurlHttpClient();

  HttpResponse Send(const HttpRequest& request) override;
};

} // namespace fleet::http
