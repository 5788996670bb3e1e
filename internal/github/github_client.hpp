#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/message.h>

#include "internal/http/http_client.hpp"
#include "internal/model/fleet_config.hpp"

namespace fleet::github {

struct GitHubClientOptions {
  std::string               api_base_url = "https://api.github.com";
  std::chrono::milliseconds timeout{30'000};
  int                       max_rate_limit_retries = 3;
  std::chrono::milliseconds initial_backoff{1'000};
  std::chrono::milliseconds max_backoff{60'000};
  std::string               user_agent = "runner-fleet";
};

/*
  Authenticated GitHub REST transport.

  - Adds Authorization / Accept / API version headers to every request.
  - Retries rate-limited responses (429, or 403 with x-ratelimit-remaining: 0)
    with exponential backoff, honouring Retry-After, until the call's
    deadline or the retry budget runs out; the last response is returned.
  - Every call carries one deadline covering all attempts.

  HTTP error statuses are returned to the caller, which maps them onto its own
  domain error. The access token is held only in memory.
*/
class GitHubClient {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  GitHubClient(std::shared_ptr<http::HttpClient> http, std::string token, GitHubClientOptions options = {}, Sleeper sleeper = {});

  http::HttpResponse Get(const std::string& path, std::optional<std::chrono::milliseconds> timeout = std::nullopt);
  http::HttpResponse Post(const std::string& path, const std::string& body,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);
  http::HttpResponse Delete(const std::string& path, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  const GitHubClientOptions& Options() const {
    return options_;
  }

  // "/repos/{owner}/{repo}"
  static std::string RepoPath(const model::FleetConfig& fleet);

  // "HTTP <status>: <provider message>"
  static std::string Describe(const http::HttpResponse& response);

  // Parses a JSON body, ignoring unknown fields. Throws util::TransportError.
  static void ParseJson(const std::string& body, google::protobuf::Message* out);

  static bool IsRateLimited(const http::HttpResponse& response);

 private:
  http::HttpResponse Send(const std::string& method, const std::string& path, const std::string& body,
                          std::optional<std::chrono::milliseconds> timeout);

  std::chrono::milliseconds RetryDelay(const http::HttpResponse& response, int attempt) const;

  std::shared_ptr<http::HttpClient> http_;
  std::string                       token_;
  GitHubClientOptions               options_;
  Sleeper                           sleeper_;
};

} // namespace fleet::github
