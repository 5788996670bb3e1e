#include "github_client.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cstdlib>
#include <thread>

#include "fleet/github/v1/github.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleet::github {

using Steady = std::chrono::steady_clock;

GitHubClient::GitHubClient(std::shared_ptr<http::HttpClient> http, std::string token, GitHubClientOptions options, Sleeper sleeper)
    : http_(std::move(http)), token_(std::move(token)), options_(std::move(options)), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
  if (options_.api_base_url.rfind("https://", 0) != 0) {
    throw util::InvalidArgument("provider api_base_url must use https: " + options_.api_base_url);
  }
  while (!options_.api_base_url.empty() && options_.api_base_url.back() == '/') {
    options_.api_base_url.pop_back();
  }
}

http::HttpResponse GitHubClient::Get(const std::string& path, std::optional<std::chrono::milliseconds> timeout) {
  return Send("GET", path, {}, timeout);
}

http::HttpResponse GitHubClient::Post(const std::string& path, const std::string& body, std::optional<std::chrono::milliseconds> timeout) {
  return Send("POST", path, body, timeout);
}

http::HttpResponse GitHubClient::Delete(const std::string& path, std::optional<std::chrono::milliseconds> timeout) {
  return Send("DELETE", path, {}, timeout);
}

std::string GitHubClient::RepoPath(const model::FleetConfig& fleet) {
  return "/repos/" + fleet.repo_owner + "/" + fleet.repo_name;
}

std::string GitHubClient::Describe(const http::HttpResponse& response) {
  std::string detail;
  if (!response.body.empty()) {
    fleet::github::v1::ErrorResponse error;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    if (google::protobuf::util::JsonStringToMessage(response.body, &error, options).ok()) {
      detail = error.message();
    }
  }
  auto out = "HTTP " + std::to_string(response.status);
  if (!detail.empty()) {
    out += ": " + detail;
  }
  return out;
}

void GitHubClient::ParseJson(const std::string& body, google::protobuf::Message* out) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(body, out, options);
  if (!status.ok()) {
    throw util::TransportError("malformed " + out->GetTypeName() + " response: " + std::string(status.message()));
  }
}

bool GitHubClient::IsRateLimited(const http::HttpResponse& response) {
  if (response.status == 429) {
    return true;
  }
  if (response.status == 403) {
    auto remaining = response.Header("x-ratelimit-remaining");
    return remaining && *remaining == "0";
  }
  return false;
}

std::chrono::milliseconds GitHubClient::RetryDelay(const http::HttpResponse& response, int attempt) const {
  if (auto retry_after = response.Header("retry-after")) {
    char*      end     = nullptr;
    const long seconds = std::strtol(retry_after->c_str(), &end, 10);
    if (end && *end == '\0' && seconds >= 0) {
      return std::min<std::chrono::milliseconds>(std::chrono::seconds(seconds), options_.max_backoff);
    }
  }

  auto delay = options_.initial_backoff;
  for (int i = 0; i < attempt && delay < options_.max_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, options_.max_backoff);
}

http::HttpResponse GitHubClient::Send(const std::string& method, const std::string& path, const std::string& body,
                                      std::optional<std::chrono::milliseconds> timeout) {
  const auto budget   = timeout.value_or(options_.timeout);
  const auto deadline = Steady::now() + budget;

  http::HttpRequest request;
  request.method  = method;
  request.url     = options_.api_base_url + path;
  request.body    = body;
  request.headers = {
      {"Authorization", "Bearer " + token_},
      {"Accept", "application/vnd.github+json"},
      {"X-GitHub-Api-Version", "2022-11-28"},
      {"User-Agent", options_.user_agent},
  };
  if (!body.empty()) {
    request.headers.emplace_back("Content-Type", "application/json");
  }

  for (int attempt = 0;; ++attempt) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Steady::now());
    if (remaining.count() <= 0) {
      throw util::DeadlineExceeded(method + " " + path + " exceeded its " + std::to_string(budget.count()) + "ms deadline");
    }
    request.timeout = remaining;

    auto response = http_->Send(request);
    if (!IsRateLimited(response) || attempt >= options_.max_rate_limit_retries) {
      return response;
    }

    const auto delay = RetryDelay(response, attempt);
    if (Steady::now() + delay >= deadline) {
      return response;
    }

    FLEET_LOG_WARN("GitHub rate limit hit, backing off",
                   {observability::StringField("method", method), observability::StringField("path", path),
                    observability::IntField("status", response.status), observability::IntField("attempt", attempt + 1),
                    observability::IntField("delay_ms", delay.count())});
    sleeper_(delay);
  }
}

} // namespace fleet::github
