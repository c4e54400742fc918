#pragma once

#include "upstream/transport.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace gateway {

struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
};

// Diagnostic snapshot of the last failed attempt once every attempt is spent.
struct RetryExhausted {
  int attempts = 0;
  std::optional<int> status;
  std::string content_type;
  std::string body_preview;
  std::string transport_error;

  // {"error":true,"message":"All retry attempts failed","lastError":{...},"retries":N}
  std::string Message() const;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

void SleepFor(std::chrono::milliseconds delay);

// A bare 500 or an HTML body is treated as an edge/proxy fault. Other 5xx
// statuses are returned to the caller untouched.
bool IsRetriableOutcome(const FetchOutcome& outcome);

std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, int attempt_index);

class ResilientFetcher {
 public:
  ResilientFetcher(IUpstreamTransport* transport, RetryPolicy policy, Sleeper sleeper = SleepFor);

  std::optional<FetchOutcome> Fetch(const UpstreamRequest& req, RetryExhausted* failure);
  std::optional<FetchOutcome> Fetch(const UpstreamRequest& req, int max_attempts, RetryExhausted* failure);

  const RetryPolicy& Policy() const {
    return policy_;
  }

 private:
  IUpstreamTransport* transport_;
  RetryPolicy policy_;
  Sleeper sleeper_;
};

}  // namespace gateway
