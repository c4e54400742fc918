#include "upstream/resilient_fetch.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

namespace gateway {
namespace {

constexpr size_t kBodyPreviewChars = 1000;
constexpr int kMaxBackoffShift = 30;

struct RetryContext {
  int attempts_allowed = 1;
  int attempt_index = 0;
  RetryExhausted last_failure;
};

static void RecordOutcome(RetryContext* ctx, const FetchOutcome& outcome) {
  ctx->last_failure = RetryExhausted{};
  ctx->last_failure.status = outcome.status;
  ctx->last_failure.content_type = outcome.ContentType();
  ctx->last_failure.body_preview = outcome.body.substr(0, kBodyPreviewChars);
}

static void RecordTransportError(RetryContext* ctx, std::string err) {
  ctx->last_failure = RetryExhausted{};
  ctx->last_failure.transport_error = err.empty() ? std::string("transport error") : std::move(err);
}

}  // namespace

std::string RetryExhausted::Message() const {
  nlohmann::json last = nlohmann::json::object();
  if (status.has_value()) {
    last["status"] = *status;
    last["contentType"] = content_type;
    last["responseText"] = body_preview;
  } else {
    last["message"] = transport_error;
  }
  nlohmann::json j;
  j["error"] = true;
  j["message"] = "All retry attempts failed";
  j["lastError"] = std::move(last);
  j["retries"] = attempts;
  return j.dump();
}

void SleepFor(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

bool IsRetriableOutcome(const FetchOutcome& outcome) {
  if (outcome.status == 500) return true;
  return outcome.ContentType().find("text/html") != std::string::npos;
}

std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, int attempt_index) {
  const int shift = std::clamp(attempt_index, 0, kMaxBackoffShift);
  return policy.base_delay * (int64_t{1} << shift);
}

ResilientFetcher::ResilientFetcher(IUpstreamTransport* transport, RetryPolicy policy, Sleeper sleeper)
    : transport_(transport), policy_(policy), sleeper_(std::move(sleeper)) {}

std::optional<FetchOutcome> ResilientFetcher::Fetch(const UpstreamRequest& req, RetryExhausted* failure) {
  return Fetch(req, policy_.max_attempts, failure);
}

std::optional<FetchOutcome> ResilientFetcher::Fetch(const UpstreamRequest& req,
                                                    int max_attempts,
                                                    RetryExhausted* failure) {
  RetryContext ctx;
  ctx.attempts_allowed = std::max(1, max_attempts);

  for (; ctx.attempt_index < ctx.attempts_allowed; ctx.attempt_index++) {
    const int attempt = ctx.attempt_index + 1;
    std::string err;
    auto outcome = transport_->Send(req, &err);
    if (outcome && !IsRetriableOutcome(*outcome)) {
      std::cout << "[fetch] " << req.method << " " << req.endpoint.path << " attempt=" << attempt << "/"
                << ctx.attempts_allowed << " status=" << outcome->status << "\n";
      return outcome;
    }

    if (outcome) {
      RecordOutcome(&ctx, *outcome);
      std::cout << "[fetch] " << req.method << " " << req.endpoint.path << " attempt=" << attempt << "/"
                << ctx.attempts_allowed << " retriable status=" << outcome->status
                << " content_type=" << ctx.last_failure.content_type << "\n";
    } else {
      RecordTransportError(&ctx, std::move(err));
      std::cout << "[fetch] " << req.method << " " << req.endpoint.path << " attempt=" << attempt << "/"
                << ctx.attempts_allowed << " transport_error=" << ctx.last_failure.transport_error << "\n";
    }

    if (attempt < ctx.attempts_allowed) {
      const auto delay = BackoffDelay(policy_, ctx.attempt_index);
      std::cout << "[fetch] backoff_ms=" << delay.count() << "\n";
      if (sleeper_) sleeper_(delay);
    }
  }

  ctx.last_failure.attempts = ctx.attempts_allowed;
  if (failure) *failure = ctx.last_failure;
  return std::nullopt;
}

}  // namespace gateway
