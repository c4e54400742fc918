#include "model_directory_cache.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace gateway {

int64_t NowEpochMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

ModelDirectoryCache::ModelDirectoryCache(ResilientFetcher* fetcher, HttpEndpoint endpoint, int64_t ttl_ms, Clock clock)
    : fetcher_(fetcher), endpoint_(std::move(endpoint)), ttl_ms_(ttl_ms), clock_(std::move(clock)) {}

std::optional<DirectoryResult> ModelDirectoryCache::GetDirectory(const std::string& authorization,
                                                                 RetryExhausted* failure) {
  const int64_t now = clock_();
  if (auto cached = Snapshot(); cached && now - cached->fetched_at_ms < ttl_ms_) {
    std::cout << "[models] cache=hit age_ms=" << (now - cached->fetched_at_ms) << "\n";
    DirectoryResult out;
    out.status = cached->status;
    out.payload = std::move(cached->payload);
    out.from_cache = true;
    return out;
  }

  std::cout << "[models] cache=miss refreshing\n";
  UpstreamRequest req;
  req.method = "GET";
  req.endpoint = endpoint_;
  req.headers.emplace("Authorization", authorization);
  auto outcome = fetcher_->Fetch(req, failure);
  if (!outcome) {
    std::cout << "[models] refresh failed, cache left untouched\n";
    return std::nullopt;
  }

  CachedDirectory fresh;
  fresh.payload = outcome->body;
  fresh.status = outcome->status;
  fresh.fetched_at_ms = now;
  {
    std::lock_guard<std::mutex> lock(mu_);
    cached_ = std::move(fresh);
  }
  std::cout << "[models] cache=stored status=" << outcome->status << " bytes=" << outcome->body.size() << "\n";

  DirectoryResult out;
  out.status = outcome->status;
  out.payload = std::move(outcome->body);
  return out;
}

std::optional<CachedDirectory> ModelDirectoryCache::Snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cached_;
}

}  // namespace gateway
