#pragma once

#include "config.hpp"
#include "upstream/resilient_fetch.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace gateway {

using Clock = std::function<int64_t()>;

int64_t NowEpochMillis();

struct CachedDirectory {
  std::string payload;
  int status = 200;
  int64_t fetched_at_ms = 0;
};

struct DirectoryResult {
  int status = 200;
  std::string payload;
  bool from_cache = false;
};

// Memoizes the upstream model listing for a fixed window. The record is
// replaced as a whole; two concurrent refreshes of an expired entry may both
// reach upstream and the last one wins.
class ModelDirectoryCache {
 public:
  ModelDirectoryCache(ResilientFetcher* fetcher, HttpEndpoint endpoint, int64_t ttl_ms, Clock clock = NowEpochMillis);

  std::optional<DirectoryResult> GetDirectory(const std::string& authorization, RetryExhausted* failure);

  std::optional<CachedDirectory> Snapshot() const;

 private:
  ResilientFetcher* fetcher_;
  HttpEndpoint endpoint_;
  int64_t ttl_ms_;
  Clock clock_;

  mutable std::mutex mu_;
  std::optional<CachedDirectory> cached_;
};

}  // namespace gateway
