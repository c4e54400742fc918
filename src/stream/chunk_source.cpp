#include "stream/chunk_source.hpp"

#include <algorithm>
#include <utility>

namespace gateway {

ChunkChannel::ChunkChannel(size_t max_buffered, std::function<void()> on_cancel)
    : max_buffered_(std::max<size_t>(1, max_buffered)), on_cancel_(std::move(on_cancel)) {}

bool ChunkChannel::Push(std::string chunk) {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [&] { return cancelled_ || chunks_.size() < max_buffered_; });
  if (cancelled_) return false;
  chunks_.push_back(std::move(chunk));
  cv_.notify_all();
  return true;
}

void ChunkChannel::Close(std::string err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_) return;
  closed_ = true;
  error_ = std::move(err);
  cv_.notify_all();
}

std::optional<std::string> ChunkChannel::Next(std::string* err) {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [&] { return cancelled_ || closed_ || !chunks_.empty(); });
  if (!chunks_.empty() && !cancelled_) {
    auto chunk = std::move(chunks_.front());
    chunks_.pop_front();
    cv_.notify_all();
    return chunk;
  }
  if (err && !cancelled_) *err = error_;
  return std::nullopt;
}

void ChunkChannel::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (cancelled_) return;
    cancelled_ = true;
    chunks_.clear();
    cv_.notify_all();
  }
  if (on_cancel_) on_cancel_();
}

bool ChunkChannel::Cancelled() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cancelled_;
}

}  // namespace gateway
