#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace gateway {

class IChunkSource {
 public:
  virtual ~IChunkSource() = default;

  // Blocks until the next raw chunk. Returns nullopt at end of stream, with
  // err set when the stream ended on a transport failure.
  virtual std::optional<std::string> Next(std::string* err) = 0;

  // Stop producing; the upstream connection is released.
  virtual void Cancel() {}
};

// Bounded hand-off between the upstream reader thread and the relay.
class ChunkChannel : public IChunkSource {
 public:
  // on_cancel runs once, outside the channel lock, when Cancel() is first called.
  explicit ChunkChannel(size_t max_buffered = 64, std::function<void()> on_cancel = {});

  // Blocks while the channel is full. Returns false once cancelled.
  bool Push(std::string chunk);
  void Close(std::string err = {});

  std::optional<std::string> Next(std::string* err) override;
  void Cancel() override;
  bool Cancelled() const;

 private:
  const size_t max_buffered_;
  std::function<void()> on_cancel_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::string> chunks_;
  bool closed_ = false;
  bool cancelled_ = false;
  std::string error_;
};

}  // namespace gateway
