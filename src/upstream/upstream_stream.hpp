#pragma once

#include "stream/chunk_source.hpp"
#include "upstream/transport.hpp"

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace gateway {

// Runs one streaming upstream request on its own reader thread. The caller
// blocks only until the response head arrives; the body is then pulled from
// Body(). Cancelling the body or destroying the stream aborts the upstream
// transfer, even one blocked waiting for bytes, and joins the reader.
class UpstreamStream {
 public:
  UpstreamStream(IUpstreamTransport* transport, UpstreamRequest req, size_t max_buffered_chunks = 64);
  ~UpstreamStream();

  UpstreamStream(const UpstreamStream&) = delete;
  UpstreamStream& operator=(const UpstreamStream&) = delete;

  std::optional<ResponseHead> Open(std::string* err);

  IChunkSource* Body() {
    return channel_.get();
  }

 private:
  struct HeadResult {
    std::optional<ResponseHead> head;
    std::string error;
  };

  void Run();

  IUpstreamTransport* transport_;
  UpstreamRequest req_;
  CancelToken cancel_;
  std::unique_ptr<ChunkChannel> channel_;
  std::promise<HeadResult> head_promise_;
  std::future<HeadResult> head_future_;
  bool opened_ = false;
  std::thread reader_;
};

}  // namespace gateway
