#include "upstream/upstream_stream.hpp"

#include <iostream>
#include <utility>

namespace gateway {

UpstreamStream::UpstreamStream(IUpstreamTransport* transport, UpstreamRequest req, size_t max_buffered_chunks)
    : transport_(transport),
      req_(std::move(req)),
      channel_(std::make_unique<ChunkChannel>(max_buffered_chunks, [this] { cancel_.Cancel(); })),
      head_future_(head_promise_.get_future()) {}

UpstreamStream::~UpstreamStream() {
  channel_->Cancel();
  if (reader_.joinable()) reader_.join();
}

std::optional<ResponseHead> UpstreamStream::Open(std::string* err) {
  if (opened_) {
    if (err) *err = "upstream stream already opened";
    return std::nullopt;
  }
  opened_ = true;
  reader_ = std::thread([this] { Run(); });

  auto result = head_future_.get();
  if (!result.head) {
    if (err) *err = result.error;
    return std::nullopt;
  }
  return result.head;
}

void UpstreamStream::Run() {
  bool head_delivered = false;
  std::string err;
  const bool ok = transport_->Stream(
      req_,
      [&](const ResponseHead& head) {
        HeadResult r;
        r.head = head;
        head_delivered = true;
        head_promise_.set_value(std::move(r));
        return head.status >= 200 && head.status < 300;
      },
      [&](const char* data, size_t size) { return channel_->Push(std::string(data, size)); },
      &cancel_,
      &err);

  if (!ok && err.empty()) err = "upstream transport error";
  if (!head_delivered) {
    HeadResult r;
    r.error = ok ? std::string("upstream closed without a response") : err;
    head_promise_.set_value(std::move(r));
  }
  if (!ok) std::cout << "[stream] upstream transport error: " << err << "\n";
  channel_->Close(ok ? std::string() : err);
}

}  // namespace gateway
