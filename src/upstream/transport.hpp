#pragma once

#include "config.hpp"

#include <httplib.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace gateway {

// One upstream HTTP exchange. Headers use httplib's case-insensitive map.
struct UpstreamRequest {
  std::string method = "GET";
  HttpEndpoint endpoint;
  httplib::Headers headers;
  std::string body;
  std::string content_type;
};

struct FetchOutcome {
  int status = 0;
  httplib::Headers headers;
  std::string body;

  std::string ContentType() const;
};

struct ResponseHead {
  int status = 0;
  httplib::Headers headers;
};

struct TransportTimeouts {
  std::chrono::milliseconds connect{30000};
  std::chrono::milliseconds read{30000};
  std::chrono::milliseconds write{30000};
};

// Lets another thread abort a transfer that is blocked in the network. The
// transport binds a hook for the lifetime of the transfer; Cancel() runs it.
class CancelToken {
 public:
  // Returns false when the token was already cancelled; the hook is not kept.
  bool Bind(std::function<void()> hook);
  void Unbind();
  void Cancel();
  bool Cancelled() const;

 private:
  mutable std::mutex mu_;
  bool cancelled_ = false;
  std::function<void()> hook_;
};

// Return false from on_head to skip the body; return false from on_chunk to
// cancel the transfer.
using HeadHandler = std::function<bool(const ResponseHead&)>;
using ChunkHandler = std::function<bool(const char* data, size_t size)>;

class IUpstreamTransport {
 public:
  virtual ~IUpstreamTransport() = default;

  virtual std::optional<FetchOutcome> Send(const UpstreamRequest& req, std::string* err) = 0;

  // Returns false on a transport-level failure. A transfer cancelled by
  // on_head, on_chunk or `cancel` is not a failure.
  virtual bool Stream(const UpstreamRequest& req,
                      const HeadHandler& on_head,
                      const ChunkHandler& on_chunk,
                      CancelToken* cancel,
                      std::string* err) = 0;
};

class HttplibTransport : public IUpstreamTransport {
 public:
  explicit HttplibTransport(TransportTimeouts timeouts);

  std::optional<FetchOutcome> Send(const UpstreamRequest& req, std::string* err) override;
  bool Stream(const UpstreamRequest& req,
              const HeadHandler& on_head,
              const ChunkHandler& on_chunk,
              CancelToken* cancel,
              std::string* err) override;

  const TransportTimeouts& Timeouts() const {
    return timeouts_;
  }

 private:
  TransportTimeouts timeouts_;
};

}  // namespace gateway
