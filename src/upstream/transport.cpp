#include "upstream/transport.hpp"

#include <memory>
#include <string>
#include <utility>

namespace gateway {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, const TransportTimeouts& timeouts) {
  auto cli = std::make_unique<httplib::Client>(ep.Origin());
  cli->set_connection_timeout(timeouts.connect);
  cli->set_read_timeout(timeouts.read);
  cli->set_write_timeout(timeouts.write);
  cli->set_follow_location(true);
  return cli;
}

static httplib::Request MakeRequest(const UpstreamRequest& req) {
  httplib::Request r;
  r.method = req.method;
  r.path = req.endpoint.path;
  r.headers = req.headers;
  r.body = req.body;
  if (!req.content_type.empty() && !r.has_header("Content-Type")) {
    r.headers.emplace("Content-Type", req.content_type);
  }
  return r;
}

static std::string DescribeFailure(const UpstreamRequest& req, httplib::Error error) {
  return req.method + " " + req.endpoint.Origin() + req.endpoint.path + ": " + httplib::to_string(error);
}

}  // namespace

std::string FetchOutcome::ContentType() const {
  auto it = headers.find("Content-Type");
  if (it == headers.end()) return {};
  return it->second;
}

bool CancelToken::Bind(std::function<void()> hook) {
  std::lock_guard<std::mutex> lock(mu_);
  if (cancelled_) return false;
  hook_ = std::move(hook);
  return true;
}

void CancelToken::Unbind() {
  std::lock_guard<std::mutex> lock(mu_);
  hook_ = nullptr;
}

void CancelToken::Cancel() {
  std::lock_guard<std::mutex> lock(mu_);
  if (cancelled_) return;
  cancelled_ = true;
  if (hook_) hook_();
}

bool CancelToken::Cancelled() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cancelled_;
}

HttplibTransport::HttplibTransport(TransportTimeouts timeouts) : timeouts_(timeouts) {}

std::optional<FetchOutcome> HttplibTransport::Send(const UpstreamRequest& req, std::string* err) {
  auto cli = MakeClient(req.endpoint, timeouts_);
  auto r = MakeRequest(req);
  auto res = cli->send(r);
  if (!res) {
    if (err) *err = DescribeFailure(req, res.error());
    return std::nullopt;
  }
  FetchOutcome out;
  out.status = res->status;
  out.headers = res->headers;
  out.body = std::move(res->body);
  return out;
}

bool HttplibTransport::Stream(const UpstreamRequest& req,
                              const HeadHandler& on_head,
                              const ChunkHandler& on_chunk,
                              CancelToken* cancel,
                              std::string* err) {
  auto cli = MakeClient(req.endpoint, timeouts_);
  auto r = MakeRequest(req);
  r.response_handler = [&](const httplib::Response& response) {
    ResponseHead head;
    head.status = response.status;
    head.headers = response.headers;
    return on_head(head);
  };
  r.content_receiver = [&](const char* data, size_t size, uint64_t, uint64_t) { return on_chunk(data, size); };

  // stop() shuts the socket down, so a read blocked on a silent upstream
  // returns at once instead of waiting out the read timeout.
  auto* raw = cli.get();
  if (cancel && !cancel->Bind([raw] { raw->stop(); })) return true;
  auto res = cli->send(r);
  if (cancel) cancel->Unbind();
  if (res) return true;
  if (res.error() == httplib::Error::Canceled) return true;
  if (cancel && cancel->Cancelled()) return true;
  if (err) *err = DescribeFailure(req, res.error());
  return false;
}

}  // namespace gateway
