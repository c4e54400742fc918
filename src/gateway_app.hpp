#pragma once

#include "config.hpp"
#include "gateway_router.hpp"
#include "model_directory_cache.hpp"
#include "upstream/resilient_fetch.hpp"
#include "upstream/transport.hpp"

#include <httplib.h>

#include <functional>
#include <memory>

namespace gateway {

using TransportFactory = std::function<std::unique_ptr<IUpstreamTransport>(const TransportTimeouts&)>;

std::unique_ptr<IUpstreamTransport> MakeHttplibTransport(const TransportTimeouts& timeouts);

TransportTimeouts FetchTimeouts(const GatewayConfig& cfg);
TransportTimeouts ChatTimeouts(const GatewayConfig& cfg);

// Owns the upstream plumbing behind the router. Model directory fetches use a
// short-timeout transport; chat completions get their own with a longer read
// timeout so slow generations are not cut off.
class GatewayApp {
 public:
  explicit GatewayApp(const GatewayConfig& cfg, TransportFactory make_transport = MakeHttplibTransport);

  GatewayApp(const GatewayApp&) = delete;
  GatewayApp& operator=(const GatewayApp&) = delete;

  void Register(httplib::Server* server);

  IUpstreamTransport* FetchTransport() const {
    return fetch_transport_.get();
  }
  IUpstreamTransport* ChatTransport() const {
    return chat_transport_.get();
  }

 private:
  std::unique_ptr<IUpstreamTransport> fetch_transport_;
  std::unique_ptr<IUpstreamTransport> chat_transport_;
  std::unique_ptr<ResilientFetcher> fetcher_;
  std::unique_ptr<ModelDirectoryCache> models_;
  std::unique_ptr<GatewayRouter> router_;
};

}  // namespace gateway
