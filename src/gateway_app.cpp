#include "gateway_app.hpp"

#include <chrono>
#include <utility>

namespace gateway {

std::unique_ptr<IUpstreamTransport> MakeHttplibTransport(const TransportTimeouts& timeouts) {
  return std::make_unique<HttplibTransport>(timeouts);
}

TransportTimeouts FetchTimeouts(const GatewayConfig& cfg) {
  TransportTimeouts t;
  t.connect = std::chrono::milliseconds(cfg.timeout_ms);
  t.read = std::chrono::milliseconds(cfg.timeout_ms);
  t.write = std::chrono::milliseconds(cfg.timeout_ms);
  return t;
}

TransportTimeouts ChatTimeouts(const GatewayConfig& cfg) {
  auto t = FetchTimeouts(cfg);
  t.read = std::chrono::milliseconds(cfg.chat_timeout_ms);
  return t;
}

GatewayApp::GatewayApp(const GatewayConfig& cfg, TransportFactory make_transport)
    : fetch_transport_(make_transport(FetchTimeouts(cfg))), chat_transport_(make_transport(ChatTimeouts(cfg))) {
  RetryPolicy policy;
  policy.max_attempts = cfg.max_attempts;
  policy.base_delay = std::chrono::milliseconds(cfg.retry_delay_ms);
  fetcher_ = std::make_unique<ResilientFetcher>(fetch_transport_.get(), policy);
  models_ = std::make_unique<ModelDirectoryCache>(fetcher_.get(), cfg.models_endpoint, cfg.models_cache_ttl_ms);

  RouterOptions options;
  options.chat_endpoint = cfg.chat_endpoint;
  options.cors_origin = cfg.cors_origin;
  router_ = std::make_unique<GatewayRouter>(chat_transport_.get(), models_.get(), std::move(options));
}

void GatewayApp::Register(httplib::Server* server) {
  router_->Register(server);
}

}  // namespace gateway
