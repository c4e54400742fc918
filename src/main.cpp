#include "config.hpp"
#include "gateway_app.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <string>

namespace {

static std::string DescribeEndpoint(const gateway::HttpEndpoint& ep) {
  return ep.Origin() + ep.path;
}

}  // namespace

int main() {
  std::cout.setf(std::ios::unitbuf);
  auto cfg = gateway::LoadConfigFromEnv();

  gateway::GatewayApp app(cfg);

  std::cout << "[gateway] chat_endpoint=" << DescribeEndpoint(cfg.chat_endpoint) << "\n";
  std::cout << "[gateway] models_endpoint=" << DescribeEndpoint(cfg.models_endpoint)
            << " cache_ttl_ms=" << cfg.models_cache_ttl_ms << "\n";
  std::cout << "[gateway] max_attempts=" << cfg.max_attempts << " retry_delay_ms=" << cfg.retry_delay_ms
            << " timeout_ms=" << cfg.timeout_ms << " chat_timeout_ms=" << cfg.chat_timeout_ms << "\n";

  httplib::Server server;
  app.Register(&server);
  server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "internal error";
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      message = e.what();
    } catch (...) {
      message = "unknown exception";
    }
    std::cout << "[gateway] unhandled exception path=" << req.path << " error=" << message << "\n";
    nlohmann::json body;
    body["error"] = true;
    body["message"] = message;
    res.status = 500;
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
  });

  std::cout << "[gateway] listening on " << cfg.listen.host << ":" << cfg.listen.port << "\n";
  if (!server.listen(cfg.listen.host, cfg.listen.port)) {
    std::cout << "[gateway] failed to listen on " << cfg.listen.host << ":" << cfg.listen.port << "\n";
    return 1;
  }
  return 0;
}
