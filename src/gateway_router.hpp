#pragma once

#include "config.hpp"
#include "model_directory_cache.hpp"
#include "upstream/transport.hpp"

#include <httplib.h>

#include <string>

namespace gateway {

struct RouterOptions {
  HttpEndpoint chat_endpoint;
  std::string cors_origin = "*";
};

class GatewayRouter {
 public:
  GatewayRouter(IUpstreamTransport* transport, ModelDirectoryCache* models, RouterOptions options);

  void Register(httplib::Server* server);

 private:
  IUpstreamTransport* transport_;
  ModelDirectoryCache* models_;
  RouterOptions options_;
};

}  // namespace gateway
