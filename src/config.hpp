#pragma once

#include <cstdint>
#include <string>

namespace gateway {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 3000;
};

struct HttpEndpoint {
  std::string scheme = "https";
  std::string host = "127.0.0.1";
  int port = 443;
  std::string path = "/";

  // scheme://host:port, the form httplib::Client accepts.
  std::string Origin() const;
};

struct GatewayConfig {
  HttpListenConfig listen;
  HttpEndpoint chat_endpoint;
  HttpEndpoint models_endpoint;
  int max_attempts = 3;
  int64_t retry_delay_ms = 1000;
  int64_t timeout_ms = 30000;
  // Read timeout for chat completions; generations run far longer than a fetch.
  int64_t chat_timeout_ms = 300000;
  int64_t models_cache_ttl_ms = 3600000;
  std::string cors_origin = "*";
};

inline constexpr const char* kDefaultChatUrl = "https://chat.qwenlm.ai/api/chat/completions";
inline constexpr const char* kDefaultModelsUrl = "https://chat.qwenlm.ai/api/models";

HttpEndpoint ParseHttpEndpoint(const std::string& url);

GatewayConfig LoadConfigFromEnv();

}  // namespace gateway
