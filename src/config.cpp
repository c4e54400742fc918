#include "config.hpp"

#include <cstdlib>
#include <string>

namespace gateway {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static bool TryParseInt64(const std::string& s, int64_t* out) {
  if (s.empty() || !out) return false;
  char* end = nullptr;
  const long long n = std::strtoll(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  *out = static_cast<int64_t>(n);
  return true;
}

static void ApplyPositiveInt(const char* name, int64_t* target) {
  int64_t v = 0;
  if (TryParseInt64(GetEnvStr(name), &v) && v > 0) *target = v;
}

}  // namespace

std::string HttpEndpoint::Origin() const {
  return scheme + "://" + host + ":" + std::to_string(port);
}

HttpEndpoint ParseHttpEndpoint(const std::string& url) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.path.empty()) ep.path = "/";
  if (ep.port <= 0) ep.port = ep.scheme == "https" ? 443 : 80;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

GatewayConfig LoadConfigFromEnv() {
  GatewayConfig cfg;

  if (auto host = GetEnvStr("GATEWAY_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  int64_t port = 0;
  if (TryParseInt64(GetEnvStr("PORT"), &port) && port > 0) cfg.listen.port = static_cast<int>(port);
  if (TryParseInt64(GetEnvStr("GATEWAY_LISTEN_PORT"), &port) && port > 0) cfg.listen.port = static_cast<int>(port);

  auto chat_url = GetEnvStr("GATEWAY_CHAT_URL");
  cfg.chat_endpoint = ParseHttpEndpoint(chat_url.empty() ? kDefaultChatUrl : chat_url);
  auto models_url = GetEnvStr("GATEWAY_MODELS_URL");
  cfg.models_endpoint = ParseHttpEndpoint(models_url.empty() ? kDefaultModelsUrl : models_url);

  int64_t attempts = cfg.max_attempts;
  ApplyPositiveInt("GATEWAY_MAX_RETRIES", &attempts);
  cfg.max_attempts = static_cast<int>(attempts);
  ApplyPositiveInt("GATEWAY_RETRY_DELAY_MS", &cfg.retry_delay_ms);
  ApplyPositiveInt("GATEWAY_TIMEOUT_MS", &cfg.timeout_ms);
  ApplyPositiveInt("GATEWAY_CHAT_TIMEOUT_MS", &cfg.chat_timeout_ms);
  ApplyPositiveInt("GATEWAY_MODELS_CACHE_TTL_MS", &cfg.models_cache_ttl_ms);

  if (auto origin = GetEnvStr("GATEWAY_CORS_ORIGIN"); !origin.empty()) cfg.cors_origin = origin;

  return cfg;
}

}  // namespace gateway
