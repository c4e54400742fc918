#include "gateway_router.hpp"

#include "stream/stream_reframer.hpp"
#include "upstream/upstream_stream.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace gateway {
namespace {

constexpr const char* kBearerPrefix = "Bearer ";

static std::string ToLowerAscii(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static nlohmann::json MakeError(const std::string& message) {
  nlohmann::json j;
  j["error"] = true;
  j["message"] = message;
  return j;
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

static std::string RedactHeaderValue(const std::string& key, const std::string& value) {
  const auto k = ToLowerAscii(key);
  if (k == "authorization" || k == "proxy-authorization" || k == "api-key" || k == "api_key" || k == "x-api-key") {
    return "<redacted>";
  }
  return value;
}

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

static void LogRequestRaw(const httplib::Request& req) {
  std::cout << "[request] " << req.method << " " << req.path << "\n";
  for (const auto& it : req.headers) {
    std::cout << "  " << it.first << ": " << RedactHeaderValue(it.first, it.second) << "\n";
  }
  if (!req.body.empty()) {
    std::cout << "  body: " << TruncateForLog(req.body, 2000) << "\n";
  }
}

// The header is forwarded upstream verbatim, so only the scheme is checked.
static std::optional<std::string> BearerAuthorization(const httplib::Request& req) {
  if (!req.has_header("Authorization")) return std::nullopt;
  auto value = req.get_header_value("Authorization");
  if (value.compare(0, std::strlen(kBearerPrefix), kBearerPrefix) != 0) return std::nullopt;
  return value;
}

// Mirrors the client contract where model: "" or model: 0 counts as absent.
static bool IsMissing(const nlohmann::ordered_json& v) {
  if (v.is_null()) return true;
  if (v.is_boolean()) return !v.get<bool>();
  if (v.is_string()) return v.get_ref<const std::string&>().empty();
  if (v.is_number()) return v.get<double>() == 0.0;
  return false;
}

static nlohmann::ordered_json BuildUpstreamChatBody(const nlohmann::ordered_json& j, bool stream) {
  nlohmann::ordered_json out;
  out["model"] = j["model"];
  if (j.contains("messages")) out["messages"] = j["messages"];
  out["stream"] = stream;
  if (j.contains("max_tokens")) out["max_tokens"] = j["max_tokens"];
  return out;
}

}  // namespace

GatewayRouter::GatewayRouter(IUpstreamTransport* transport, ModelDirectoryCache* models, RouterOptions options)
    : transport_(transport), models_(models), options_(std::move(options)) {}

void GatewayRouter::Register(httplib::Server* server) {
  const std::string cors_origin = options_.cors_origin;
  server->set_post_routing_handler([cors_origin](const httplib::Request&, httplib::Response& res) {
    if (!res.has_header("Access-Control-Allow-Origin")) res.set_header("Access-Control-Allow-Origin", cors_origin);
  });

  auto preflight_handler = [cors_origin](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
    res.set_header("Access-Control-Allow-Origin", cors_origin);
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Authorization, Content-Type");
  };

  auto models_handler = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequestRaw(req);
    auto auth = BearerAuthorization(req);
    if (!auth) return SendJson(&res, 401, MakeError("Unauthorized"));

    RetryExhausted failure;
    auto directory = models_->GetDirectory(*auth, &failure);
    if (!directory) {
      const auto message = failure.Message();
      std::cout << "[upstream-error] models: " << message << "\n";
      return SendJson(&res, 500, MakeError(message));
    }
    res.status = directory->status;
    res.set_content(directory->payload, "application/json");
  };

  auto chat_completions_handler = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequestRaw(req);
    auto auth = BearerAuthorization(req);
    if (!auth) return SendJson(&res, 401, MakeError("Unauthorized"));

    auto j = nlohmann::ordered_json::parse(req.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return SendJson(&res, 400, MakeError("invalid json body"));
    if (!j.contains("model") || IsMissing(j["model"])) {
      return SendJson(&res, 400, MakeError("Model parameter is required"));
    }

    bool stream = false;
    if (j.contains("stream") && j["stream"].is_boolean()) stream = j["stream"].get<bool>();

    UpstreamRequest upstream;
    upstream.method = "POST";
    upstream.endpoint = options_.chat_endpoint;
    upstream.headers.emplace("Authorization", *auth);
    upstream.body = BuildUpstreamChatBody(j, stream).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    upstream.content_type = "application/json";

    if (!stream) {
      std::string err;
      auto outcome = transport_->Send(upstream, &err);
      if (!outcome) {
        std::cout << "[upstream-error] chat: " << err << "\n";
        return SendJson(&res, 500, MakeError(err));
      }
      std::cout << "[chat] stream=0 status=" << outcome->status << " bytes=" << outcome->body.size() << "\n";
      res.status = outcome->status;
      res.set_content(std::move(outcome->body), "application/json");
      return;
    }

    auto upstream_stream = std::make_shared<UpstreamStream>(transport_, std::move(upstream));
    std::string err;
    auto head = upstream_stream->Open(&err);
    if (!head) {
      std::cout << "[upstream-error] chat: " << err << "\n";
      return SendJson(&res, 500, MakeError(err));
    }
    if (head->status < 200 || head->status >= 300) {
      const auto message = "Qwen API error: " + std::to_string(head->status);
      std::cout << "[upstream-error] chat: " << message << "\n";
      return SendJson(&res, 500, MakeError(message));
    }

    res.status = 200;
    res.set_header("Cache-Control", "no-cache");
    // httplib writes its own "Connection: close" when the client asked for it.
    if (req.get_header_value("Connection") != "close") res.set_header("Connection", "keep-alive");
    res.set_chunked_content_provider(
        "text/event-stream",
        [upstream_stream](size_t, httplib::DataSink& sink) {
          StreamReframer reframer;
          auto result = reframer.Relay(upstream_stream->Body(), [&](const std::string& frame) -> bool {
            if (sink.is_writable && !sink.is_writable()) return false;
            if (!sink.write) return false;
            return sink.write(frame.data(), frame.size());
          });
          std::cout << "[chat] stream=1 outcome=" << RelayOutcomeName(result.outcome)
                    << " frames=" << result.frames_written
                    << (result.error.empty() ? std::string() : " error=" + result.error) << "\n";
          if (result.outcome != RelayOutcome::kCompleted) return false;
          sink.done();
          return true;
        },
        [upstream_stream](bool) {});
  };

  server->Options("/v1/models", preflight_handler);
  server->Options("/v1/chat/completions", preflight_handler);
  server->Get("/v1/models", models_handler);
  server->Post("/v1/chat/completions", chat_completions_handler);
}

}  // namespace gateway
