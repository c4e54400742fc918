#include "stream/cumulative_delta.hpp"

#include <cctype>
#include <cstring>
#include <utility>

namespace gateway {
namespace {

constexpr const char* kDataPrefix = "data: ";

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static const EventJson* FirstDelta(const EventJson& event) {
  if (!event.is_object()) return nullptr;
  auto choices = event.find("choices");
  if (choices == event.end() || !choices->is_array() || choices->empty()) return nullptr;
  const auto& first = (*choices)[0];
  if (!first.is_object()) return nullptr;
  auto delta = first.find("delta");
  if (delta == first.end() || !delta->is_object()) return nullptr;
  return &*delta;
}

// content that is set but cannot be diffed as text: true, a non-zero number,
// an object or an array.
static bool HasOpaqueContent(const EventJson& event) {
  const auto* delta = FirstDelta(event);
  if (!delta) return false;
  auto content = delta->find("content");
  if (content == delta->end()) return false;
  if (content->is_boolean()) return content->get<bool>();
  if (content->is_number()) return content->get<double>() != 0.0;
  return content->is_object() || content->is_array();
}

}  // namespace

std::optional<std::string> CumulativeContent(const EventJson& event) {
  const auto* delta = FirstDelta(event);
  if (!delta) return std::nullopt;
  auto content = delta->find("content");
  if (content == delta->end() || !content->is_string()) return std::nullopt;
  auto text = content->get<std::string>();
  if (text.empty()) return std::nullopt;
  return text;
}

std::string DeltaFrom(const std::string& previous, const std::string& current) {
  if (!previous.empty() && StartsWith(current, previous)) return current.substr(previous.size());
  return current;
}

RewrittenEvent RewriteEvent(const EventJson& event, const std::string& previous) {
  RewrittenEvent out;
  out.cumulative = CumulativeContent(event);
  if (!out.cumulative) {
    out.event = event;
    return out;
  }

  EventJson delta = event["choices"][0]["delta"];
  delta["content"] = DeltaFrom(previous, *out.cumulative);
  EventJson choice = event["choices"][0];
  choice["delta"] = std::move(delta);
  EventJson choices = event["choices"];
  choices[0] = std::move(choice);
  out.event = event;
  out.event["choices"] = std::move(choices);
  return out;
}

std::string SseDataFrame(const EventJson& event) {
  return std::string(kDataPrefix) + event.dump(-1, ' ', false, EventJson::error_handler_t::replace) + "\n\n";
}

std::string SseDoneFrame() {
  return "data: [DONE]\n\n";
}

std::optional<std::string> CumulativeDeltaTransformer::ProcessLine(const std::string& line) {
  const auto trimmed = Trim(line);
  if (!StartsWith(trimmed, kDataPrefix)) return std::nullopt;

  // The payload is cut from the raw line, so a line indented before "data: "
  // does not parse and is passed through.
  auto parsed = EventJson::parse(line.substr(std::strlen(kDataPrefix)), nullptr, false);
  if (parsed.is_discarded() || HasOpaqueContent(parsed)) return line + "\n\n";

  auto rewritten = RewriteEvent(parsed, previous_);
  if (rewritten.cumulative) previous_ = std::move(*rewritten.cumulative);
  return SseDataFrame(rewritten.event);
}

}  // namespace gateway
