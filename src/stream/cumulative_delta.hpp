#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace gateway {

using EventJson = nlohmann::ordered_json;

// choices[0].delta.content when it is a non-empty string.
std::optional<std::string> CumulativeContent(const EventJson& event);

// The part of `current` not already covered by `previous`. A chunk that does
// not extend the previous one is taken as-is.
std::string DeltaFrom(const std::string& previous, const std::string& current);

struct RewrittenEvent {
  EventJson event;
  std::optional<std::string> cumulative;
};

// Builds a new event with choices[0].delta.content reduced to its delta.
// Events without content come back unchanged and carry no cumulative value.
RewrittenEvent RewriteEvent(const EventJson& event, const std::string& previous);

std::string SseDataFrame(const EventJson& event);
std::string SseDoneFrame();

// Per-stream state: turns upstream SSE lines carrying cumulative content into
// frames carrying incremental deltas.
class CumulativeDeltaTransformer {
 public:
  // Returns the frame to emit for `line`, or nothing when the line is not a
  // data line. Payloads that are not JSON, or whose content is set to
  // something other than text, are passed through verbatim.
  std::optional<std::string> ProcessLine(const std::string& line);

  const std::string& PreviousContent() const {
    return previous_;
  }

 private:
  std::string previous_;
};

}  // namespace gateway
