#include "stream/stream_reframer.hpp"

namespace gateway {

const char* RelayOutcomeName(RelayOutcome outcome) {
  switch (outcome) {
    case RelayOutcome::kCompleted:
      return "completed";
    case RelayOutcome::kClientGone:
      return "client_gone";
    case RelayOutcome::kUpstreamFailed:
      return "upstream_failed";
  }
  return "unknown";
}

RelayResult StreamReframer::Relay(IChunkSource* source, const FrameSink& sink) {
  RelayResult result;

  auto write = [&](const std::string& frame) -> bool {
    if (!sink(frame)) {
      source->Cancel();
      result.outcome = RelayOutcome::kClientGone;
      return false;
    }
    result.frames_written++;
    return true;
  };

  while (true) {
    std::string err;
    auto chunk = source->Next(&err);
    if (!chunk) {
      if (!err.empty()) {
        result.outcome = RelayOutcome::kUpstreamFailed;
        result.error = err;
        return result;
      }
      break;
    }
    for (const auto& line : lines_.Feed(*chunk)) {
      auto frame = transformer_.ProcessLine(line);
      if (!frame) continue;
      if (!write(*frame)) return result;
    }
  }

  // An unterminated trailing line cannot form an event.
  lines_.Reset();
  if (!write(SseDoneFrame())) return result;
  result.outcome = RelayOutcome::kCompleted;
  return result;
}

}  // namespace gateway
