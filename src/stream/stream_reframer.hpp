#pragma once

#include "stream/chunk_source.hpp"
#include "stream/cumulative_delta.hpp"
#include "stream/line_assembler.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace gateway {

// Returns false when the client can no longer be written to.
using FrameSink = std::function<bool(const std::string& frame)>;

enum class RelayOutcome {
  kCompleted,
  kClientGone,
  kUpstreamFailed,
};

const char* RelayOutcomeName(RelayOutcome outcome);

struct RelayResult {
  RelayOutcome outcome = RelayOutcome::kCompleted;
  size_t frames_written = 0;
  std::string error;
};

// One relay per client connection; the session state is never shared.
class StreamReframer {
 public:
  // Pulls chunks until the source ends, then writes the terminal [DONE]
  // frame. A transport failure ends the relay without [DONE]. A failed sink
  // write cancels the source.
  RelayResult Relay(IChunkSource* source, const FrameSink& sink);

 private:
  LineAssembler lines_;
  CumulativeDeltaTransformer transformer_;
};

}  // namespace gateway
