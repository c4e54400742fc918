#include "stream/line_assembler.hpp"

namespace gateway {

std::vector<std::string> LineAssembler::Feed(std::string_view chunk) {
  pending_.append(chunk.data(), chunk.size());

  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    const auto nl = pending_.find('\n', start);
    if (nl == std::string::npos) break;
    lines.emplace_back(pending_, start, nl - start);
    start = nl + 1;
  }
  pending_.erase(0, start);
  return lines;
}

}  // namespace gateway
