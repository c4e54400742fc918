#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gateway {

// Reassembles newline-terminated lines from arbitrarily split chunks. The
// unterminated tail is held back until a later chunk completes it.
class LineAssembler {
 public:
  std::vector<std::string> Feed(std::string_view chunk);

  const std::string& Pending() const {
    return pending_;
  }

  void Reset() {
    pending_.clear();
  }

 private:
  std::string pending_;
};

}  // namespace gateway
