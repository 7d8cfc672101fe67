#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace aigw {

inline constexpr std::string_view kSSEDone = "data: [DONE]\n";

/**
 * Cuts an upstream byte stream into frames separated by a blank line, each
 * with an optional "data: " prefix, and parses every frame as a JSON object.
 *
 * Intermediate frames that fail to parse are dropped. The last frame of a
 * chunk that fails to parse is treated as incomplete and carried into the
 * next feed() call.
 */
class FrameReassembler {
public:
  std::vector<nlohmann::json> feed(std::string_view chunk);

  const std::string& pending() const { return buffer_; }
  std::size_t dropped_frames() const { return dropped_; }
  void reset();

private:
  std::string buffer_;
  std::size_t dropped_ = 0;
};

std::string sse_data_event(const nlohmann::json& payload);

}  // namespace aigw
