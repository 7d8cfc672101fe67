#include "aigw/streaming.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>

namespace aigw {
namespace {

constexpr std::string_view kFrameDelimiter = "\n\n";
constexpr std::string_view kDataPrefix = "data: ";

std::string_view strip_frame(std::string_view frame) {
  while (!frame.empty() && std::isspace(static_cast<unsigned char>(frame.front()))) {
    frame.remove_prefix(1);
  }
  if (frame.substr(0, kDataPrefix.size()) == kDataPrefix) {
    frame.remove_prefix(kDataPrefix.size());
  }
  return frame;
}

std::optional<nlohmann::json> parse_frame(std::string_view frame) {
  if (frame.empty()) {
    return std::nullopt;
  }
  auto parsed = nlohmann::json::parse(frame.begin(), frame.end(), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace

std::vector<nlohmann::json> FrameReassembler::feed(std::string_view chunk) {
  std::string data = std::move(buffer_);
  buffer_.clear();
  data.reserve(data.size() + chunk.size());
  // JSON strings never hold a raw CR, so dropping them turns "\r\n\r\n" delimiters into "\n\n".
  std::copy_if(chunk.begin(), chunk.end(), std::back_inserter(data), [](char c) { return c != '\r'; });

  std::vector<nlohmann::json> messages;
  if (data.empty()) {
    return messages;
  }

  std::size_t start = 0;
  while (true) {
    const auto end = data.find(kFrameDelimiter, start);
    const bool last = end == std::string::npos;
    std::string_view frame = strip_frame(std::string_view(data).substr(start, last ? std::string::npos : end - start));

    if (auto message = parse_frame(frame)) {
      messages.push_back(std::move(*message));
    } else if (last) {
      buffer_ = std::string(frame);
    } else if (!frame.empty()) {
      ++dropped_;
    }

    if (last) {
      break;
    }
    start = end + kFrameDelimiter.size();
  }
  return messages;
}

void FrameReassembler::reset() {
  buffer_.clear();
  dropped_ = 0;
}

std::string sse_data_event(const nlohmann::json& payload) {
  std::string event = "data: ";
  event += payload.dump();
  event += "\n\n";
  return event;
}

}  // namespace aigw
