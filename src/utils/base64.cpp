#include "aigw/utils/base64.hpp"

#include "aigw/error.hpp"

#include <array>
#include <cctype>
#include <string>
#include <string_view>

namespace aigw::utils {
namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

const std::array<int, 256>& decode_table() {
  static const std::array<int, 256> table = [] {
    std::array<int, 256> t{};
    t.fill(-1);
    for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
      t[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int>(i);
    }
    return t;
  }();
  return table;
}

std::uint32_t sextet(std::string_view input, std::size_t pos) {
  const char c = input[pos];
  if (c == '=') {
    return 0;
  }
  int value = decode_table()[static_cast<unsigned char>(c)];
  if (value == -1) {
    throw TranslationError("illegal base64 data at input byte " + std::to_string(pos));
  }
  return static_cast<std::uint32_t>(value);
}

}  // namespace

std::vector<std::uint8_t> decode_base64(std::string_view input) {
  // Line breaks inside wrapped input are ignored.
  std::string compact;
  compact.reserve(input.size());
  for (char c : input) {
    if (c != '\r' && c != '\n') {
      compact.push_back(c);
    }
  }

  std::string_view trimmed = compact;
  while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.front()))) {
    trimmed.remove_prefix(1);
  }
  while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.back()))) {
    trimmed.remove_suffix(1);
  }

  if (trimmed.size() % 4 != 0) {
    throw TranslationError("illegal base64 data: length must be a multiple of 4");
  }

  std::vector<std::uint8_t> output;
  output.reserve((trimmed.size() / 4) * 3);

  for (std::size_t i = 0; i < trimmed.size(); i += 4) {
    const bool last_group = i + 4 == trimmed.size();
    // Padding is only legal in the final two positions of the last group.
    if (trimmed[i] == '=' || trimmed[i + 1] == '=' ||
        (trimmed[i + 2] == '=' && trimmed[i + 3] != '=') ||
        (!last_group && (trimmed[i + 2] == '=' || trimmed[i + 3] == '='))) {
      throw TranslationError("illegal base64 data at input byte " + std::to_string(i));
    }

    std::uint32_t triple = (sextet(trimmed, i) << 18) | (sextet(trimmed, i + 1) << 12) |
                           (sextet(trimmed, i + 2) << 6) | sextet(trimmed, i + 3);

    output.push_back(static_cast<std::uint8_t>((triple >> 16) & 0xFF));
    if (trimmed[i + 2] != '=') {
      output.push_back(static_cast<std::uint8_t>((triple >> 8) & 0xFF));
    }
    if (trimmed[i + 3] != '=') {
      output.push_back(static_cast<std::uint8_t>(triple & 0xFF));
    }
  }

  return output;
}

std::string encode_base64(const std::vector<std::uint8_t>& data) {
  std::string output;
  output.reserve(((data.size() + 2) / 3) * 4);

  std::size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                           (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                           static_cast<std::uint32_t>(data[i + 2]);
    output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    output.push_back(kAlphabet[triple & 0x3F]);
  }

  const std::size_t remaining = data.size() - i;
  if (remaining == 1) {
    std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
    output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    output.append("==");
  } else if (remaining == 2) {
    std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                           (static_cast<std::uint32_t>(data[i + 1]) << 8);
    output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    output.push_back('=');
  }

  return output;
}

}  // namespace aigw::utils
