#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace aigw::utils {

/// Standard alphabet, padded. Throws TranslationError on malformed input.
std::vector<std::uint8_t> decode_base64(std::string_view input);

std::string encode_base64(const std::vector<std::uint8_t>& data);

}  // namespace aigw::utils
