#pragma once

#include <string>

namespace aigw::utils {

/**
 * Random RFC 4122 version 4 UUID. Used for tool call ids, which the
 * Gemini protocol does not carry.
 */
std::string uuid4();

}  // namespace aigw::utils
