#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace aigw::utils {

inline constexpr const char* kMimeImageJPEG = "image/jpeg";
inline constexpr const char* kMimeTextPlain = "text/plain";
inline constexpr const char* kMimeApplicationJSON = "application/json";
inline constexpr const char* kMimeTextEnum = "text/x.enum";

struct DataURI {
  std::string mime_type;
  std::vector<std::uint8_t> data;
};

/**
 * Parses `data:<mime>[;base64],<payload>`. The payload is always decoded as
 * standard base64. Throws TranslationError when the URI has no `data:` scheme
 * and `,` separator, or when the payload is not valid base64.
 */
DataURI parse_data_uri(std::string_view uri);

bool is_data_uri(std::string_view url);

std::string url_extension(std::string_view url);

std::string mime_type_by_extension(std::string_view extension);

/// MIME type for an image URL, `image/jpeg` when the extension is unknown.
std::string image_mime_type_for_url(std::string_view url);

}  // namespace aigw::utils
