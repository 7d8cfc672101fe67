#include "aigw/utils/mime.hpp"

#include "aigw/error.hpp"
#include "aigw/utils/base64.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace aigw::utils {
namespace {

constexpr std::string_view kDataScheme = "data:";
constexpr std::string_view kBase64Marker = ";base64";

std::string to_lower(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

const std::map<std::string, std::string>& extension_table() {
  static const std::map<std::string, std::string> table = {
      {".avif", "image/avif"},
      {".bmp", "image/bmp"},
      {".gif", "image/gif"},
      {".heic", "image/heic"},
      {".heif", "image/heif"},
      {".jpeg", "image/jpeg"},
      {".jpg", "image/jpeg"},
      {".png", "image/png"},
      {".svg", "image/svg+xml"},
      {".tif", "image/tiff"},
      {".tiff", "image/tiff"},
      {".webp", "image/webp"},
      {".pdf", "application/pdf"},
      {".json", "application/json"},
      {".txt", "text/plain; charset=utf-8"},
      {".mp3", "audio/mpeg"},
      {".wav", "audio/wav"},
      {".mp4", "video/mp4"},
  };
  return table;
}

}  // namespace

bool is_data_uri(std::string_view url) {
  if (url.size() < kDataScheme.size()) {
    return false;
  }
  return to_lower(url.substr(0, kDataScheme.size())) == kDataScheme;
}

DataURI parse_data_uri(std::string_view uri) {
  const auto comma = uri.find(',');
  if (uri.substr(0, kDataScheme.size()) != kDataScheme || comma == std::string_view::npos) {
    throw TranslationError("data uri does not have a valid format");
  }

  std::string_view header = uri.substr(kDataScheme.size(), comma - kDataScheme.size());
  if (header.size() >= kBase64Marker.size() &&
      header.substr(header.size() - kBase64Marker.size()) == kBase64Marker) {
    header.remove_suffix(kBase64Marker.size());
  }

  DataURI parsed;
  parsed.mime_type = std::string(header);
  parsed.data = decode_base64(uri.substr(comma + 1));
  return parsed;
}

std::string url_extension(std::string_view url) {
  auto end = url.find_first_of("?#");
  std::string_view path = url.substr(0, end);
  auto slash = path.find_last_of('/');
  std::string_view segment = slash == std::string_view::npos ? path : path.substr(slash + 1);
  auto dot = segment.find_last_of('.');
  if (dot == std::string_view::npos) {
    return {};
  }
  return std::string(segment.substr(dot));
}

std::string mime_type_by_extension(std::string_view extension) {
  const auto& table = extension_table();
  auto it = table.find(to_lower(extension));
  if (it == table.end()) {
    return {};
  }
  return it->second;
}

std::string image_mime_type_for_url(std::string_view url) {
  std::string mime = mime_type_by_extension(url_extension(url));
  return mime.empty() ? std::string(kMimeImageJPEG) : mime;
}

}  // namespace aigw::utils
