#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace aigw {

struct HttpRequest {
  std::string method;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{60000};
  /// Called once with the status line and headers, before the first on_chunk call.
  std::function<void(long status_code, const std::map<std::string, std::string>& headers)> on_response_start;
  std::function<void(const char*, std::size_t)> on_chunk;
  bool collect_body = true;
};

struct HttpResponse {
  long status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  /// Throws UpstreamError when the backend cannot be reached; exceptions thrown by callbacks propagate unchanged.
  virtual HttpResponse request(const HttpRequest& request) = 0;
};

std::unique_ptr<HttpClient> make_default_http_client();

}  // namespace aigw
