#pragma once

#include "aigw/openai_schema.hpp"

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aigw {

inline constexpr const char* kHeaderPath = ":path";
inline constexpr const char* kHeaderStatus = ":status";
inline constexpr const char* kHeaderContentLength = "content-length";
inline constexpr const char* kHeaderContentType = "content-type";

struct HeaderValue {
  std::string key;
  std::string value;
};

using HeaderMutation = std::vector<HeaderValue>;

using Headers = std::map<std::string, std::string>;

struct RequestMutation {
  HeaderMutation headers;
  std::optional<std::string> body;
};

struct LLMTokenUsage {
  std::uint32_t input_tokens = 0;
  std::uint32_t output_tokens = 0;
  std::uint32_t total_tokens = 0;
  std::uint32_t cached_input_tokens = 0;
};

struct ResponseMutation {
  HeaderMutation headers;
  std::optional<std::string> body;
  LLMTokenUsage usage;
  std::string response_model;
};

/**
 * Rewrites one chat completion exchange between the client schema and a
 * backend schema. An instance serves exactly one request/response cycle and
 * is called sequentially; streaming responses arrive through repeated
 * response_body calls with end_of_stream set on the last one.
 */
class ChatCompletionTranslator {
public:
  virtual ~ChatCompletionTranslator() = default;

  virtual RequestMutation request_body(const std::string& raw_body,
                                       const openai::ChatCompletionRequest& request,
                                       bool force_body_mutation) = 0;

  virtual HeaderMutation response_headers(const Headers& headers) = 0;

  virtual ResponseMutation response_body(const Headers& headers, std::istream& body, bool end_of_stream) = 0;

  /// Normalizes a non-2xx upstream body into the client's error schema.
  virtual ResponseMutation response_error(const Headers& headers, std::istream& body) = 0;
};

}  // namespace aigw
