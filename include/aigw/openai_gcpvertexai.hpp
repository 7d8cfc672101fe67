#pragma once

#include "aigw/gemini_request.hpp"
#include "aigw/logging.hpp"
#include "aigw/streaming.hpp"
#include "aigw/translator.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace aigw {

inline constexpr const char* kGCPBackendErrorType = "GCPVertexAIBackendError";

/**
 * OpenAI chat completions in front of Gemini models on GCP Vertex AI
 * (generateContent / streamGenerateContent?alt=sse).
 *
 * Per-exchange state (resolved model, stream flag, response mode, carried
 * stream bytes, tool call counter) is reset by every request_body call.
 */
class OpenAIToGCPVertexAITranslator : public ChatCompletionTranslator {
public:
  explicit OpenAIToGCPVertexAITranslator(std::string model_name_override = {}, Logger logger = {});

  RequestMutation request_body(const std::string& raw_body,
                               const openai::ChatCompletionRequest& request,
                               bool force_body_mutation) override;
  HeaderMutation response_headers(const Headers& headers) override;
  ResponseMutation response_body(const Headers& headers, std::istream& body, bool end_of_stream) override;
  ResponseMutation response_error(const Headers& headers, std::istream& body) override;

  const std::string& request_model() const { return request_model_; }
  bool streaming() const { return stream_; }

private:
  ResponseMutation convert_response(const std::string& data);
  ResponseMutation convert_stream_chunk(const std::string& data, bool end_of_stream);

  std::string model_name_override_;
  Logger logger_;

  std::string request_model_;
  std::string response_model_;
  bool stream_ = false;
  ResponseMode response_mode_ = ResponseMode::None;
  FrameReassembler reassembler_;
  std::int64_t next_tool_call_index_ = 0;
};

std::unique_ptr<ChatCompletionTranslator> make_openai_to_gcp_vertexai_translator(std::string model_name_override = {},
                                                                                 Logger logger = {});

}  // namespace aigw
