#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace aigw::openai {

struct TextContentPart {
  std::string text;
};

struct ImageURL {
  std::string url;
  std::optional<std::string> detail;
};

struct ImageContentPart {
  ImageURL image_url;
};

struct InputAudioContentPart {
  std::string data;
  std::string format;
};

struct FileContentPart {
  std::optional<std::string> file_data;
  std::optional<std::string> file_id;
  std::optional<std::string> filename;
};

struct RefusalContentPart {
  std::string refusal;
};

using UserContentPart = std::variant<TextContentPart, ImageContentPart, InputAudioContentPart, FileContentPart>;
using AssistantContentPart = std::variant<TextContentPart, RefusalContentPart>;

template <typename Part>
using StringOrParts = std::variant<std::string, std::vector<Part>>;

struct ToolCallFunction {
  std::string name;
  std::string arguments;
};

struct ToolCall {
  std::string id;
  std::string type = "function";
  ToolCallFunction function;
};

struct DeveloperMessage {
  StringOrParts<TextContentPart> content;
  std::optional<std::string> name;
};

struct SystemMessage {
  StringOrParts<TextContentPart> content;
  std::optional<std::string> name;
};

struct UserMessage {
  StringOrParts<UserContentPart> content;
  std::optional<std::string> name;
};

struct AssistantMessage {
  std::optional<StringOrParts<AssistantContentPart>> content;
  std::vector<ToolCall> tool_calls;
  std::optional<std::string> name;
  std::optional<std::string> refusal;
};

struct ToolMessage {
  std::string tool_call_id;
  StringOrParts<TextContentPart> content;
};

using ChatMessage = std::variant<DeveloperMessage, SystemMessage, UserMessage, AssistantMessage, ToolMessage>;

struct FunctionDefinition {
  std::string name;
  std::optional<std::string> description;
  nlohmann::json parameters;
  std::optional<bool> strict;
};

struct Tool {
  std::string type;
  std::optional<FunctionDefinition> function;
};

struct NamedToolChoice {
  std::string type = "function";
  std::string function_name;
};

using ToolChoice = std::variant<std::string, NamedToolChoice>;

struct ResponseFormatText {};

struct ResponseFormatJSONObject {};

struct ResponseFormatJSONSchema {
  std::string name;
  std::optional<std::string> description;
  nlohmann::json schema;
  std::optional<bool> strict;
};

using ResponseFormat = std::variant<ResponseFormatText, ResponseFormatJSONObject, ResponseFormatJSONSchema>;

using StopSequences = std::variant<std::string, std::vector<std::string>>;

struct StreamOptions {
  std::optional<bool> include_usage;
};

struct GCPVertexAIVendorFields {
  std::optional<nlohmann::json> thinking_config;
  std::optional<nlohmann::json> safety_settings;
};

struct ChatCompletionRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  bool stream = false;
  std::optional<StreamOptions> stream_options;
  std::optional<double> temperature;
  std::optional<double> top_p;
  std::optional<std::int64_t> seed;
  std::optional<std::int64_t> n;
  std::optional<std::int64_t> max_tokens;
  std::optional<std::int64_t> max_completion_tokens;
  std::optional<double> presence_penalty;
  std::optional<double> frequency_penalty;
  std::optional<bool> logprobs;
  std::optional<std::int64_t> top_logprobs;
  std::optional<StopSequences> stop;
  std::vector<Tool> tools;
  std::optional<ToolChoice> tool_choice;
  std::optional<ResponseFormat> response_format;
  std::optional<std::vector<std::string>> guided_choice;
  std::optional<std::string> guided_regex;
  std::optional<nlohmann::json> guided_json;
  GCPVertexAIVendorFields vendor;
  nlohmann::json raw;
};

/**
 * Decodes an OpenAI chat completion request. Shapes outside the typed unions
 * above (unknown role, numeric content, unknown part type, ...) raise
 * SchemaError naming the role and the JSON type that was found.
 */
ChatCompletionRequest parse_chat_completion_request(const nlohmann::json& payload);

struct TopLogprob {
  std::string token;
  double logprob = 0.0;
};

struct TokenLogprob {
  std::string token;
  double logprob = 0.0;
  std::vector<TopLogprob> top_logprobs;
};

struct ChoiceLogprobs {
  std::vector<TokenLogprob> content;
};

struct ResponseMessage {
  std::string role = "assistant";
  std::optional<std::string> content;
  std::vector<ToolCall> tool_calls;
  std::optional<nlohmann::json> safety_ratings;
};

struct ChatCompletionChoice {
  std::int64_t index = 0;
  ResponseMessage message;
  std::string finish_reason;
  std::optional<ChoiceLogprobs> logprobs;
};

struct Usage {
  std::int64_t prompt_tokens = 0;
  std::int64_t completion_tokens = 0;
  std::int64_t total_tokens = 0;
  std::optional<std::int64_t> cached_tokens;
  std::optional<std::int64_t> reasoning_tokens;
};

struct ChatCompletionResponse {
  std::optional<std::string> id;
  std::string object = "chat.completion";
  std::optional<std::string> model;
  std::vector<ChatCompletionChoice> choices;
  Usage usage;
};

struct ChunkToolCall {
  std::int64_t index = 0;
  std::string id;
  std::string type = "function";
  ToolCallFunction function;
};

struct ChunkDelta {
  std::string role = "assistant";
  std::optional<std::string> content;
  std::vector<ChunkToolCall> tool_calls;
};

struct ChatCompletionChunkChoice {
  std::int64_t index = 0;
  ChunkDelta delta;
  std::string finish_reason;
  std::optional<ChoiceLogprobs> logprobs;
};

struct ChatCompletionResponseChunk {
  std::string object = "chat.completion.chunk";
  std::optional<std::string> model;
  std::vector<ChatCompletionChunkChoice> choices;
  std::optional<Usage> usage;
};

struct ErrorBody {
  std::string type;
  std::string message;
  std::string code;
};

nlohmann::json usage_to_json(const Usage& usage);
nlohmann::json logprobs_to_json(const ChoiceLogprobs& logprobs);
nlohmann::json response_to_json(const ChatCompletionResponse& response);
nlohmann::json chunk_to_json(const ChatCompletionResponseChunk& chunk);
nlohmann::json error_to_json(const ErrorBody& error);

}  // namespace aigw::openai
