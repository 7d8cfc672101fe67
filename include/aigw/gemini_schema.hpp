#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace aigw::gemini {

inline constexpr const char* kRoleUser = "user";
inline constexpr const char* kRoleModel = "model";

inline constexpr const char* kFinishReasonStop = "STOP";
inline constexpr const char* kFinishReasonMaxTokens = "MAX_TOKENS";

struct Blob {
  std::string mime_type;
  std::vector<std::uint8_t> data;
};

struct FileData {
  std::string file_uri;
  std::string mime_type;
};

struct FunctionCall {
  std::string name;
  nlohmann::json args = nlohmann::json::object();
};

struct FunctionResponse {
  std::string name;
  nlohmann::json response = nlohmann::json::object();
};

using PartValue = std::variant<std::monostate, std::string, Blob, FileData, FunctionCall, FunctionResponse>;

struct Part {
  PartValue value;
  bool thought = false;

  static Part text(std::string text) { return Part{std::move(text)}; }
  static Part inline_data(std::string mime_type, std::vector<std::uint8_t> data) {
    return Part{Blob{std::move(mime_type), std::move(data)}};
  }
  static Part file_data(std::string uri, std::string mime_type) {
    return Part{FileData{std::move(uri), std::move(mime_type)}};
  }
  static Part function_call(std::string name, nlohmann::json args) {
    return Part{FunctionCall{std::move(name), std::move(args)}};
  }
  static Part function_response(std::string name, nlohmann::json response) {
    return Part{FunctionResponse{std::move(name), std::move(response)}};
  }

  const std::string* text_value() const { return std::get_if<std::string>(&value); }
  const FunctionCall* function_call_value() const { return std::get_if<FunctionCall>(&value); }
};

struct Content {
  std::string role;
  std::vector<Part> parts;
};

struct FunctionDeclaration {
  std::string name;
  std::optional<std::string> description;
  std::optional<nlohmann::json> parameters;
  std::optional<nlohmann::json> parameters_json_schema;
};

struct Tool {
  std::vector<FunctionDeclaration> function_declarations;
};

struct FunctionCallingConfig {
  std::string mode;
  std::vector<std::string> allowed_function_names;
};

struct ToolConfig {
  FunctionCallingConfig function_calling_config;
};

struct GenerationConfig {
  std::optional<float> temperature;
  std::optional<float> top_p;
  std::optional<std::int32_t> seed;
  std::optional<std::int32_t> logprobs;
  bool response_logprobs = false;
  std::int32_t candidate_count = 0;
  std::int32_t max_output_tokens = 0;
  std::optional<float> presence_penalty;
  std::optional<float> frequency_penalty;
  std::vector<std::string> stop_sequences;
  std::string response_mime_type;
  std::optional<nlohmann::json> response_schema;
  std::optional<nlohmann::json> response_json_schema;
  std::optional<nlohmann::json> thinking_config;
};

struct GenerateContentRequest {
  std::vector<Content> contents;
  std::vector<Tool> tools;
  std::optional<ToolConfig> tool_config;
  GenerationConfig generation_config;
  std::optional<Content> system_instruction;
  std::optional<nlohmann::json> safety_settings;
};

struct LogprobsCandidate {
  std::string token;
  float log_probability = 0.0F;
};

struct LogprobsResult {
  std::vector<LogprobsCandidate> chosen_candidates;
  std::vector<std::vector<LogprobsCandidate>> top_candidates;
};

struct Candidate {
  std::optional<std::int32_t> index;
  std::optional<Content> content;
  std::string finish_reason;
  std::optional<nlohmann::json> safety_ratings;
  std::optional<LogprobsResult> logprobs_result;
};

struct UsageMetadata {
  std::int32_t prompt_token_count = 0;
  std::int32_t candidates_token_count = 0;
  std::int32_t total_token_count = 0;
  std::optional<std::int32_t> cached_content_token_count;
  std::optional<std::int32_t> thoughts_token_count;
};

struct GenerateContentResponse {
  std::vector<Candidate> candidates;
  std::optional<UsageMetadata> usage_metadata;
  std::string model_version;
  std::string response_id;
};

struct APIError {
  long code = 0;
  std::string message;
  std::string status;
  std::optional<nlohmann::json> details;
};

nlohmann::json part_to_json(const Part& part);
nlohmann::json content_to_json(const Content& content);
nlohmann::json generation_config_to_json(const GenerationConfig& config);
nlohmann::json request_to_json(const GenerateContentRequest& request);

/**
 * Lenient decode: missing fields take their defaults. A field holding the wrong
 * JSON kind throws nlohmann::json::exception; a non-object payload or bad
 * inline base64 throws TranslationError.
 */
GenerateContentResponse parse_generate_content_response(const nlohmann::json& payload);

std::optional<APIError> parse_api_error(const nlohmann::json& payload);

/// Shortest decimal form of a 32-bit float, widened for JSON output (0.7F is written as 0.7).
nlohmann::json float32_to_json(float value);

}  // namespace aigw::gemini
