#include "aigw/gemini_schema.hpp"

#include "aigw/error.hpp"
#include "aigw/utils/base64.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace aigw::gemini {
namespace {

using json = nlohmann::json;

json function_declaration_to_json(const FunctionDeclaration& declaration) {
  json body = json::object();
  body["name"] = declaration.name;
  if (declaration.description && !declaration.description->empty()) body["description"] = *declaration.description;
  if (declaration.parameters) body["parameters"] = *declaration.parameters;
  if (declaration.parameters_json_schema) body["parametersJsonSchema"] = *declaration.parameters_json_schema;
  return body;
}

json tool_config_to_json(const ToolConfig& config) {
  json calling = json::object();
  calling["mode"] = config.function_calling_config.mode;
  if (!config.function_calling_config.allowed_function_names.empty()) {
    calling["allowedFunctionNames"] = config.function_calling_config.allowed_function_names;
  }
  return json{{"functionCallingConfig", std::move(calling)}};
}

Part parse_part(const json& payload) {
  Part part;
  part.thought = payload.value("thought", false);
  if (payload.contains("text") && payload.at("text").is_string()) {
    part.value = payload.at("text").get<std::string>();
  } else if (payload.contains("functionCall") && payload.at("functionCall").is_object()) {
    const auto& call = payload.at("functionCall");
    FunctionCall function_call;
    function_call.name = call.value("name", "");
    if (call.contains("args") && !call.at("args").is_null()) {
      function_call.args = call.at("args");
    }
    part.value = std::move(function_call);
  } else if (payload.contains("functionResponse") && payload.at("functionResponse").is_object()) {
    const auto& response = payload.at("functionResponse");
    FunctionResponse function_response;
    function_response.name = response.value("name", "");
    if (response.contains("response") && !response.at("response").is_null()) {
      function_response.response = response.at("response");
    }
    part.value = std::move(function_response);
  } else if (payload.contains("inlineData") && payload.at("inlineData").is_object()) {
    const auto& blob = payload.at("inlineData");
    part.value = Blob{blob.value("mimeType", ""), utils::decode_base64(blob.value("data", ""))};
  } else if (payload.contains("fileData") && payload.at("fileData").is_object()) {
    const auto& file = payload.at("fileData");
    part.value = FileData{file.value("fileUri", ""), file.value("mimeType", "")};
  }
  return part;
}

Content parse_content(const json& payload) {
  Content content;
  content.role = payload.value("role", "");
  if (payload.contains("parts") && payload.at("parts").is_array()) {
    for (const auto& part : payload.at("parts")) {
      content.parts.push_back(parse_part(part));
    }
  }
  return content;
}

std::vector<LogprobsCandidate> parse_logprobs_candidates(const json& payload) {
  std::vector<LogprobsCandidate> candidates;
  if (!payload.is_array()) {
    return candidates;
  }
  for (const auto& item : payload) {
    LogprobsCandidate candidate;
    candidate.token = item.value("token", "");
    candidate.log_probability = item.value("logProbability", 0.0F);
    candidates.push_back(std::move(candidate));
  }
  return candidates;
}

LogprobsResult parse_logprobs_result(const json& payload) {
  LogprobsResult result;
  if (payload.contains("chosenCandidates")) {
    result.chosen_candidates = parse_logprobs_candidates(payload.at("chosenCandidates"));
  }
  if (payload.contains("topCandidates") && payload.at("topCandidates").is_array()) {
    for (const auto& top : payload.at("topCandidates")) {
      result.top_candidates.push_back(
          top.is_object() && top.contains("candidates") ? parse_logprobs_candidates(top.at("candidates"))
                                                        : std::vector<LogprobsCandidate>{});
    }
  }
  return result;
}

Candidate parse_candidate(const json& payload) {
  Candidate candidate;
  if (payload.contains("index") && payload.at("index").is_number_integer()) {
    candidate.index = payload.at("index").get<std::int32_t>();
  }
  if (payload.contains("content") && payload.at("content").is_object()) {
    candidate.content = parse_content(payload.at("content"));
  }
  candidate.finish_reason = payload.value("finishReason", "");
  if (payload.contains("safetyRatings") && !payload.at("safetyRatings").is_null()) {
    candidate.safety_ratings = payload.at("safetyRatings");
  }
  if (payload.contains("logprobsResult") && payload.at("logprobsResult").is_object()) {
    candidate.logprobs_result = parse_logprobs_result(payload.at("logprobsResult"));
  }
  return candidate;
}

std::optional<std::int32_t> optional_count(const json& payload, const char* key) {
  if (!payload.contains(key) || payload.at(key).is_null()) {
    return std::nullopt;
  }
  return payload.at(key).get<std::int32_t>();
}

UsageMetadata parse_usage_metadata(const json& payload) {
  UsageMetadata usage;
  usage.prompt_token_count = payload.value("promptTokenCount", 0);
  usage.candidates_token_count = payload.value("candidatesTokenCount", 0);
  usage.total_token_count = payload.value("totalTokenCount", 0);
  usage.cached_content_token_count = optional_count(payload, "cachedContentTokenCount");
  usage.thoughts_token_count = optional_count(payload, "thoughtsTokenCount");
  return usage;
}

}  // namespace

json float32_to_json(float value) {
  if (!std::isfinite(value)) {
    return json(static_cast<double>(value));
  }
  char buffer[32];
  for (int precision = 1; precision <= std::numeric_limits<float>::max_digits10; ++precision) {
    std::snprintf(buffer, sizeof(buffer), "%.*g", precision, static_cast<double>(value));
    if (std::strtof(buffer, nullptr) == value) {
      return json(std::strtod(buffer, nullptr));
    }
  }
  return json(static_cast<double>(value));
}

json part_to_json(const Part& part) {
  json body = json::object();
  if (const auto* text = std::get_if<std::string>(&part.value)) {
    body["text"] = *text;
  } else if (const auto* blob = std::get_if<Blob>(&part.value)) {
    body["inlineData"] = {{"mimeType", blob->mime_type}, {"data", utils::encode_base64(blob->data)}};
  } else if (const auto* file = std::get_if<FileData>(&part.value)) {
    body["fileData"] = {{"fileUri", file->file_uri}, {"mimeType", file->mime_type}};
  } else if (const auto* call = std::get_if<FunctionCall>(&part.value)) {
    body["functionCall"] = {{"name", call->name}, {"args", call->args}};
  } else if (const auto* response = std::get_if<FunctionResponse>(&part.value)) {
    body["functionResponse"] = {{"name", response->name}, {"response", response->response}};
  }
  if (part.thought) {
    body["thought"] = true;
  }
  return body;
}

json content_to_json(const Content& content) {
  json body = json::object();
  if (!content.role.empty()) {
    body["role"] = content.role;
  }
  json parts = json::array();
  for (const auto& part : content.parts) {
    parts.push_back(part_to_json(part));
  }
  body["parts"] = std::move(parts);
  return body;
}

json generation_config_to_json(const GenerationConfig& config) {
  json body = json::object();
  if (config.temperature) body["temperature"] = float32_to_json(*config.temperature);
  if (config.top_p) body["topP"] = float32_to_json(*config.top_p);
  if (config.seed) body["seed"] = *config.seed;
  if (config.logprobs) body["logprobs"] = *config.logprobs;
  if (config.response_logprobs) body["responseLogprobs"] = true;
  if (config.candidate_count != 0) body["candidateCount"] = config.candidate_count;
  if (config.max_output_tokens != 0) body["maxOutputTokens"] = config.max_output_tokens;
  if (config.presence_penalty) body["presencePenalty"] = float32_to_json(*config.presence_penalty);
  if (config.frequency_penalty) body["frequencyPenalty"] = float32_to_json(*config.frequency_penalty);
  if (!config.stop_sequences.empty()) body["stopSequences"] = config.stop_sequences;
  if (!config.response_mime_type.empty()) body["responseMimeType"] = config.response_mime_type;
  if (config.response_schema) body["responseSchema"] = *config.response_schema;
  if (config.response_json_schema) body["responseJsonSchema"] = *config.response_json_schema;
  if (config.thinking_config) body["thinkingConfig"] = *config.thinking_config;
  return body;
}

json request_to_json(const GenerateContentRequest& request) {
  json body = json::object();

  json contents = json::array();
  for (const auto& content : request.contents) {
    contents.push_back(content_to_json(content));
  }
  body["contents"] = std::move(contents);

  if (!request.tools.empty()) {
    json tools = json::array();
    for (const auto& tool : request.tools) {
      json declarations = json::array();
      for (const auto& declaration : tool.function_declarations) {
        declarations.push_back(function_declaration_to_json(declaration));
      }
      tools.push_back({{"functionDeclarations", std::move(declarations)}});
    }
    body["tools"] = std::move(tools);
  }
  if (request.tool_config) body["tool_config"] = tool_config_to_json(*request.tool_config);
  body["generation_config"] = generation_config_to_json(request.generation_config);
  if (request.system_instruction) body["system_instruction"] = content_to_json(*request.system_instruction);
  if (request.safety_settings) body["safetySettings"] = *request.safety_settings;
  return body;
}

GenerateContentResponse parse_generate_content_response(const json& payload) {
  GenerateContentResponse response;
  if (!payload.is_object()) {
    throw TranslationError("generate content response must be an object, got " + std::string(payload.type_name()));
  }
  if (payload.contains("candidates") && payload.at("candidates").is_array()) {
    for (const auto& candidate : payload.at("candidates")) {
      if (candidate.is_object()) {
        response.candidates.push_back(parse_candidate(candidate));
      }
    }
  }
  if (payload.contains("usageMetadata") && payload.at("usageMetadata").is_object()) {
    response.usage_metadata = parse_usage_metadata(payload.at("usageMetadata"));
  }
  response.model_version = payload.value("modelVersion", "");
  response.response_id = payload.value("responseId", "");
  return response;
}

std::optional<APIError> parse_api_error(const json& payload) {
  if (!payload.is_object() || !payload.contains("error") || !payload.at("error").is_object()) {
    return std::nullopt;
  }
  const auto& error = payload.at("error");
  APIError parsed;
  if (error.contains("code") && error.at("code").is_number_integer()) {
    parsed.code = error.at("code").get<long>();
  }
  if (error.contains("message") && error.at("message").is_string()) {
    parsed.message = error.at("message").get<std::string>();
  }
  if (error.contains("status") && error.at("status").is_string()) {
    parsed.status = error.at("status").get<std::string>();
  }
  if (error.contains("details") && !error.at("details").is_null()) {
    parsed.details = error.at("details");
  }
  if (parsed.message.empty() && parsed.status.empty()) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace aigw::gemini
