#include "aigw/openai_schema.hpp"

#include "aigw/error.hpp"

#include <utility>

namespace aigw::openai {
namespace {

using json = nlohmann::json;

bool present(const json& payload, const char* key) {
  return payload.contains(key) && !payload.at(key).is_null();
}

std::string field_type_error(const std::string& field, const char* expected, const json& value) {
  return "invalid type for field '" + field + "': expected " + expected + ", got " + value.type_name();
}

std::optional<std::string> optional_string(const json& payload, const char* key) {
  if (!present(payload, key)) {
    return std::nullopt;
  }
  const auto& value = payload.at(key);
  if (!value.is_string()) {
    throw SchemaError(field_type_error(key, "string", value));
  }
  return value.get<std::string>();
}

std::optional<double> optional_double(const json& payload, const char* key) {
  if (!present(payload, key)) {
    return std::nullopt;
  }
  const auto& value = payload.at(key);
  if (!value.is_number()) {
    throw SchemaError(field_type_error(key, "number", value));
  }
  return value.get<double>();
}

std::optional<std::int64_t> optional_integer(const json& payload, const char* key) {
  if (!present(payload, key)) {
    return std::nullopt;
  }
  const auto& value = payload.at(key);
  if (!value.is_number_integer()) {
    throw SchemaError(field_type_error(key, "integer", value));
  }
  return value.get<std::int64_t>();
}

std::optional<bool> optional_bool(const json& payload, const char* key) {
  if (!present(payload, key)) {
    return std::nullopt;
  }
  const auto& value = payload.at(key);
  if (!value.is_boolean()) {
    throw SchemaError(field_type_error(key, "boolean", value));
  }
  return value.get<bool>();
}

std::vector<std::string> string_list(const json& value, const std::string& field) {
  if (!value.is_array()) {
    throw SchemaError(field_type_error(field, "array of strings", value));
  }
  std::vector<std::string> items;
  items.reserve(value.size());
  for (const auto& item : value) {
    if (!item.is_string()) {
      throw SchemaError(field_type_error(field, "array of strings", item));
    }
    items.push_back(item.get<std::string>());
  }
  return items;
}

std::string part_type(const json& part) {
  if (!part.is_object()) {
    return part.type_name();
  }
  auto it = part.find("type");
  if (it == part.end() || !it->is_string()) {
    return "object";
  }
  return it->get<std::string>();
}

std::string unsupported_content(const std::string& role, const std::string& type) {
  return "unsupported content type in " + role + " message: " + type;
}

TextContentPart parse_text_part(const json& part, const std::string& role) {
  if (part_type(part) != "text") {
    throw SchemaError(unsupported_content(role, part_type(part)));
  }
  auto text = optional_string(part, "text");
  return TextContentPart{text.value_or("")};
}

StringOrParts<TextContentPart> parse_text_content(const json& message, const std::string& role) {
  const json content = message.contains("content") ? message.at("content") : json();
  if (content.is_string()) {
    return content.get<std::string>();
  }
  if (content.is_array()) {
    std::vector<TextContentPart> parts;
    parts.reserve(content.size());
    for (const auto& part : content) {
      parts.push_back(parse_text_part(part, role));
    }
    return parts;
  }
  throw SchemaError(unsupported_content(role, content.type_name()));
}

UserContentPart parse_user_part(const json& part) {
  const std::string type = part_type(part);
  if (type == "text") {
    return parse_text_part(part, "user");
  }
  if (type == "image_url") {
    if (!part.contains("image_url") || !part.at("image_url").is_object()) {
      throw SchemaError("image_url content part requires an image_url object");
    }
    const auto& image = part.at("image_url");
    ImageContentPart image_part;
    image_part.image_url.url = optional_string(image, "url").value_or("");
    image_part.image_url.detail = optional_string(image, "detail");
    return image_part;
  }
  if (type == "input_audio") {
    InputAudioContentPart audio;
    if (part.contains("input_audio") && part.at("input_audio").is_object()) {
      const auto& payload = part.at("input_audio");
      audio.data = optional_string(payload, "data").value_or("");
      audio.format = optional_string(payload, "format").value_or("");
    }
    return audio;
  }
  if (type == "file") {
    FileContentPart file;
    if (part.contains("file") && part.at("file").is_object()) {
      const auto& payload = part.at("file");
      file.file_data = optional_string(payload, "file_data");
      file.file_id = optional_string(payload, "file_id");
      file.filename = optional_string(payload, "filename");
    }
    return file;
  }
  throw SchemaError(unsupported_content("user", type));
}

StringOrParts<UserContentPart> parse_user_content(const json& message) {
  const json content = message.contains("content") ? message.at("content") : json();
  if (content.is_string()) {
    return content.get<std::string>();
  }
  if (content.is_array()) {
    std::vector<UserContentPart> parts;
    parts.reserve(content.size());
    for (const auto& part : content) {
      parts.push_back(parse_user_part(part));
    }
    return parts;
  }
  throw SchemaError(unsupported_content("user", content.type_name()));
}

std::optional<StringOrParts<AssistantContentPart>> parse_assistant_content(const json& message) {
  if (!present(message, "content")) {
    return std::nullopt;
  }
  const auto& content = message.at("content");
  if (content.is_string()) {
    return StringOrParts<AssistantContentPart>(content.get<std::string>());
  }
  if (content.is_array()) {
    std::vector<AssistantContentPart> parts;
    parts.reserve(content.size());
    for (const auto& part : content) {
      const std::string type = part_type(part);
      if (type == "text") {
        parts.emplace_back(parse_text_part(part, "assistant"));
      } else if (type == "refusal") {
        parts.emplace_back(RefusalContentPart{optional_string(part, "refusal").value_or("")});
      } else {
        throw SchemaError(unsupported_content("assistant", type));
      }
    }
    return StringOrParts<AssistantContentPart>(std::move(parts));
  }
  throw SchemaError(unsupported_content("assistant", content.type_name()));
}

ToolCall parse_tool_call(const json& payload) {
  if (!payload.is_object()) {
    throw SchemaError(field_type_error("tool_calls", "object", payload));
  }
  ToolCall call;
  call.id = optional_string(payload, "id").value_or("");
  call.type = optional_string(payload, "type").value_or("function");
  if (present(payload, "function")) {
    const auto& function = payload.at("function");
    if (!function.is_object()) {
      throw SchemaError(field_type_error("function", "object", function));
    }
    call.function.name = optional_string(function, "name").value_or("");
    call.function.arguments = optional_string(function, "arguments").value_or("");
  }
  return call;
}

ChatMessage parse_message(const json& payload) {
  if (!payload.is_object()) {
    throw SchemaError("invalid message: expected object, got " + std::string(payload.type_name()));
  }
  const std::string role = payload.contains("role") && payload.at("role").is_string()
                               ? payload.at("role").get<std::string>()
                               : std::string();

  if (role == "developer") {
    return DeveloperMessage{parse_text_content(payload, role), optional_string(payload, "name")};
  }
  if (role == "system") {
    return SystemMessage{parse_text_content(payload, role), optional_string(payload, "name")};
  }
  if (role == "user") {
    return UserMessage{parse_user_content(payload), optional_string(payload, "name")};
  }
  if (role == "assistant") {
    AssistantMessage message;
    message.content = parse_assistant_content(payload);
    message.name = optional_string(payload, "name");
    message.refusal = optional_string(payload, "refusal");
    if (present(payload, "tool_calls")) {
      const auto& calls = payload.at("tool_calls");
      if (!calls.is_array()) {
        throw SchemaError(field_type_error("tool_calls", "array", calls));
      }
      for (const auto& call : calls) {
        message.tool_calls.push_back(parse_tool_call(call));
      }
    }
    return message;
  }
  if (role == "tool") {
    ToolMessage message;
    message.tool_call_id = optional_string(payload, "tool_call_id").value_or("");
    message.content = parse_text_content(payload, role);
    return message;
  }
  throw SchemaError("invalid role in message: '" + role + "'");
}

Tool parse_tool(const json& payload) {
  if (!payload.is_object()) {
    throw SchemaError(field_type_error("tools", "object", payload));
  }
  Tool tool;
  tool.type = optional_string(payload, "type").value_or("");
  if (present(payload, "function")) {
    const auto& function = payload.at("function");
    if (!function.is_object()) {
      throw SchemaError(field_type_error("function", "object", function));
    }
    FunctionDefinition definition;
    definition.name = optional_string(function, "name").value_or("");
    definition.description = optional_string(function, "description");
    if (function.contains("parameters")) {
      definition.parameters = function.at("parameters");
    }
    definition.strict = optional_bool(function, "strict");
    tool.function = std::move(definition);
  }
  return tool;
}

ToolChoice parse_tool_choice(const json& payload) {
  if (payload.is_string()) {
    return payload.get<std::string>();
  }
  if (payload.is_object() && payload.contains("function") && payload.at("function").is_object()) {
    NamedToolChoice named;
    named.type = optional_string(payload, "type").value_or("function");
    named.function_name = optional_string(payload.at("function"), "name").value_or("");
    return named;
  }
  throw SchemaError("unsupported tool choice type: " + std::string(payload.type_name()));
}

ResponseFormat parse_response_format(const json& payload) {
  if (!payload.is_object()) {
    throw SchemaError(field_type_error("response_format", "object", payload));
  }
  const std::string type = optional_string(payload, "type").value_or("");
  if (type == "text") {
    return ResponseFormatText{};
  }
  if (type == "json_object") {
    return ResponseFormatJSONObject{};
  }
  if (type == "json_schema") {
    if (!payload.contains("json_schema") || !payload.at("json_schema").is_object()) {
      throw SchemaError("response_format json_schema requires a json_schema object");
    }
    const auto& spec = payload.at("json_schema");
    ResponseFormatJSONSchema format;
    format.name = optional_string(spec, "name").value_or("");
    format.description = optional_string(spec, "description");
    if (spec.contains("schema")) {
      format.schema = spec.at("schema");
    }
    format.strict = optional_bool(spec, "strict");
    return format;
  }
  throw SchemaError("unsupported response_format type: '" + type + "'");
}

void parse_vendor_fields(const json& payload, GCPVertexAIVendorFields& vendor) {
  if (present(payload, "generationConfig")) {
    const auto& config = payload.at("generationConfig");
    if (!config.is_object()) {
      throw SchemaError(field_type_error("generationConfig", "object", config));
    }
    if (present(config, "thinkingConfig")) {
      vendor.thinking_config = config.at("thinkingConfig");
    }
  }
  if (present(payload, "safetySettings")) {
    const auto& settings = payload.at("safetySettings");
    if (!settings.is_array()) {
      throw SchemaError(field_type_error("safetySettings", "array", settings));
    }
    vendor.safety_settings = settings;
  }
}

json tool_call_to_json(const ToolCall& call) {
  return json{{"id", call.id},
              {"type", call.type},
              {"function", {{"name", call.function.name}, {"arguments", call.function.arguments}}}};
}

}  // namespace

ChatCompletionRequest parse_chat_completion_request(const json& payload) {
  if (!payload.is_object()) {
    throw SchemaError("chat completion request must be a JSON object, got " + std::string(payload.type_name()));
  }

  ChatCompletionRequest request;
  request.raw = payload;
  request.model = optional_string(payload, "model").value_or("");

  if (!payload.contains("messages") || !payload.at("messages").is_array()) {
    throw SchemaError("messages must be an array");
  }
  for (const auto& message : payload.at("messages")) {
    request.messages.push_back(parse_message(message));
  }

  request.stream = optional_bool(payload, "stream").value_or(false);
  if (present(payload, "stream_options")) {
    StreamOptions options;
    options.include_usage = optional_bool(payload.at("stream_options"), "include_usage");
    request.stream_options = options;
  }
  request.temperature = optional_double(payload, "temperature");
  request.top_p = optional_double(payload, "top_p");
  request.seed = optional_integer(payload, "seed");
  request.n = optional_integer(payload, "n");
  request.max_tokens = optional_integer(payload, "max_tokens");
  request.max_completion_tokens = optional_integer(payload, "max_completion_tokens");
  request.presence_penalty = optional_double(payload, "presence_penalty");
  request.frequency_penalty = optional_double(payload, "frequency_penalty");
  request.logprobs = optional_bool(payload, "logprobs");
  request.top_logprobs = optional_integer(payload, "top_logprobs");

  if (present(payload, "stop")) {
    const auto& stop = payload.at("stop");
    if (stop.is_string()) {
      request.stop = stop.get<std::string>();
    } else {
      request.stop = string_list(stop, "stop");
    }
  }

  if (present(payload, "tools")) {
    const auto& tools = payload.at("tools");
    if (!tools.is_array()) {
      throw SchemaError(field_type_error("tools", "array", tools));
    }
    for (const auto& tool : tools) {
      request.tools.push_back(parse_tool(tool));
    }
  }
  if (present(payload, "tool_choice")) {
    request.tool_choice = parse_tool_choice(payload.at("tool_choice"));
  }
  if (present(payload, "response_format")) {
    request.response_format = parse_response_format(payload.at("response_format"));
  }

  if (present(payload, "guided_choice")) {
    request.guided_choice = string_list(payload.at("guided_choice"), "guided_choice");
  }
  if (auto regex = optional_string(payload, "guided_regex"); regex && !regex->empty()) {
    request.guided_regex = std::move(regex);
  }
  if (present(payload, "guided_json")) {
    request.guided_json = payload.at("guided_json");
  }

  parse_vendor_fields(payload, request.vendor);
  return request;
}

json usage_to_json(const Usage& usage) {
  json body = json::object();
  body["prompt_tokens"] = usage.prompt_tokens;
  body["completion_tokens"] = usage.completion_tokens;
  body["total_tokens"] = usage.total_tokens;
  if (usage.cached_tokens) {
    body["prompt_tokens_details"] = {{"cached_tokens", *usage.cached_tokens}};
  }
  if (usage.reasoning_tokens) {
    body["completion_tokens_details"] = {{"reasoning_tokens", *usage.reasoning_tokens}};
  }
  return body;
}

json logprobs_to_json(const ChoiceLogprobs& logprobs) {
  json content = json::array();
  for (const auto& token : logprobs.content) {
    json top = json::array();
    for (const auto& candidate : token.top_logprobs) {
      top.push_back({{"token", candidate.token}, {"logprob", candidate.logprob}});
    }
    content.push_back({{"token", token.token}, {"logprob", token.logprob}, {"top_logprobs", std::move(top)}});
  }
  return json{{"content", std::move(content)}};
}

json response_to_json(const ChatCompletionResponse& response) {
  json body = json::object();
  if (response.id) body["id"] = *response.id;
  body["object"] = response.object;
  if (response.model) body["model"] = *response.model;

  json choices = json::array();
  for (const auto& choice : response.choices) {
    json message = json::object();
    message["role"] = choice.message.role;
    message["content"] = choice.message.content ? json(*choice.message.content) : json(nullptr);
    if (!choice.message.tool_calls.empty()) {
      json calls = json::array();
      for (const auto& call : choice.message.tool_calls) {
        calls.push_back(tool_call_to_json(call));
      }
      message["tool_calls"] = std::move(calls);
    }
    if (choice.message.safety_ratings) message["safety_ratings"] = *choice.message.safety_ratings;

    json item = json::object();
    item["index"] = choice.index;
    item["message"] = std::move(message);
    item["finish_reason"] = choice.finish_reason;
    if (choice.logprobs) item["logprobs"] = logprobs_to_json(*choice.logprobs);
    choices.push_back(std::move(item));
  }
  if (!choices.empty()) {
    body["choices"] = std::move(choices);
  }
  const Usage& usage = response.usage;
  if (usage.prompt_tokens != 0 || usage.completion_tokens != 0 || usage.total_tokens != 0 || usage.cached_tokens ||
      usage.reasoning_tokens) {
    body["usage"] = usage_to_json(usage);
  }
  return body;
}

json chunk_to_json(const ChatCompletionResponseChunk& chunk) {
  json body = json::object();
  json choices = json::array();
  for (const auto& choice : chunk.choices) {
    json delta = json::object();
    delta["role"] = choice.delta.role;
    if (choice.delta.content) delta["content"] = *choice.delta.content;
    if (!choice.delta.tool_calls.empty()) {
      json calls = json::array();
      for (const auto& call : choice.delta.tool_calls) {
        calls.push_back({{"index", call.index},
                         {"id", call.id},
                         {"type", call.type},
                         {"function", {{"name", call.function.name}, {"arguments", call.function.arguments}}}});
      }
      delta["tool_calls"] = std::move(calls);
    }

    json item = json::object();
    item["index"] = choice.index;
    item["delta"] = std::move(delta);
    if (!choice.finish_reason.empty()) item["finish_reason"] = choice.finish_reason;
    if (choice.logprobs) item["logprobs"] = logprobs_to_json(*choice.logprobs);
    choices.push_back(std::move(item));
  }
  body["choices"] = std::move(choices);
  body["object"] = chunk.object;
  if (chunk.model) body["model"] = *chunk.model;
  if (chunk.usage) body["usage"] = usage_to_json(*chunk.usage);
  return body;
}

json error_to_json(const ErrorBody& error) {
  return json{{"type", "error"},
              {"error", {{"type", error.type}, {"message", error.message}, {"code", error.code}}}};
}

}  // namespace aigw::openai
