#include "aigw/gemini_request.hpp"

#include "aigw/error.hpp"
#include "aigw/jsonschema.hpp"
#include "aigw/utils/mime.hpp"

#include <type_traits>
#include <utility>

namespace aigw {
namespace {

using json = nlohmann::json;

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

void append_system_parts(std::optional<gemini::Content>& system_instruction, std::vector<gemini::Part> parts) {
  if (parts.empty()) {
    return;
  }
  if (!system_instruction) {
    system_instruction = gemini::Content{};
  }
  for (auto& part : parts) {
    system_instruction->parts.push_back(std::move(part));
  }
}

std::vector<gemini::Part> text_parts(const openai::StringOrParts<openai::TextContentPart>& content) {
  std::vector<gemini::Part> parts;
  if (const auto* text = std::get_if<std::string>(&content)) {
    if (!text->empty()) {
      parts.push_back(gemini::Part::text(*text));
    }
    return parts;
  }
  for (const auto& part : std::get<std::vector<openai::TextContentPart>>(content)) {
    if (!part.text.empty()) {
      parts.push_back(gemini::Part::text(part.text));
    }
  }
  return parts;
}

void validate_url(const std::string& url) {
  for (unsigned char c : url) {
    if (c < 0x20 || c == 0x7F) {
      throw TranslationError("invalid image URL: invalid control character in URL");
    }
  }
}

std::optional<gemini::Part> image_part(const openai::ImageContentPart& image) {
  const std::string& url = image.image_url.url;
  if (url.empty()) {
    return std::nullopt;
  }
  validate_url(url);

  if (utils::is_data_uri(url)) {
    utils::DataURI parsed;
    try {
      parsed = utils::parse_data_uri(url);
    } catch (const TranslationError&) {
      rethrow_with_context("failed to parse data URI");
    }
    return gemini::Part::inline_data(std::move(parsed.mime_type), std::move(parsed.data));
  }
  return gemini::Part::file_data(url, utils::image_mime_type_for_url(url));
}

json parse_tool_arguments(const std::string& arguments) {
  json parsed;
  try {
    parsed = json::parse(arguments);
  } catch (const json::exception& ex) {
    throw TranslationError(std::string("function arguments should be valid json string. failed to parse function arguments: ") +
                           ex.what());
  }
  if (parsed.is_null()) {
    return json::object();
  }
  if (!parsed.is_object()) {
    throw TranslationError(std::string("function arguments should be valid json string. failed to parse function arguments: expected a JSON object, got ") +
                           parsed.type_name());
  }
  return parsed;
}

}  // namespace

std::vector<gemini::Part> developer_message_to_parts(const openai::DeveloperMessage& message) {
  return text_parts(message.content);
}

std::vector<gemini::Part> user_message_to_parts(const openai::UserMessage& message) {
  std::vector<gemini::Part> parts;
  if (const auto* text = std::get_if<std::string>(&message.content)) {
    if (!text->empty()) {
      parts.push_back(gemini::Part::text(*text));
    }
    return parts;
  }

  for (const auto& content : std::get<std::vector<openai::UserContentPart>>(message.content)) {
    std::visit(overloaded{
                   [&](const openai::TextContentPart& part) {
                     if (!part.text.empty()) {
                       parts.push_back(gemini::Part::text(part.text));
                     }
                   },
                   [&](const openai::ImageContentPart& part) {
                     if (auto converted = image_part(part)) {
                       parts.push_back(std::move(*converted));
                     }
                   },
                   [](const openai::InputAudioContentPart&) {
                     throw TranslationError("audio content not supported yet");
                   },
                   [](const openai::FileContentPart&) {
                     throw TranslationError("file content not supported yet");
                   },
               },
               content);
  }
  return parts;
}

gemini::Part tool_message_to_part(const openai::ToolMessage& message, const ToolCallRegistry& registry) {
  std::string name;
  if (auto it = registry.find(message.tool_call_id); it != registry.end()) {
    name = it->second;
  }

  std::string output;
  if (const auto* text = std::get_if<std::string>(&message.content)) {
    output = *text;
  } else {
    for (const auto& part : std::get<std::vector<openai::TextContentPart>>(message.content)) {
      output += part.text;
    }
  }
  return gemini::Part::function_response(std::move(name), json{{"output", output}});
}

std::vector<gemini::Part> assistant_message_to_parts(const openai::AssistantMessage& message,
                                                     ToolCallRegistry& registry) {
  for (const auto& call : message.tool_calls) {
    registry[call.id] = call.function.name;
  }

  std::vector<gemini::Part> parts;
  for (const auto& call : message.tool_calls) {
    parts.push_back(gemini::Part::function_call(call.function.name, parse_tool_arguments(call.function.arguments)));
  }

  if (!message.content) {
    return parts;
  }
  if (const auto* text = std::get_if<std::string>(&*message.content)) {
    if (!text->empty()) {
      parts.push_back(gemini::Part::text(*text));
    }
    return parts;
  }
  for (const auto& content : std::get<std::vector<openai::AssistantContentPart>>(*message.content)) {
    // Refusals have no Gemini counterpart and are dropped.
    if (const auto* part = std::get_if<openai::TextContentPart>(&content); part && !part->text.empty()) {
      parts.push_back(gemini::Part::text(part->text));
    }
  }
  return parts;
}

GeminiContents messages_to_gemini_contents(const std::vector<openai::ChatMessage>& messages) {
  GeminiContents result;
  ToolCallRegistry registry;
  std::vector<gemini::Part> pending;

  auto flush_pending = [&] {
    if (!pending.empty()) {
      result.contents.push_back(gemini::Content{gemini::kRoleUser, std::move(pending)});
      pending.clear();
    }
  };
  auto append_pending = [&](std::vector<gemini::Part> parts) {
    for (auto& part : parts) {
      pending.push_back(std::move(part));
    }
  };

  for (const auto& message : messages) {
    std::visit(overloaded{
                   [&](const openai::DeveloperMessage& msg) {
                     try {
                       append_system_parts(result.system_instruction, developer_message_to_parts(msg));
                     } catch (const GatewayError&) {
                       rethrow_with_context("error converting developer message");
                     }
                   },
                   [&](const openai::SystemMessage& msg) {
                     try {
                       openai::DeveloperMessage as_developer{msg.content, msg.name};
                       append_system_parts(result.system_instruction, developer_message_to_parts(as_developer));
                     } catch (const GatewayError&) {
                       rethrow_with_context("error converting system message");
                     }
                   },
                   [&](const openai::UserMessage& msg) {
                     try {
                       append_pending(user_message_to_parts(msg));
                     } catch (const GatewayError&) {
                       rethrow_with_context("error converting user message");
                     }
                   },
                   [&](const openai::ToolMessage& msg) {
                     try {
                       pending.push_back(tool_message_to_part(msg, registry));
                     } catch (const GatewayError&) {
                       rethrow_with_context("error converting tool message");
                     }
                   },
                   [&](const openai::AssistantMessage& msg) {
                     flush_pending();
                     try {
                       auto parts = assistant_message_to_parts(msg, registry);
                       result.contents.push_back(gemini::Content{gemini::kRoleModel, std::move(parts)});
                     } catch (const GatewayError&) {
                       rethrow_with_context("error converting assistant message");
                     }
                   },
               },
               message);
  }

  flush_pending();
  return result;
}

bool supports_native_json_schema(const std::string& model) {
  return model.find("gemini") != std::string::npos && model.find("2.5") != std::string::npos;
}

std::vector<gemini::Tool> tools_to_gemini(const std::vector<openai::Tool>& tools, bool native_json_schema) {
  std::vector<gemini::FunctionDeclaration> declarations;

  for (const auto& tool : tools) {
    if (tool.type == "image_generation") {
      throw TranslationError("tool-type image generation not supported yet when translating OpenAI req to Gemini");
    }
    if (tool.type != "function") {
      throw TranslationError("unsupported tool type: " + tool.type);
    }
    if (!tool.function) {
      continue;
    }

    const auto& function = *tool.function;
    gemini::FunctionDeclaration declaration;
    declaration.name = function.name;
    declaration.description = function.description;

    if (!function.parameters.is_null() && !function.parameters.is_object()) {
      throw TranslationError("invalid JSON schema for parameters in tool " + function.name +
                             ": expected object, got " + function.parameters.type_name());
    }
    if (native_json_schema) {
      if (!function.parameters.is_null()) {
        declaration.parameters_json_schema = function.parameters;
      }
    } else if (!function.parameters.is_null() && !function.parameters.empty()) {
      try {
        declaration.parameters = json_schema_to_gemini(function.parameters);
      } catch (const GatewayError&) {
        rethrow_with_context("invalid JSON schema for parameters in tool " + function.name);
      }
    }
    declarations.push_back(std::move(declaration));
  }

  if (declarations.empty()) {
    return {};
  }
  return {gemini::Tool{std::move(declarations)}};
}

std::optional<gemini::ToolConfig> tool_choice_to_gemini(const std::optional<openai::ToolChoice>& tool_choice) {
  if (!tool_choice) {
    return std::nullopt;
  }

  gemini::ToolConfig config;
  if (const auto* mode = std::get_if<std::string>(&*tool_choice)) {
    if (*mode == "auto") {
      config.function_calling_config.mode = "AUTO";
    } else if (*mode == "none") {
      config.function_calling_config.mode = "NONE";
    } else if (*mode == "required") {
      config.function_calling_config.mode = "ANY";
    } else {
      throw TranslationError("unsupported tool choice: '" + *mode + "'");
    }
    return config;
  }

  const auto& named = std::get<openai::NamedToolChoice>(*tool_choice);
  config.function_calling_config.mode = "ANY";
  config.function_calling_config.allowed_function_names = {named.function_name};
  return config;
}

GenerationSettings generation_config_from_request(const openai::ChatCompletionRequest& request,
                                                  const std::string& model) {
  GenerationSettings settings;
  auto& config = settings.config;

  if (request.temperature) config.temperature = static_cast<float>(*request.temperature);
  if (request.top_p) config.top_p = static_cast<float>(*request.top_p);
  if (request.seed) config.seed = static_cast<std::int32_t>(*request.seed);
  if (request.top_logprobs) config.logprobs = static_cast<std::int32_t>(*request.top_logprobs);
  if (request.logprobs) config.response_logprobs = *request.logprobs;

  int format_count = 0;
  auto ensure_no_schema = [&config] {
    if (config.response_schema || config.response_json_schema) {
      throw TranslationError("duplicate json scheme specifications");
    }
  };

  if (request.response_format) {
    ++format_count;
    std::visit(overloaded{
                   [&](const openai::ResponseFormatText&) {
                     settings.mode = ResponseMode::Text;
                     config.response_mime_type = utils::kMimeTextPlain;
                   },
                   [&](const openai::ResponseFormatJSONObject&) {
                     settings.mode = ResponseMode::JSON;
                     config.response_mime_type = utils::kMimeApplicationJSON;
                   },
                   [&](const openai::ResponseFormatJSONSchema& format) {
                     config.response_mime_type = utils::kMimeApplicationJSON;
                     if (!format.schema.is_object()) {
                       throw TranslationError(std::string("invalid JSON schema: expected object, got ") +
                                              format.schema.type_name());
                     }
                     settings.mode = ResponseMode::JSON;
                     if (supports_native_json_schema(model)) {
                       config.response_json_schema = format.schema;
                     } else {
                       config.response_schema = json_schema_to_gemini(format.schema);
                     }
                   },
               },
               *request.response_format);
  }

  if (request.guided_choice) {
    ++format_count;
    ensure_no_schema();
    settings.mode = ResponseMode::Enum;
    config.response_mime_type = utils::kMimeTextEnum;
    config.response_schema = json{{"type", "STRING"}, {"enum", *request.guided_choice}};
  }
  if (request.guided_regex) {
    ++format_count;
    ensure_no_schema();
    settings.mode = ResponseMode::Regex;
    config.response_mime_type = utils::kMimeApplicationJSON;
    config.response_schema = json{{"type", "STRING"}, {"pattern", *request.guided_regex}};
  }
  if (request.guided_json) {
    ++format_count;
    ensure_no_schema();
    settings.mode = ResponseMode::JSON;
    config.response_mime_type = utils::kMimeApplicationJSON;
    config.response_json_schema = *request.guided_json;
  }

  if (format_count > 1) {
    throw TranslationError(
        "multiple format specifiers specified. only one of responseFormat, guidedChoice, guidedRegex, guidedJSON can be specified");
  }

  if (request.n) config.candidate_count = static_cast<std::int32_t>(*request.n);
  if (request.max_tokens) {
    config.max_output_tokens = static_cast<std::int32_t>(*request.max_tokens);
  } else if (request.max_completion_tokens) {
    config.max_output_tokens = static_cast<std::int32_t>(*request.max_completion_tokens);
  }
  if (request.presence_penalty) config.presence_penalty = static_cast<float>(*request.presence_penalty);
  if (request.frequency_penalty) config.frequency_penalty = static_cast<float>(*request.frequency_penalty);

  if (request.stop) {
    if (const auto* single = std::get_if<std::string>(&*request.stop)) {
      config.stop_sequences = {*single};
    } else {
      config.stop_sequences = std::get<std::vector<std::string>>(*request.stop);
    }
  }

  if (request.vendor.thinking_config) {
    config.thinking_config = *request.vendor.thinking_config;
  }
  return settings;
}

}  // namespace aigw
