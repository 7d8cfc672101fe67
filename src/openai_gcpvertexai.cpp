#include "aigw/openai_gcpvertexai.hpp"

#include "aigw/error.hpp"
#include "aigw/gemini_response.hpp"
#include "aigw/gemini_schema.hpp"
#include "aigw/mutations.hpp"

#include <iterator>
#include <utility>

namespace aigw {
namespace {

using json = nlohmann::json;

constexpr const char* kPublisherGoogle = "google";
constexpr const char* kMethodGenerateContent = "generateContent";
constexpr const char* kMethodStreamGenerateContent = "streamGenerateContent";
constexpr const char* kQueryAltSSE = "alt=sse";

std::string read_body(std::istream& body) {
  std::string data((std::istreambuf_iterator<char>(body)), std::istreambuf_iterator<char>());
  if (body.bad()) {
    throw UpstreamError("failed to read response body");
  }
  return data;
}

std::uint32_t token_count(std::int64_t value) {
  return value < 0 ? 0U : static_cast<std::uint32_t>(value);
}

LLMTokenUsage to_token_usage(const gemini::UsageMetadata& metadata) {
  LLMTokenUsage usage;
  usage.input_tokens = token_count(metadata.prompt_token_count);
  usage.output_tokens = token_count(metadata.candidates_token_count);
  usage.total_tokens = token_count(metadata.total_token_count);
  usage.cached_input_tokens = token_count(metadata.cached_content_token_count.value_or(0));
  return usage;
}

bool is_openai_error(const json& payload) {
  if (!payload.is_object() || !payload.contains("error") || !payload.at("error").is_object()) {
    return false;
  }
  const auto& error = payload.at("error");
  return error.contains("type") && error.at("type").is_string() && !error.contains("status");
}

}  // namespace

OpenAIToGCPVertexAITranslator::OpenAIToGCPVertexAITranslator(std::string model_name_override, Logger logger)
    : model_name_override_(std::move(model_name_override)), logger_(std::move(logger)) {}

RequestMutation OpenAIToGCPVertexAITranslator::request_body(const std::string& /*raw_body*/,
                                                            const openai::ChatCompletionRequest& request,
                                                            bool /*force_body_mutation*/) {
  request_model_ = model_name_override_.empty() ? request.model : model_name_override_;
  response_model_ = request_model_;
  stream_ = request.stream;
  response_mode_ = ResponseMode::None;
  reassembler_.reset();
  next_tool_call_index_ = 0;

  gemini::GenerateContentRequest gemini_request;
  try {
    auto contents = messages_to_gemini_contents(request.messages);
    gemini_request.contents = std::move(contents.contents);
    gemini_request.system_instruction = std::move(contents.system_instruction);
    gemini_request.tools = tools_to_gemini(request.tools, supports_native_json_schema(request_model_));
    gemini_request.tool_config = tool_choice_to_gemini(request.tool_choice);
    auto settings = generation_config_from_request(request, request_model_);
    gemini_request.generation_config = std::move(settings.config);
    response_mode_ = settings.mode;
  } catch (const GatewayError&) {
    rethrow_with_context("error converting OpenAI request to Gemini request");
  }
  gemini_request.safety_settings = request.vendor.safety_settings;

  const std::string path =
      stream_ ? build_gcp_model_path(kPublisherGoogle, request_model_, kMethodStreamGenerateContent, {kQueryAltSSE})
              : build_gcp_model_path(kPublisherGoogle, request_model_, kMethodGenerateContent);

  std::string body = gemini::request_to_json(gemini_request).dump();
  logger_.log(LogLevel::Debug, "translated chat completion request",
              {{"model", request_model_}, {"stream", stream_}, {"path", path}, {"body_size", body.size()}});
  return build_request_mutations(path, std::move(body));
}

HeaderMutation OpenAIToGCPVertexAITranslator::response_headers(const Headers& /*headers*/) {
  if (!stream_) {
    return {};
  }
  return {{kHeaderContentType, "text/event-stream"}};
}

ResponseMutation OpenAIToGCPVertexAITranslator::response_body(const Headers& /*headers*/,
                                                              std::istream& body,
                                                              bool end_of_stream) {
  std::string data = read_body(body);
  if (stream_) {
    return convert_stream_chunk(data, end_of_stream);
  }
  return convert_response(data);
}

ResponseMutation OpenAIToGCPVertexAITranslator::convert_response(const std::string& data) {
  gemini::GenerateContentResponse response;
  try {
    response = gemini::parse_generate_content_response(json::parse(data));
  } catch (const json::exception& ex) {
    throw TranslationError(std::string("failed to unmarshal body: ") + ex.what());
  } catch (const TranslationError&) {
    rethrow_with_context("failed to unmarshal body");
  }

  openai::ChatCompletionResponse converted;
  converted.choices = candidates_to_choices(response.candidates, response_mode_);
  if (!response.response_id.empty()) converted.id = response.response_id;
  if (!response.model_version.empty()) {
    converted.model = response.model_version;
    response_model_ = response.model_version;
  }

  ResponseMutation mutation;
  if (response.usage_metadata) {
    converted.usage = usage_to_openai(*response.usage_metadata);
    mutation.usage = to_token_usage(*response.usage_metadata);
  }

  std::string body = openai::response_to_json(converted).dump();
  mutation.headers.push_back({kHeaderContentLength, std::to_string(body.size())});
  mutation.body = std::move(body);
  mutation.response_model = response_model_;
  return mutation;
}

ResponseMutation OpenAIToGCPVertexAITranslator::convert_stream_chunk(const std::string& data, bool end_of_stream) {
  ResponseMutation mutation;
  std::string out;
  const std::size_t dropped_before = reassembler_.dropped_frames();
  const bool debug = logger_.enabled(LogLevel::Debug);

  for (const auto& frame : reassembler_.feed(data)) {
    gemini::GenerateContentResponse response;
    try {
      response = gemini::parse_generate_content_response(frame);
    } catch (const json::exception& ex) {
      if (debug) {
        logger_.log(LogLevel::Debug, "dropping malformed stream frame", {{"error", ex.what()}});
      }
      continue;
    } catch (const TranslationError& ex) {
      if (debug) {
        logger_.log(LogLevel::Debug, "dropping malformed stream frame", {{"error", ex.what()}});
      }
      continue;
    }

    openai::ChatCompletionResponseChunk chunk;
    chunk.choices = candidates_to_chunk_choices(response.candidates, response_mode_, next_tool_call_index_);
    if (!response.model_version.empty()) {
      chunk.model = response.model_version;
      response_model_ = response.model_version;
    }
    if (response.usage_metadata) {
      chunk.usage = usage_to_openai(*response.usage_metadata);
      mutation.usage = to_token_usage(*response.usage_metadata);
    }
    out += sse_data_event(openai::chunk_to_json(chunk));
  }

  if (debug) {
    if (reassembler_.dropped_frames() != dropped_before) {
      logger_.log(LogLevel::Debug, "dropped unparsable stream frames",
                  {{"count", reassembler_.dropped_frames() - dropped_before}});
    }
    if (!reassembler_.pending().empty()) {
      logger_.log(LogLevel::Debug, "buffering incomplete stream frame", {{"bytes", reassembler_.pending().size()}});
    }
  }

  if (end_of_stream) {
    out += kSSEDone;
  }
  mutation.body = std::move(out);
  mutation.response_model = response_model_;
  return mutation;
}

ResponseMutation OpenAIToGCPVertexAITranslator::response_error(const Headers& headers, std::istream& body) {
  std::string status;
  if (auto it = headers.find(kHeaderStatus); it != headers.end()) {
    status = it->second;
  }
  std::string data = read_body(body);

  ResponseMutation mutation;
  mutation.response_model = response_model_;

  openai::ErrorBody error;
  error.code = status;
  auto parsed = json::parse(data, nullptr, false);
  if (!parsed.is_discarded() && is_openai_error(parsed)) {
    logger_.log(LogLevel::Warn, "upstream error", {{"status", status}});
    return mutation;
  }
  std::optional<gemini::APIError> api_error;
  if (!parsed.is_discarded()) {
    api_error = gemini::parse_api_error(parsed);
  }
  if (api_error) {
    error.type = api_error->status.empty() ? std::string(kGCPBackendErrorType) : api_error->status;
    error.message = "Error: " + api_error->message;
    if (api_error->details) {
      // Details are re-serialized in compact form.
      error.message += "\nDetails: " + api_error->details->dump();
    }
  } else {
    error.type = kGCPBackendErrorType;
    error.message = data;
  }
  logger_.log(LogLevel::Warn, "upstream error", {{"status", status}, {"type", error.type}});

  // Raw bodies from proxies are not always valid UTF-8.
  std::string out = openai::error_to_json(error).dump(-1, ' ', false, json::error_handler_t::replace);
  mutation.headers.push_back({kHeaderContentType, "application/json"});
  mutation.headers.push_back({kHeaderContentLength, std::to_string(out.size())});
  mutation.body = std::move(out);
  return mutation;
}

std::unique_ptr<ChatCompletionTranslator> make_openai_to_gcp_vertexai_translator(std::string model_name_override,
                                                                                 Logger logger) {
  return std::make_unique<OpenAIToGCPVertexAITranslator>(std::move(model_name_override), std::move(logger));
}

}  // namespace aigw
