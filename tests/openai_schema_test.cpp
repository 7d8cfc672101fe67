#include <gtest/gtest.h>

#include "aigw/error.hpp"
#include "aigw/openai_schema.hpp"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

namespace {

std::string schema_error_message(const json& payload) {
  try {
    aigw::openai::parse_chat_completion_request(payload);
  } catch (const aigw::SchemaError& ex) {
    return ex.what();
  }
  return {};
}

}  // namespace

TEST(OpenAISchemaTest, ParsesMessagesOfEveryRole) {
  using namespace aigw::openai;

  const json payload = json::parse(R"({
    "model": "gemini-2.0-flash",
    "messages": [
      {"role": "developer", "content": "be terse"},
      {"role": "system", "content": [{"type": "text", "text": "system rules"}]},
      {"role": "user", "content": [
        {"type": "text", "text": "what is this?"},
        {"type": "image_url", "image_url": {"url": "https://example.com/cat.png", "detail": "high"}}
      ]},
      {"role": "assistant", "content": null, "tool_calls": [
        {"id": "call_1", "type": "function", "function": {"name": "lookup", "arguments": "{\"q\":\"cat\"}"}}
      ]},
      {"role": "tool", "tool_call_id": "call_1", "content": "a cat"}
    ]
  })");

  auto request = parse_chat_completion_request(payload);
  EXPECT_EQ(request.model, "gemini-2.0-flash");
  ASSERT_EQ(request.messages.size(), 5u);

  ASSERT_TRUE(std::holds_alternative<DeveloperMessage>(request.messages[0]));
  EXPECT_EQ(std::get<std::string>(std::get<DeveloperMessage>(request.messages[0]).content), "be terse");

  const auto& system = std::get<SystemMessage>(request.messages[1]);
  ASSERT_EQ(std::get<std::vector<TextContentPart>>(system.content).size(), 1u);

  const auto& user = std::get<UserMessage>(request.messages[2]);
  const auto& user_parts = std::get<std::vector<UserContentPart>>(user.content);
  ASSERT_EQ(user_parts.size(), 2u);
  const auto& image = std::get<ImageContentPart>(user_parts[1]);
  EXPECT_EQ(image.image_url.url, "https://example.com/cat.png");
  EXPECT_EQ(image.image_url.detail.value_or(""), "high");

  const auto& assistant = std::get<AssistantMessage>(request.messages[3]);
  EXPECT_FALSE(assistant.content.has_value());
  ASSERT_EQ(assistant.tool_calls.size(), 1u);
  EXPECT_EQ(assistant.tool_calls[0].id, "call_1");
  EXPECT_EQ(assistant.tool_calls[0].function.arguments, R"({"q":"cat"})");

  const auto& tool = std::get<ToolMessage>(request.messages[4]);
  EXPECT_EQ(tool.tool_call_id, "call_1");
}

TEST(OpenAISchemaTest, ParsesSamplingAndFormatFields) {
  using namespace aigw::openai;

  const json payload = json::parse(R"({
    "model": "gemini-1.5-pro",
    "messages": [{"role": "user", "content": "hi"}],
    "stream": true,
    "temperature": 0.7,
    "top_p": 0.9,
    "seed": 42,
    "n": 2,
    "max_completion_tokens": 256,
    "logprobs": true,
    "top_logprobs": 3,
    "stop": "END",
    "tool_choice": {"type": "function", "function": {"name": "lookup"}},
    "response_format": {"type": "json_schema", "json_schema": {"name": "answer", "schema": {"type": "object"}}},
    "guided_regex": "",
    "generationConfig": {"thinkingConfig": {"thinkingBudget": 128}},
    "safetySettings": [{"category": "HARM_CATEGORY_HATE_SPEECH", "threshold": "BLOCK_NONE"}]
  })");

  auto request = parse_chat_completion_request(payload);
  EXPECT_TRUE(request.stream);
  EXPECT_DOUBLE_EQ(request.temperature.value_or(0), 0.7);
  EXPECT_EQ(request.seed.value_or(0), 42);
  EXPECT_EQ(request.n.value_or(0), 2);
  EXPECT_FALSE(request.max_tokens.has_value());
  EXPECT_EQ(request.max_completion_tokens.value_or(0), 256);
  EXPECT_EQ(request.top_logprobs.value_or(0), 3);
  ASSERT_TRUE(request.stop.has_value());
  EXPECT_EQ(std::get<std::string>(*request.stop), "END");

  ASSERT_TRUE(request.tool_choice.has_value());
  EXPECT_EQ(std::get<NamedToolChoice>(*request.tool_choice).function_name, "lookup");

  ASSERT_TRUE(request.response_format.has_value());
  const auto& format = std::get<ResponseFormatJSONSchema>(*request.response_format);
  EXPECT_EQ(format.name, "answer");
  EXPECT_EQ(format.schema, json({{"type", "object"}}));

  EXPECT_FALSE(request.guided_regex.has_value());
  ASSERT_TRUE(request.vendor.thinking_config.has_value());
  EXPECT_EQ(request.vendor.thinking_config->at("thinkingBudget"), 128);
  ASSERT_TRUE(request.vendor.safety_settings.has_value());
  EXPECT_EQ(request.vendor.safety_settings->size(), 1u);
}

TEST(OpenAISchemaTest, RejectsUnknownShapes) {
  EXPECT_EQ(schema_error_message(json::parse(R"({"model":"m","messages":[{"role":"narrator","content":"x"}]})")),
            "invalid role in message: 'narrator'");
  EXPECT_EQ(schema_error_message(json::parse(R"({"model":"m","messages":[{"role":"user","content":42}]})")),
            "unsupported content type in user message: number");
  EXPECT_EQ(schema_error_message(json::parse(R"({"model":"m","messages":[{"role":"user","content":[{"type":"video"}]}]})")),
            "unsupported content type in user message: video");
  EXPECT_EQ(schema_error_message(json::parse(R"({"model":"m","messages":[{"role":"system","content":{"text":"x"}}]})")),
            "unsupported content type in system message: object");
  EXPECT_EQ(schema_error_message(json::parse(R"({"model":"m","messages":[],"tool_choice":7})")),
            "unsupported tool choice type: number");
  EXPECT_EQ(schema_error_message(json::parse(R"({"model":"m","messages":[],"temperature":"hot"})")),
            "invalid type for field 'temperature': expected number, got string");
  EXPECT_EQ(schema_error_message(json::parse(R"({"model":"m"})")), "messages must be an array");
}

TEST(OpenAISchemaTest, SerializesResponseWithNullContentAndUsageDetails) {
  using namespace aigw::openai;

  ChatCompletionResponse response;
  response.model = "gemini-2.5-flash-001";
  ChatCompletionChoice choice;
  choice.finish_reason = "tool_calls";
  ToolCall call;
  call.id = "call_x";
  call.function = {"lookup", R"({"q":"cat"})"};
  choice.message.tool_calls.push_back(call);
  response.choices.push_back(choice);
  response.usage = Usage{10, 7, 17, 4, 2};

  auto body = response_to_json(response);
  EXPECT_EQ(body.at("object"), "chat.completion");
  EXPECT_FALSE(body.contains("id"));
  const auto& message = body.at("choices").at(0).at("message");
  EXPECT_TRUE(message.at("content").is_null());
  EXPECT_EQ(message.at("tool_calls").at(0).at("function").at("name"), "lookup");
  EXPECT_EQ(body.at("usage").at("prompt_tokens_details").at("cached_tokens"), 4);
  EXPECT_EQ(body.at("usage").at("completion_tokens_details").at("reasoning_tokens"), 2);
}

TEST(OpenAISchemaTest, EmptyResponseCarriesOnlyObject) {
  auto body = aigw::openai::response_to_json(aigw::openai::ChatCompletionResponse{});
  EXPECT_EQ(body, json::parse(R"({"object":"chat.completion"})"));
}

TEST(OpenAISchemaTest, SerializesChunkAndError) {
  using namespace aigw::openai;

  ChatCompletionResponseChunk chunk;
  ChatCompletionChunkChoice choice;
  choice.delta.content = "Hel";
  chunk.choices.push_back(choice);

  auto body = chunk_to_json(chunk);
  EXPECT_EQ(body.at("object"), "chat.completion.chunk");
  EXPECT_EQ(body.at("choices").at(0).at("delta").at("content"), "Hel");
  EXPECT_EQ(body.at("choices").at(0).at("delta").at("role"), "assistant");
  EXPECT_FALSE(body.at("choices").at(0).contains("finish_reason"));
  EXPECT_FALSE(body.contains("usage"));

  auto error = error_to_json(ErrorBody{"INVALID_ARGUMENT", "Error: bad", "400"});
  EXPECT_EQ(error, json::parse(R"({"type":"error","error":{"type":"INVALID_ARGUMENT","message":"Error: bad","code":"400"}})"));
}
