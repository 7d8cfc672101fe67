#include <gtest/gtest.h>

#include "aigw/error.hpp"
#include "aigw/gemini_request.hpp"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;
using aigw::ResponseMode;

namespace {

aigw::openai::ChatCompletionRequest request_with(json fields) {
  fields["model"] = "gemini-2.0-flash";
  fields["messages"] = json::parse(R"([{"role": "user", "content": "hi"}])");
  return aigw::openai::parse_chat_completion_request(fields);
}

std::string settings_error(const json& fields, const std::string& model = "gemini-2.0-flash") {
  try {
    aigw::generation_config_from_request(request_with(fields), model);
  } catch (const aigw::TranslationError& ex) {
    return ex.what();
  }
  return {};
}

}  // namespace

TEST(GenerationConfigTest, MapsSamplingParameters) {
  auto settings = aigw::generation_config_from_request(request_with(json::parse(R"({
    "temperature": 0.7,
    "top_p": 0.95,
    "seed": 7,
    "n": 2,
    "max_tokens": 512,
    "max_completion_tokens": 64,
    "presence_penalty": 0.5,
    "frequency_penalty": -0.25,
    "logprobs": true,
    "top_logprobs": 3,
    "stop": ["END", "STOP"],
    "generationConfig": {"thinkingConfig": {"includeThoughts": true}}
  })")),
                                                       "gemini-2.0-flash");

  EXPECT_EQ(settings.mode, ResponseMode::None);
  const json config = aigw::gemini::generation_config_to_json(settings.config);
  EXPECT_EQ(config, json::parse(R"({
    "temperature": 0.7,
    "topP": 0.95,
    "seed": 7,
    "candidateCount": 2,
    "maxOutputTokens": 512,
    "presencePenalty": 0.5,
    "frequencyPenalty": -0.25,
    "responseLogprobs": true,
    "logprobs": 3,
    "stopSequences": ["END", "STOP"],
    "thinkingConfig": {"includeThoughts": true}
  })"));
}

TEST(GenerationConfigTest, FallsBackToMaxCompletionTokensAndSingleStop) {
  auto settings = aigw::generation_config_from_request(
      request_with({{"max_completion_tokens", 64}, {"stop", "###"}}), "gemini-2.0-flash");
  EXPECT_EQ(settings.config.max_output_tokens, 64);
  ASSERT_EQ(settings.config.stop_sequences.size(), 1u);
  EXPECT_EQ(settings.config.stop_sequences[0], "###");
  EXPECT_TRUE(aigw::gemini::generation_config_to_json(
                  aigw::generation_config_from_request(request_with(json::object()), "m").config)
                  .empty());
}

TEST(GenerationConfigTest, SelectsResponseModes) {
  auto text = aigw::generation_config_from_request(request_with({{"response_format", {{"type", "text"}}}}), "m");
  EXPECT_EQ(text.mode, ResponseMode::Text);
  EXPECT_EQ(text.config.response_mime_type, "text/plain");

  auto object = aigw::generation_config_from_request(request_with({{"response_format", {{"type", "json_object"}}}}), "m");
  EXPECT_EQ(object.mode, ResponseMode::JSON);
  EXPECT_EQ(object.config.response_mime_type, "application/json");

  auto choice = aigw::generation_config_from_request(request_with({{"guided_choice", {"positive", "negative"}}}), "m");
  EXPECT_EQ(choice.mode, ResponseMode::Enum);
  EXPECT_EQ(choice.config.response_mime_type, "text/x.enum");
  EXPECT_EQ(choice.config.response_schema.value_or(json()),
            json::parse(R"({"type": "STRING", "enum": ["positive", "negative"]})"));

  auto regex = aigw::generation_config_from_request(request_with({{"guided_regex", "[a-z]+"}}), "m");
  EXPECT_EQ(regex.mode, ResponseMode::Regex);
  EXPECT_EQ(regex.config.response_mime_type, "application/json");
  EXPECT_EQ(regex.config.response_schema.value_or(json()), json::parse(R"({"type": "STRING", "pattern": "[a-z]+"})"));

  const json schema = json::parse(R"({"type": "object", "properties": {"ok": {"type": "boolean"}}})");
  auto guided = aigw::generation_config_from_request(request_with({{"guided_json", schema}}), "m");
  EXPECT_EQ(guided.mode, ResponseMode::JSON);
  EXPECT_EQ(guided.config.response_json_schema.value_or(json()), schema);
  EXPECT_FALSE(guided.config.response_schema.has_value());
}

TEST(GenerationConfigTest, JSONSchemaFormatDependsOnModel) {
  const json schema = json::parse(R"({
    "type": "object",
    "properties": {"ok": {"type": "boolean"}},
    "additionalProperties": false
  })");
  const json format = {{"type", "json_schema"}, {"json_schema", {{"name", "result"}, {"schema", schema}}}};

  auto legacy = aigw::generation_config_from_request(request_with({{"response_format", format}}), "gemini-2.0-flash");
  EXPECT_EQ(legacy.mode, ResponseMode::JSON);
  EXPECT_FALSE(legacy.config.response_json_schema.has_value());
  EXPECT_EQ(legacy.config.response_schema.value_or(json()),
            json::parse(R"({"type": "object", "properties": {"ok": {"type": "boolean"}}})"));

  auto native = aigw::generation_config_from_request(request_with({{"response_format", format}}), "gemini-2.5-flash");
  EXPECT_FALSE(native.config.response_schema.has_value());
  EXPECT_EQ(native.config.response_json_schema.value_or(json()), schema);
}

TEST(GenerationConfigTest, RejectsConflictingFormatSpecifiers) {
  EXPECT_EQ(settings_error({{"guided_choice", {"a", "b"}}, {"guided_json", {{"type", "object"}}}}),
            "duplicate json scheme specifications");
  EXPECT_EQ(settings_error({{"response_format", {{"type", "text"}}}, {"guided_choice", json::array({"a"})}}),
            "multiple format specifiers specified. only one of responseFormat, guidedChoice, guidedRegex, guidedJSON can "
            "be specified");
  EXPECT_EQ(settings_error({{"response_format", {{"type", "json_schema"}, {"json_schema", {{"name", "x"}, {"schema", "nope"}}}}}}),
            "invalid JSON schema: expected object, got string");
}
