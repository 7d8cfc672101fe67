#include <gtest/gtest.h>

#include "aigw/gemini_response.hpp"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;
using aigw::ResponseMode;

namespace {

aigw::gemini::GenerateContentResponse parse(const char* body) {
  return aigw::gemini::parse_generate_content_response(json::parse(body));
}

}  // namespace

TEST(GeminiResponseTest, MapsFinishReasons) {
  EXPECT_EQ(aigw::finish_reason_to_openai("STOP", false), "stop");
  EXPECT_EQ(aigw::finish_reason_to_openai("STOP", true), "tool_calls");
  EXPECT_EQ(aigw::finish_reason_to_openai("MAX_TOKENS", false), "length");
  EXPECT_EQ(aigw::finish_reason_to_openai("SAFETY", false), "content_filter");
  EXPECT_EQ(aigw::finish_reason_to_openai("RECITATION", true), "content_filter");
  EXPECT_EQ(aigw::finish_reason_to_openai("", false), "");
}

TEST(GeminiResponseTest, ExtractsTextPerResponseMode) {
  std::vector<aigw::gemini::Part> parts = {aigw::gemini::Part::text("\"positive\""), aigw::gemini::Part::text("")};
  EXPECT_EQ(aigw::extract_text(parts, ResponseMode::Regex), "positive");
  EXPECT_EQ(aigw::extract_text(parts, ResponseMode::None), "\"positive\"");

  parts = {aigw::gemini::Part::text("Hello, "), aigw::gemini::Part::function_call("f", json::object()),
           aigw::gemini::Part::text("world")};
  EXPECT_EQ(aigw::extract_text(parts, ResponseMode::JSON), "Hello, world");
}

TEST(GeminiResponseTest, ConvertsCandidatesToChoices) {
  auto response = parse(R"({
    "candidates": [
      {
        "content": {"role": "model", "parts": [{"text": "Paris is sunny."}]},
        "finishReason": "STOP",
        "safetyRatings": [{"category": "HARM_CATEGORY_HARASSMENT", "probability": "NEGLIGIBLE"}]
      },
      {
        "index": 4,
        "content": {"role": "model", "parts": [{"functionCall": {"name": "get_weather", "args": {"city": "Paris"}}}]},
        "finishReason": "STOP"
      },
      {"finishReason": "SAFETY"}
    ]
  })");

  auto choices = aigw::candidates_to_choices(response.candidates, ResponseMode::None);
  ASSERT_EQ(choices.size(), 3u);

  EXPECT_EQ(choices[0].index, 0);
  EXPECT_EQ(choices[0].message.role, "assistant");
  EXPECT_EQ(choices[0].message.content.value_or(""), "Paris is sunny.");
  EXPECT_EQ(choices[0].finish_reason, "stop");
  ASSERT_TRUE(choices[0].message.safety_ratings.has_value());
  EXPECT_EQ(choices[0].message.safety_ratings->at(0).at("probability"), "NEGLIGIBLE");

  EXPECT_EQ(choices[1].index, 4);
  EXPECT_FALSE(choices[1].message.content.has_value());
  ASSERT_EQ(choices[1].message.tool_calls.size(), 1u);
  const auto& call = choices[1].message.tool_calls[0];
  EXPECT_EQ(call.type, "function");
  EXPECT_EQ(call.id.size(), 36u);
  EXPECT_EQ(call.function.name, "get_weather");
  EXPECT_EQ(json::parse(call.function.arguments), json({{"city", "Paris"}}));
  EXPECT_EQ(choices[1].finish_reason, "tool_calls");

  EXPECT_FALSE(choices[2].message.content.has_value());
  EXPECT_EQ(choices[2].finish_reason, "content_filter");
}

TEST(GeminiResponseTest, UsageCountsThoughtsAsCompletionTokens) {
  auto response = parse(R"({
    "usageMetadata": {"promptTokenCount": 10, "candidatesTokenCount": 5, "totalTokenCount": 17,
                      "thoughtsTokenCount": 2, "cachedContentTokenCount": 3}
  })");
  ASSERT_TRUE(response.usage_metadata.has_value());

  auto usage = aigw::usage_to_openai(*response.usage_metadata);
  EXPECT_EQ(usage.prompt_tokens, 10);
  EXPECT_EQ(usage.completion_tokens, 7);
  EXPECT_EQ(usage.total_tokens, 17);
  EXPECT_EQ(usage.reasoning_tokens.value_or(-1), 2);
  EXPECT_EQ(usage.cached_tokens.value_or(-1), 3);

  auto plain = aigw::usage_to_openai(aigw::gemini::UsageMetadata{4, 6, 10, std::nullopt, std::nullopt});
  EXPECT_EQ(plain.completion_tokens, 6);
  EXPECT_FALSE(plain.reasoning_tokens.has_value());
  EXPECT_FALSE(aigw::openai::usage_to_json(plain).contains("completion_tokens_details"));
}

TEST(GeminiResponseTest, ConvertsLogprobs) {
  auto response = parse(R"({
    "candidates": [{
      "content": {"parts": [{"text": "Hi"}]},
      "finishReason": "STOP",
      "logprobsResult": {
        "chosenCandidates": [{"token": "Hi", "logProbability": -0.5}],
        "topCandidates": [{"candidates": [{"token": "Hi", "logProbability": -0.5}, {"token": "Hey", "logProbability": -1.25}]}]
      }
    }]
  })");

  auto choices = aigw::candidates_to_choices(response.candidates, ResponseMode::None);
  ASSERT_EQ(choices.size(), 1u);
  ASSERT_TRUE(choices[0].logprobs.has_value());
  ASSERT_EQ(choices[0].logprobs->content.size(), 1u);
  const auto& token = choices[0].logprobs->content[0];
  EXPECT_EQ(token.token, "Hi");
  EXPECT_DOUBLE_EQ(token.logprob, -0.5);
  ASSERT_EQ(token.top_logprobs.size(), 2u);
  EXPECT_EQ(token.top_logprobs[1].token, "Hey");
  EXPECT_DOUBLE_EQ(token.top_logprobs[1].logprob, -1.25);
}

TEST(GeminiResponseTest, ChunkToolCallIndexesContinueAcrossChunks) {
  auto first = parse(R"({"candidates": [{"content": {"parts": [
    {"functionCall": {"name": "a", "args": {}}},
    {"functionCall": {"name": "b", "args": {"x": 1}}}
  ]}}]})");
  auto second = parse(R"({"candidates": [{"content": {"parts": [{"functionCall": {"name": "c"}}]}, "finishReason": "STOP"}]})");

  std::int64_t next_index = 0;
  auto chunk_one = aigw::candidates_to_chunk_choices(first.candidates, ResponseMode::None, next_index);
  auto chunk_two = aigw::candidates_to_chunk_choices(second.candidates, ResponseMode::None, next_index);

  ASSERT_EQ(chunk_one[0].delta.tool_calls.size(), 2u);
  EXPECT_EQ(chunk_one[0].delta.tool_calls[0].index, 0);
  EXPECT_EQ(chunk_one[0].delta.tool_calls[1].index, 1);
  EXPECT_EQ(chunk_one[0].delta.tool_calls[1].function.arguments, R"({"x":1})");
  EXPECT_TRUE(chunk_one[0].finish_reason.empty());
  EXPECT_FALSE(chunk_one[0].delta.content.has_value());

  ASSERT_EQ(chunk_two[0].delta.tool_calls.size(), 1u);
  EXPECT_EQ(chunk_two[0].delta.tool_calls[0].index, 2);
  EXPECT_EQ(chunk_two[0].delta.tool_calls[0].function.arguments, "{}");
  EXPECT_EQ(chunk_two[0].finish_reason, "tool_calls");
  EXPECT_EQ(next_index, 3);
}

TEST(GeminiResponseTest, ParsesInlineDataAndThoughtParts) {
  auto response = parse(R"({
    "modelVersion": "gemini-2.5-flash-001",
    "responseId": "resp-1",
    "candidates": [{"content": {"role": "model", "parts": [
      {"text": "thinking...", "thought": true},
      {"inlineData": {"mimeType": "image/png", "data": "aGk="}}
    ]}}]
  })");

  EXPECT_EQ(response.model_version, "gemini-2.5-flash-001");
  EXPECT_EQ(response.response_id, "resp-1");
  const auto& parts = response.candidates.at(0).content->parts;
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_TRUE(parts[0].thought);
  const auto& blob = std::get<aigw::gemini::Blob>(parts[1].value);
  EXPECT_EQ(blob.mime_type, "image/png");
  EXPECT_EQ(aigw::gemini::part_to_json(parts[1]).at("inlineData").at("data"), "aGk=");
}
