#include "aigw/gemini_response.hpp"

#include "aigw/utils/uuid.hpp"

#include <string_view>

namespace aigw {
namespace {

std::string_view unquote(std::string_view text) {
  if (!text.empty() && text.front() == '"') {
    text.remove_prefix(1);
  }
  if (!text.empty() && text.back() == '"') {
    text.remove_suffix(1);
  }
  return text;
}

openai::ToolCallFunction to_function(const gemini::FunctionCall& call) {
  return openai::ToolCallFunction{call.name, call.args.is_null() ? std::string("null") : call.args.dump()};
}

std::int64_t choice_index(const gemini::Candidate& candidate, std::size_t position) {
  return candidate.index ? *candidate.index : static_cast<std::int64_t>(position);
}

}  // namespace

std::string finish_reason_to_openai(const std::string& reason, bool has_tool_calls) {
  if (reason == gemini::kFinishReasonStop) {
    return has_tool_calls ? "tool_calls" : "stop";
  }
  if (reason == gemini::kFinishReasonMaxTokens) {
    return "length";
  }
  if (reason.empty()) {
    return "";
  }
  return "content_filter";
}

std::string extract_text(const std::vector<gemini::Part>& parts, ResponseMode mode) {
  std::string text;
  for (const auto& part : parts) {
    const auto* value = part.text_value();
    if (value == nullptr || value->empty()) {
      continue;
    }
    if (mode == ResponseMode::Regex) {
      text += unquote(*value);
    } else {
      text += *value;
    }
  }
  return text;
}

std::vector<openai::ToolCall> extract_tool_calls(const std::vector<gemini::Part>& parts) {
  std::vector<openai::ToolCall> calls;
  for (const auto& part : parts) {
    const auto* call = part.function_call_value();
    if (call == nullptr) {
      continue;
    }
    openai::ToolCall converted;
    converted.id = utils::uuid4();
    converted.function = to_function(*call);
    calls.push_back(std::move(converted));
  }
  return calls;
}

std::vector<openai::ChunkToolCall> extract_chunk_tool_calls(const std::vector<gemini::Part>& parts,
                                                            std::int64_t& next_index) {
  std::vector<openai::ChunkToolCall> calls;
  for (const auto& part : parts) {
    const auto* call = part.function_call_value();
    if (call == nullptr) {
      continue;
    }
    openai::ChunkToolCall converted;
    converted.index = next_index++;
    converted.id = utils::uuid4();
    converted.function = to_function(*call);
    calls.push_back(std::move(converted));
  }
  return calls;
}

openai::Usage usage_to_openai(const gemini::UsageMetadata& metadata) {
  const std::int64_t thoughts = metadata.thoughts_token_count.value_or(0);
  openai::Usage usage;
  usage.prompt_tokens = metadata.prompt_token_count;
  usage.completion_tokens = static_cast<std::int64_t>(metadata.candidates_token_count) + thoughts;
  usage.total_tokens = metadata.total_token_count;
  if (metadata.cached_content_token_count) {
    usage.cached_tokens = *metadata.cached_content_token_count;
  }
  if (metadata.thoughts_token_count) {
    usage.reasoning_tokens = *metadata.thoughts_token_count;
  }
  return usage;
}

openai::ChoiceLogprobs logprobs_to_openai(const gemini::LogprobsResult& result) {
  openai::ChoiceLogprobs logprobs;
  logprobs.content.reserve(result.chosen_candidates.size());
  for (std::size_t i = 0; i < result.chosen_candidates.size(); ++i) {
    const auto& chosen = result.chosen_candidates[i];
    openai::TokenLogprob token;
    token.token = chosen.token;
    token.logprob = static_cast<double>(chosen.log_probability);
    if (i < result.top_candidates.size()) {
      for (const auto& candidate : result.top_candidates[i]) {
        token.top_logprobs.push_back({candidate.token, static_cast<double>(candidate.log_probability)});
      }
    }
    logprobs.content.push_back(std::move(token));
  }
  return logprobs;
}

std::vector<openai::ChatCompletionChoice> candidates_to_choices(const std::vector<gemini::Candidate>& candidates,
                                                                ResponseMode mode) {
  std::vector<openai::ChatCompletionChoice> choices;
  choices.reserve(candidates.size());

  for (std::size_t i = 0; i < candidates.size(); ++i) {
    const auto& candidate = candidates[i];
    openai::ChatCompletionChoice choice;
    choice.index = choice_index(candidate, i);

    if (candidate.content) {
      std::string text = extract_text(candidate.content->parts, mode);
      choice.message.tool_calls = extract_tool_calls(candidate.content->parts);
      // "No text" is reported as null so clients can tell it apart from an empty completion.
      if (!text.empty() || choice.message.tool_calls.empty()) {
        choice.message.content = std::move(text);
      }
    }
    if (candidate.safety_ratings) {
      choice.message.safety_ratings = *candidate.safety_ratings;
    }
    if (candidate.logprobs_result) {
      choice.logprobs = logprobs_to_openai(*candidate.logprobs_result);
    }
    choice.finish_reason = finish_reason_to_openai(candidate.finish_reason, !choice.message.tool_calls.empty());
    choices.push_back(std::move(choice));
  }
  return choices;
}

std::vector<openai::ChatCompletionChunkChoice> candidates_to_chunk_choices(
    const std::vector<gemini::Candidate>& candidates, ResponseMode mode, std::int64_t& next_tool_call_index) {
  std::vector<openai::ChatCompletionChunkChoice> choices;
  choices.reserve(candidates.size());

  for (std::size_t i = 0; i < candidates.size(); ++i) {
    const auto& candidate = candidates[i];
    openai::ChatCompletionChunkChoice choice;
    choice.index = choice_index(candidate, i);

    if (candidate.content) {
      std::string text = extract_text(candidate.content->parts, mode);
      if (!text.empty()) {
        choice.delta.content = std::move(text);
      }
      choice.delta.tool_calls = extract_chunk_tool_calls(candidate.content->parts, next_tool_call_index);
    }
    if (candidate.logprobs_result) {
      choice.logprobs = logprobs_to_openai(*candidate.logprobs_result);
    }
    choice.finish_reason = finish_reason_to_openai(candidate.finish_reason, !choice.delta.tool_calls.empty());
    choices.push_back(std::move(choice));
  }
  return choices;
}

}  // namespace aigw
