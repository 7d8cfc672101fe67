#pragma once

#include "aigw/gemini_request.hpp"
#include "aigw/gemini_schema.hpp"
#include "aigw/openai_schema.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace aigw {

/**
 * STOP becomes "tool_calls" when the candidate produced calls and "stop"
 * otherwise, MAX_TOKENS becomes "length" and an empty reason (intermediate
 * stream chunks) stays empty. Every other reason is reported as
 * "content_filter".
 */
std::string finish_reason_to_openai(const std::string& reason, bool has_tool_calls);

std::string extract_text(const std::vector<gemini::Part>& parts, ResponseMode mode);

std::vector<openai::ToolCall> extract_tool_calls(const std::vector<gemini::Part>& parts);

std::vector<openai::ChunkToolCall> extract_chunk_tool_calls(const std::vector<gemini::Part>& parts,
                                                            std::int64_t& next_index);

openai::Usage usage_to_openai(const gemini::UsageMetadata& metadata);

openai::ChoiceLogprobs logprobs_to_openai(const gemini::LogprobsResult& result);

std::vector<openai::ChatCompletionChoice> candidates_to_choices(const std::vector<gemini::Candidate>& candidates,
                                                                ResponseMode mode);

std::vector<openai::ChatCompletionChunkChoice> candidates_to_chunk_choices(
    const std::vector<gemini::Candidate>& candidates, ResponseMode mode, std::int64_t& next_tool_call_index);

}  // namespace aigw
