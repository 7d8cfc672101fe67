#pragma once

#include "aigw/gemini_schema.hpp"
#include "aigw/openai_schema.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aigw {

enum class ResponseMode { None, Text, JSON, Enum, Regex };

/// tool_call_id -> function name, filled from assistant turns and read by later tool turns of the same request.
using ToolCallRegistry = std::map<std::string, std::string>;

struct GeminiContents {
  std::vector<gemini::Content> contents;
  std::optional<gemini::Content> system_instruction;
};

/**
 * Folds the OpenAI conversation into Gemini's two-role content list.
 * Developer and system messages become the system instruction. User and tool
 * messages accumulate into one "user" block that is flushed when an
 * assistant message arrives and once more at the end. Assistant messages
 * become "model" blocks. Errors from a single message are rethrown with the
 * role as context ("error converting user message: ...").
 */
GeminiContents messages_to_gemini_contents(const std::vector<openai::ChatMessage>& messages);

std::vector<gemini::Part> developer_message_to_parts(const openai::DeveloperMessage& message);
std::vector<gemini::Part> user_message_to_parts(const openai::UserMessage& message);
gemini::Part tool_message_to_part(const openai::ToolMessage& message, const ToolCallRegistry& registry);

std::vector<gemini::Part> assistant_message_to_parts(const openai::AssistantMessage& message,
                                                     ToolCallRegistry& registry);

bool supports_native_json_schema(const std::string& model);

std::vector<gemini::Tool> tools_to_gemini(const std::vector<openai::Tool>& tools, bool native_json_schema);

std::optional<gemini::ToolConfig> tool_choice_to_gemini(const std::optional<openai::ToolChoice>& tool_choice);

struct GenerationSettings {
  gemini::GenerationConfig config;
  ResponseMode mode = ResponseMode::None;
};

GenerationSettings generation_config_from_request(const openai::ChatCompletionRequest& request,
                                                  const std::string& model);

}  // namespace aigw
