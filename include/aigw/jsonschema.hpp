#pragma once

#include <nlohmann/json.hpp>

namespace aigw {

inline constexpr int kJSONSchemaMaxDepth = 100;

/**
 * Replaces every local `$ref` ("#/...") in `schema` with a copy of the
 * referenced sub-schema. Circular references, malformed paths, missing
 * targets and nesting deeper than kJSONSchemaMaxDepth raise TranslationError.
 */
nlohmann::json dereference_json_schema(const nlohmann::json& schema);

/**
 * Converts a JSON Schema object into the OpenAPI-style subset that Gemini
 * accepts in `responseSchema` and function declaration `parameters`:
 * references are inlined, `$defs` and unknown keywords are dropped,
 * `["T", "null"]` types and `null` anyOf members become `nullable`, and a
 * single-entry `allOf` is flattened.
 */
nlohmann::json json_schema_to_gemini(const nlohmann::json& schema);

}  // namespace aigw
