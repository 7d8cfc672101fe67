#include "aigw/jsonschema.hpp"

#include "aigw/error.hpp"

#include <set>
#include <string>
#include <vector>

namespace aigw {
namespace {

using json = nlohmann::json;

const std::set<std::string>& allowed_schema_fields() {
  static const std::set<std::string> fields = {
      "anyOf",     "default",   "description",   "enum",      "example",  "format",
      "items",     "maxItems",  "maxLength",     "maxProperties", "maximum", "minItems",
      "minLength", "minProperties", "minimum",   "nullable",  "pattern",  "properties",
      "propertyOrdering", "required", "title",   "type",
  };
  return fields;
}

[[noreturn]] void invalid_schema(const std::string& detail) {
  throw TranslationError("invalid JSON schema: " + detail);
}

void check_depth(int depth) {
  if (depth >= kJSONSchemaMaxDepth) {
    throw TranslationError("maximum recursion depth exceeded: depth " + std::to_string(depth));
  }
}

std::vector<std::string> split_ref(const std::string& path) {
  std::vector<std::string> components;
  std::size_t start = 0;
  while (true) {
    auto slash = path.find('/', start);
    components.push_back(path.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }
  return components;
}

const std::string& ref_path(const json& value) {
  if (!value.is_string()) {
    invalid_schema(std::string("'$ref' value must be a string, got ") + value.type_name());
  }
  return value.get_ref<const std::string&>();
}

json retrieve_ref(const std::string& path, const json& schema) {
  if (path.empty()) {
    invalid_schema("ref path cannot be empty");
  }
  if (path.rfind("#/", 0) != 0) {
    invalid_schema("ref paths must start with '#/', got: " + path);
  }

  auto components = split_ref(path);
  const json* current = &schema;
  for (std::size_t i = 1; i < components.size(); ++i) {
    const auto& component = components[i];
    if (component.empty()) {
      invalid_schema("ref path contains empty component at position " + std::to_string(i));
    }
    if (component.find("..") != std::string::npos || component.find("./") != std::string::npos) {
      invalid_schema("ref path contains invalid characters: " + component);
    }
    auto it = current->find(component);
    if (it == current->end()) {
      invalid_schema("reference '" + path + "' not found: component '" + component + "' does not exist");
    }
    if (i + 1 == components.size()) {
      return *it;
    }
    if (!it->is_object()) {
      invalid_schema("reference '" + path + "' invalid: intermediate component '" + component +
                     "' is not an object (got " + it->type_name() + ")");
    }
    current = &*it;
  }
  invalid_schema("unexpected end of ref path traversal for: " + path);
}

// Top-level containers ("$defs", "definitions", ...) that references point into.
void collect_ref_roots(const json& node, const json& full_schema, std::set<std::string>& in_progress,
                       std::set<std::string>& roots, int depth) {
  check_depth(depth);
  if (node.is_object()) {
    for (auto it = node.begin(); it != node.end(); ++it) {
      if (it.key() == "$ref") {
        const std::string& path = ref_path(it.value());
        if (in_progress.count(path) != 0) {
          invalid_schema("circular reference detected: " + path);
        }
        json target = retrieve_ref(path, full_schema);
        auto components = split_ref(path);
        if (components.size() > 1) {
          roots.insert(components[1]);
        }
        in_progress.insert(path);
        collect_ref_roots(target, full_schema, in_progress, roots, depth + 1);
        in_progress.erase(path);
      } else if (it->is_object() || it->is_array()) {
        collect_ref_roots(it.value(), full_schema, in_progress, roots, depth + 1);
      }
    }
  } else if (node.is_array()) {
    for (const auto& item : node) {
      collect_ref_roots(item, full_schema, in_progress, roots, depth + 1);
    }
  }
}

json dereference(const json& node, const json& full_schema, const std::set<std::string>& skip_keys,
                 std::set<std::string>& in_progress, int depth) {
  check_depth(depth);
  if (node.is_object()) {
    if (auto ref = node.find("$ref"); ref != node.end()) {
      const std::string path = ref_path(*ref);
      if (in_progress.count(path) != 0) {
        invalid_schema("circular reference detected: " + path);
      }
      in_progress.insert(path);
      json target = retrieve_ref(path, full_schema);
      json resolved = dereference(target, full_schema, skip_keys, in_progress, depth + 1);
      in_progress.erase(path);
      return resolved;
    }

    json out = json::object();
    for (auto it = node.begin(); it != node.end(); ++it) {
      if (skip_keys.count(it.key()) != 0 || !(it->is_object() || it->is_array())) {
        out[it.key()] = it.value();
      } else {
        out[it.key()] = dereference(it.value(), full_schema, skip_keys, in_progress, depth + 1);
      }
    }
    return out;
  }
  if (node.is_array()) {
    json out = json::array();
    for (const auto& item : node) {
      out.push_back(dereference(item, full_schema, skip_keys, in_progress, depth + 1));
    }
    return out;
  }
  return node;
}

json to_gemini(const json& schema, int depth);

json convert_type(const json& value) {
  if (value.is_string()) {
    return json{{"type", value}};
  }
  if (!value.is_array()) {
    invalid_schema(std::string("'type' must be a list or string, got ") + value.type_name());
  }
  if (value.size() != 2) {
    invalid_schema("if type is a list, length must be 2, got " + std::to_string(value.size()));
  }

  bool has_null = false;
  const json* non_null = nullptr;
  for (const auto& item : value) {
    if (item.is_string() && item.get_ref<const std::string&>() == "null") {
      has_null = true;
    } else {
      non_null = &item;
    }
  }
  if (!has_null || non_null == nullptr) {
    invalid_schema("if type is a list, it must contain one non-null type and 'null'");
  }
  if (non_null->is_object()) {
    invalid_schema("unexpected map type in type array");
  }
  return json{{"type", non_null->is_string() ? non_null->get<std::string>() : non_null->dump()}, {"nullable", true}};
}

json convert_all_of(const json& value, int depth) {
  if (!value.is_array()) {
    invalid_schema(std::string("'allOf' must be a list, got ") + value.type_name());
  }
  if (value.empty()) {
    invalid_schema("'allOf' cannot be empty");
  }
  if (value.size() > 1) {
    invalid_schema("only one value for 'allOf' key is supported, got " + std::to_string(value.size()));
  }
  if (!value.front().is_object()) {
    invalid_schema(std::string("item in 'allOf' must be an object, got ") + value.front().type_name());
  }
  return to_gemini(value.front(), depth + 1);
}

json convert_any_of(const json& value, int depth) {
  if (!value.is_array()) {
    invalid_schema(std::string("'anyOf' must be a list, got ") + value.type_name());
  }
  if (value.empty()) {
    invalid_schema("'anyOf' cannot be empty");
  }

  json result = json::object();
  json variants = json::array();
  for (std::size_t i = 0; i < value.size(); ++i) {
    const auto& item = value[i];
    if (!item.is_object()) {
      invalid_schema("item " + std::to_string(i) + " in 'anyOf' must be an object, got " + item.type_name());
    }
    auto type = item.find("type");
    if (type != item.end() && type->is_string() && type->get_ref<const std::string&>() == "null") {
      result["nullable"] = true;
      continue;
    }
    try {
      variants.push_back(to_gemini(item, depth + 1));
    } catch (const GatewayError&) {
      rethrow_with_context("failed to convert anyOf item " + std::to_string(i));
    }
  }
  result["anyOf"] = std::move(variants);
  return result;
}

json to_gemini(const json& schema, int depth) {
  check_depth(depth);

  if (auto all_of = schema.find("allOf"); all_of != schema.end()) {
    return convert_all_of(*all_of, depth);
  }

  json converted = json::object();
  for (auto it = schema.begin(); it != schema.end(); ++it) {
    const std::string& key = it.key();
    const json& value = it.value();

    if (key == "$defs") {
      continue;
    }
    if (key == "items") {
      if (!value.is_object()) {
        invalid_schema(std::string("'items' must be an object, got ") + value.type_name());
      }
      try {
        converted["items"] = to_gemini(value, depth + 1);
      } catch (const GatewayError&) {
        rethrow_with_context("failed to convert items schema");
      }
    } else if (key == "properties") {
      if (!value.is_object()) {
        invalid_schema(std::string("'properties' must be an object, got ") + value.type_name());
      }
      json properties = json::object();
      for (auto property = value.begin(); property != value.end(); ++property) {
        if (!property->is_object()) {
          invalid_schema("property '" + property.key() + "' must be an object, got " + property->type_name());
        }
        try {
          properties[property.key()] = to_gemini(property.value(), depth + 1);
        } catch (const GatewayError&) {
          rethrow_with_context("failed to convert property '" + property.key() + "'");
        }
      }
      converted["properties"] = std::move(properties);
    } else if (key == "type") {
      converted.update(convert_type(value));
    } else if (key == "anyOf") {
      converted.update(convert_any_of(value, depth));
    } else if (allowed_schema_fields().count(key) != 0) {
      converted[key] = value;
    }
  }
  return converted;
}

}  // namespace

json dereference_json_schema(const json& schema) {
  if (!schema.is_object()) {
    invalid_schema(std::string("schema must be an object, got ") + schema.type_name());
  }
  std::set<std::string> in_progress;
  std::set<std::string> roots;
  collect_ref_roots(schema, schema, in_progress, roots, 0);
  in_progress.clear();
  return dereference(schema, schema, roots, in_progress, 0);
}

json json_schema_to_gemini(const json& schema) {
  json resolved = dereference_json_schema(schema);
  if (!resolved.is_object()) {
    invalid_schema(std::string("dereferenced schema is not an object, got ") + resolved.type_name());
  }
  return to_gemini(resolved, 0);
}

}  // namespace aigw
