#include "aigw/relay.hpp"

#include "aigw/error.hpp"
#include "aigw/openai_gcpvertexai.hpp"
#include "aigw/openai_schema.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace aigw {
namespace {

using json = nlohmann::json;

// Blank or whitespace-only variables count as unset.
std::string env_setting(const char* name) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return {};
  }
  std::string value(raw);
  auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

void apply_env_settings(RelayOptions& options) {
  const std::pair<std::string RelayOptions::*, const char*> settings[] = {
      {&RelayOptions::base_url, "AIGW_VERTEX_BASE_URL"},
      {&RelayOptions::project, "AIGW_GCP_PROJECT"},
      {&RelayOptions::location, "AIGW_GCP_LOCATION"},
      {&RelayOptions::access_token, "AIGW_GCP_ACCESS_TOKEN"},
      {&RelayOptions::model_name_override, "AIGW_MODEL_NAME_OVERRIDE"},
  };
  for (const auto& [field, name] : settings) {
    if ((options.*field).empty()) {
      options.*field = env_setting(name);
    }
  }
  if (options.log_level == LogLevel::Off) {
    if (auto level = env_setting("AIGW_LOG"); !level.empty()) {
      options.log_level = parse_log_level(level, options.log_level);
    }
  }
}

std::string default_base_url(const RelayOptions& options) {
  return "https://" + options.location + "-aiplatform.googleapis.com/v1/projects/" + options.project +
         "/locations/" + options.location + "/";
}

bool is_success(long status_code) {
  return status_code >= 200 && status_code < 300;
}

Headers normalize_headers(long status_code, const std::map<std::string, std::string>& raw) {
  Headers headers;
  for (const auto& [key, value] : raw) {
    std::string lowered = key;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    headers[lowered] = value;
  }
  headers[kHeaderStatus] = std::to_string(status_code);
  return headers;
}

bool has_usage(const LLMTokenUsage& usage) {
  return usage.input_tokens != 0 || usage.output_tokens != 0 || usage.total_tokens != 0 ||
         usage.cached_input_tokens != 0;
}

}  // namespace

RelayOptions load_relay_options(RelayOptions options) {
  apply_env_settings(options);

  if (options.access_token.empty()) {
    throw ConfigError("Missing credentials. Provide RelayOptions.access_token or set the AIGW_GCP_ACCESS_TOKEN environment variable.");
  }
  if (options.base_url.empty()) {
    if (options.project.empty()) {
      throw ConfigError("Missing GCP project. Provide RelayOptions.project or set the AIGW_GCP_PROJECT environment variable.");
    }
    if (options.location.empty()) {
      throw ConfigError("Missing GCP location. Provide RelayOptions.location or set the AIGW_GCP_LOCATION environment variable.");
    }
    options.base_url = default_base_url(options);
  }
  if (options.base_url.back() != '/') {
    options.base_url.push_back('/');
  }
  if (options.timeout.count() <= 0) {
    throw ConfigError("RelayOptions.timeout must be a positive duration");
  }
  return options;
}

Relay::Relay(RelayOptions options, std::unique_ptr<HttpClient> http_client)
    : options_(load_relay_options(std::move(options))),
      http_client_(http_client ? std::move(http_client) : make_default_http_client()),
      logger_(options_.log_level, options_.logger) {}

RelayResult Relay::chat_completion(const std::string& request_body, const BodyCallback& on_body) {
  json payload;
  try {
    payload = json::parse(request_body);
  } catch (const json::exception& ex) {
    throw SchemaError(std::string("failed to parse chat completion request: ") + ex.what());
  }
  const auto request = openai::parse_chat_completion_request(payload);

  auto translator = make_openai_to_gcp_vertexai_translator(options_.model_name_override, logger_);
  auto mutation = translator->request_body(request_body, request, false);

  HttpRequest http_request;
  http_request.method = "POST";
  http_request.url = options_.base_url;
  http_request.timeout = options_.timeout;
  http_request.body = mutation.body ? *mutation.body : request_body;
  http_request.headers["Authorization"] = "Bearer " + options_.access_token;
  http_request.headers["Content-Type"] = "application/json";
  for (const auto& header : mutation.headers) {
    if (header.key == kHeaderPath) {
      http_request.url += header.value;
    } else if (header.key != kHeaderContentLength) {
      http_request.headers[header.key] = header.value;
    }
  }

  RelayResult result;
  Headers response_headers;
  bool started = false;
  bool translate_chunks = false;
  std::string buffered;

  auto apply = [&](ResponseMutation&& out) {
    if (out.body) {
      if (on_body && !out.body->empty()) {
        on_body(*out.body);
      }
      result.body += *out.body;
    }
    if (has_usage(out.usage)) {
      result.usage = out.usage;
    }
    if (!out.response_model.empty()) {
      result.response_model = std::move(out.response_model);
    }
    for (auto& header : out.headers) {
      result.headers[header.key] = std::move(header.value);
    }
  };

  auto start = [&](long status_code, const std::map<std::string, std::string>& headers) {
    started = true;
    result.status_code = status_code;
    response_headers = normalize_headers(status_code, headers);
    result.headers = response_headers;
    translate_chunks = is_success(status_code) && request.stream;
  };

  http_request.collect_body = false;
  http_request.on_response_start = start;
  http_request.on_chunk = [&](const char* data, std::size_t size) {
    if (!translate_chunks) {
      buffered.append(data, size);
      return;
    }
    std::istringstream chunk(std::string(data, size));
    apply(translator->response_body(response_headers, chunk, false));
  };

  logger_.log(LogLevel::Debug, "sending request", {{"url", http_request.url}, {"model", request.model}});
  const auto started_at = std::chrono::steady_clock::now();
  HttpResponse response = http_client_->request(http_request);
  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at);

  if (!started) {
    start(response.status_code, response.headers);
  }
  for (const auto& header : translator->response_headers(response_headers)) {
    result.headers[header.key] = header.value;
  }

  if (!is_success(result.status_code)) {
    logger_.log(LogLevel::Warn, "upstream returned error", {{"status", result.status_code}, {"duration_ms", duration.count()}});
    std::istringstream error_body(buffered);
    apply(translator->response_error(response_headers, error_body));
    return result;
  }

  std::istringstream remaining(buffered);
  apply(translator->response_body(response_headers, remaining, true));
  logger_.log(LogLevel::Info, "request succeeded",
              {{"status", result.status_code},
               {"duration_ms", duration.count()},
               {"input_tokens", result.usage.input_tokens},
               {"output_tokens", result.usage.output_tokens}});
  return result;
}

}  // namespace aigw
