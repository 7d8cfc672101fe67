#pragma once

#include "aigw/http_client.hpp"
#include "aigw/logging.hpp"
#include "aigw/translator.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace aigw {

struct RelayOptions {
  std::string base_url;
  std::string project;
  std::string location;
  std::string access_token;
  std::string model_name_override;
  std::chrono::milliseconds timeout{60000};
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
};

/**
 * Fills unset fields from AIGW_VERTEX_BASE_URL, AIGW_GCP_PROJECT,
 * AIGW_GCP_LOCATION, AIGW_GCP_ACCESS_TOKEN, AIGW_MODEL_NAME_OVERRIDE and
 * AIGW_LOG. Throws ConfigError when the access token is missing, or when no
 * base URL is given and project or location is missing.
 */
RelayOptions load_relay_options(RelayOptions options = {});

struct RelayResult {
  long status_code = 0;
  Headers headers;
  std::string body;
  LLMTokenUsage usage;
  std::string response_model;
};

class Relay {
public:
  using BodyCallback = std::function<void(const std::string& bytes)>;

  explicit Relay(RelayOptions options, std::unique_ptr<HttpClient> http_client = nullptr);

  RelayResult chat_completion(const std::string& request_body, const BodyCallback& on_body = nullptr);

  const RelayOptions& options() const { return options_; }

private:
  RelayOptions options_;
  std::unique_ptr<HttpClient> http_client_;
  Logger logger_;
};

}  // namespace aigw
