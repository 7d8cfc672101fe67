#pragma once

#include <stdexcept>
#include <string>

namespace aigw {

class GatewayError : public std::runtime_error {
public:
  explicit GatewayError(const std::string& message)
      : std::runtime_error(message) {}
};

class SchemaError : public GatewayError {
public:
  explicit SchemaError(const std::string& message)
      : GatewayError(message) {}
};

class TranslationError : public GatewayError {
public:
  explicit TranslationError(const std::string& message)
      : GatewayError(message) {}
};

class ConfigError : public GatewayError {
public:
  explicit ConfigError(const std::string& message)
      : GatewayError(message) {}
};

class UpstreamError : public GatewayError {
public:
  explicit UpstreamError(const std::string& message, long status_code = 0)
      : GatewayError(message), status_code_(status_code) {}

  long status_code() const { return status_code_; }

private:
  long status_code_;
};

/// Rethrows the same error kind with `context` prepended to its message.
[[noreturn]] void rethrow_with_context(const std::string& context);

}  // namespace aigw
