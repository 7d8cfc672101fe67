#include "aigw/error.hpp"
#include "aigw/logging.hpp"
#include "aigw/relay.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

const char* level_name(aigw::LogLevel level)
{
  switch (level)
  {
    case aigw::LogLevel::Error:
      return "error";
    case aigw::LogLevel::Warn:
      return "warn";
    case aigw::LogLevel::Info:
      return "info";
    case aigw::LogLevel::Debug:
      return "debug";
    default:
      return "off";
  }
}

std::string read_request(const std::string& path)
{
  if (path == "-")
  {
    std::ostringstream buffer;
    buffer << std::cin.rdbuf();
    return buffer.str();
  }
  std::ifstream file(path, std::ios::binary);
  if (!file)
  {
    throw aigw::ConfigError("cannot open request file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

}  // namespace

int main(int argc, char** argv)
{
  if (argc != 2)
  {
    std::cerr << "usage: " << argv[0] << " <chat-completion-request.json | ->\n"
              << "Reads AIGW_GCP_PROJECT, AIGW_GCP_LOCATION, AIGW_GCP_ACCESS_TOKEN and AIGW_LOG.\n";
    return 2;
  }

  try
  {
    aigw::RelayOptions options;
    options.logger = [](aigw::LogLevel level, const std::string& message, const nlohmann::json& details) {
      std::cerr << "[" << level_name(level) << "] " << message;
      if (!details.empty())
      {
        std::cerr << " " << details.dump();
      }
      std::cerr << "\n";
    };

    aigw::Relay relay(options);
    const std::string request = read_request(argv[1]);

    auto result = relay.chat_completion(request, [](const std::string& bytes) {
      std::cout << bytes << std::flush;
    });
    std::cout << "\n";

    std::cerr << "status=" << result.status_code << " model=" << result.response_model
              << " input_tokens=" << result.usage.input_tokens
              << " output_tokens=" << result.usage.output_tokens
              << " total_tokens=" << result.usage.total_tokens << "\n";
    return result.status_code >= 200 && result.status_code < 300 ? 0 : 1;
  }
  catch (const aigw::ConfigError& ex)
  {
    std::cerr << "configuration error: " << ex.what() << "\n";
    return 2;
  }
  catch (const std::exception& ex)
  {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
