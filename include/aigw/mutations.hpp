#pragma once

#include "aigw/translator.hpp"

#include <string>
#include <vector>

namespace aigw {

RequestMutation build_request_mutations(const std::string& path, std::string body);

/// "publishers/<publisher>/models/<model>:<method>[?<query>&...]"
std::string build_gcp_model_path(const std::string& publisher,
                                 const std::string& model,
                                 const std::string& method,
                                 const std::vector<std::string>& query_params = {});

}  // namespace aigw
