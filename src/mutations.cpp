#include "aigw/mutations.hpp"

namespace aigw {

RequestMutation build_request_mutations(const std::string& path, std::string body) {
  RequestMutation mutation;
  if (!path.empty()) {
    mutation.headers.push_back({kHeaderPath, path});
  }
  if (!body.empty()) {
    mutation.headers.push_back({kHeaderContentLength, std::to_string(body.size())});
    mutation.body = std::move(body);
  }
  return mutation;
}

std::string build_gcp_model_path(const std::string& publisher,
                                 const std::string& model,
                                 const std::string& method,
                                 const std::vector<std::string>& query_params) {
  std::string path = "publishers/" + publisher + "/models/" + model + ":" + method;
  for (std::size_t i = 0; i < query_params.size(); ++i) {
    path += i == 0 ? '?' : '&';
    path += query_params[i];
  }
  return path;
}

}  // namespace aigw
