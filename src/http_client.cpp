#include "aigw/http_client.hpp"

#include "aigw/error.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <map>
#include <memory>
#include <string>

namespace aigw {
namespace {

struct TransferContext {
  CURL* curl = nullptr;
  const HttpRequest* request = nullptr;
  std::string* body = nullptr;
  std::map<std::string, std::string>* headers = nullptr;
  bool started = false;
  std::exception_ptr callback_error;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* context = static_cast<TransferContext*>(userdata);
  const size_t total = size * nmemb;
  try {
    if (!context->started) {
      context->started = true;
      if (context->request->on_response_start) {
        long status_code = 0;
        curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &status_code);
        context->request->on_response_start(status_code, *context->headers);
      }
    }
    if (context->request->on_chunk) {
      context->request->on_chunk(ptr, total);
    }
  } catch (...) {
    // Rethrown from request() once libcurl has unwound.
    context->callback_error = std::current_exception();
    return 0;
  }
  if (context->body) {
    context->body->append(ptr, total);
  }
  return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
  std::size_t total_size = size * nitems;
  std::string line(buffer, total_size);

  auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
  auto colon_pos = line.find(':');
  if (colon_pos != std::string::npos) {
    std::string key = line.substr(0, colon_pos);
    std::string value = line.substr(colon_pos + 1);

    auto trim = [](std::string& s) {
      auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
      s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
      s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    };

    trim(key);
    trim(value);
    if (!key.empty()) {
      std::transform(key.begin(), key.end(), key.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      (*headers)[key] = value;
    }
  }

  return total_size;
}

struct CurlHandleDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

class CurlHttpClient : public HttpClient {
public:
  HttpResponse request(const HttpRequest& request) override {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
      throw UpstreamError("Failed to initialize libcurl");
    }

    curl_slist* raw_list = nullptr;
    for (const auto& [key, value] : request.headers) {
      std::string header = key + ": " + value;
      raw_list = curl_slist_append(raw_list, header.c_str());
    }
    std::unique_ptr<curl_slist, HeaderListDeleter> header_list(raw_list);

    HttpResponse response;
    TransferContext context;
    context.curl = curl.get();
    context.request = &request;
    context.body = request.collect_body ? &response.body : nullptr;
    context.headers = &response.headers;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "aigw-vertex-relay/0.1");

    if (!request.body.empty()) {
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (context.callback_error) {
      std::rethrow_exception(context.callback_error);
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    if (res != CURLE_OK) {
      throw UpstreamError(std::string("libcurl error: ") + curl_easy_strerror(res), response.status_code);
    }
    return response;
  }
};

struct CurlGlobalState {
  CurlGlobalState() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobalState() { curl_global_cleanup(); }
};

CurlGlobalState& curl_state() {
  static CurlGlobalState state;
  return state;
}

}  // namespace

std::unique_ptr<HttpClient> make_default_http_client() {
  (void)curl_state();
  return std::make_unique<CurlHttpClient>();
}

}  // namespace aigw
