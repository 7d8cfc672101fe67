#pragma once

#include "aigw/error.hpp"
#include "aigw/http_client.hpp"

#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <variant>
#include <vector>

namespace aigw::testing {

/**
 * In-memory HttpClient that replays queued responses. A streamed response
 * delivers its body through on_chunk in the enqueued pieces.
 */
class MockHttpClient final : public HttpClient {
public:
  struct EnqueuedError {
    std::string message;
  };

  struct EnqueuedStream {
    HttpResponse response;
    std::vector<std::string> chunks;
  };

  using Enqueued = std::variant<HttpResponse, EnqueuedStream, EnqueuedError>;

  HttpResponse request(const HttpRequest& request) override {
    Enqueued next;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_request_ = request;
      if (responses_.empty()) {
        throw UpstreamError("MockHttpClient queue underflow");
      }
      next = std::move(responses_.front());
      responses_.pop();
    }

    if (auto* error = std::get_if<EnqueuedError>(&next)) {
      throw UpstreamError(error->message);
    }

    EnqueuedStream stream;
    if (auto* streamed = std::get_if<EnqueuedStream>(&next)) {
      stream = std::move(*streamed);
      for (const auto& chunk : stream.chunks) {
        stream.response.body += chunk;
      }
    } else {
      stream.response = std::get<HttpResponse>(next);
      stream.chunks.push_back(stream.response.body);
    }

    if (request.on_response_start) {
      request.on_response_start(stream.response.status_code, stream.response.headers);
    }
    if (request.on_chunk) {
      for (const auto& chunk : stream.chunks) {
        request.on_chunk(chunk.data(), chunk.size());
      }
    }
    if (!request.collect_body) {
      stream.response.body.clear();
    }
    return stream.response;
  }

  void enqueue_response(HttpResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push(std::move(response));
  }

  void enqueue_stream(HttpResponse response, std::vector<std::string> chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push(EnqueuedStream{std::move(response), std::move(chunks)});
  }

  void enqueue_error(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push(EnqueuedError{std::move(message)});
  }

  [[nodiscard]] const std::optional<HttpRequest>& last_request() const {
    return last_request_;
  }

private:
  std::queue<Enqueued> responses_;
  std::optional<HttpRequest> last_request_;
  mutable std::mutex mutex_;
};

}  // namespace aigw::testing
