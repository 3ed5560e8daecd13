#include "llm/transport.hpp"

#include <spdlog/spdlog.h>

#include <exception>

#include "core/error.hpp"

namespace convo::llm {

std::string describe_http_error(int status_code, const std::string &body) {
  std::string detail;
  try {
    auto j = json::parse(body);
    if (j.contains("error")) {
      const auto &err = j["error"];
      if (err.is_object() && err.contains("message") && err["message"].is_string()) {
        detail = err["message"].get<std::string>();
      } else if (err.is_string()) {
        detail = err.get<std::string>();
      }
    } else if (j.contains("message") && j["message"].is_string()) {
      detail = j["message"].get<std::string>();
    }
  } catch (const json::exception &) {
    // Not JSON, fall back to the raw body
  }

  if (detail.empty()) {
    detail = body.size() > 500 ? body.substr(0, 500) + "..." : body;
  }
  return "HTTP " + std::to_string(status_code) + ": " + detail;
}

HttpTransport::HttpTransport(std::chrono::seconds timeout) : client_(io_ctx_), timeout_(timeout) {}

net::HttpOptions HttpTransport::make_options(const WireRequest &request) const {
  net::HttpOptions options;
  options.method = "POST";
  options.headers = request.headers;
  options.body = request.body.dump();
  options.timeout = timeout_;
  return options;
}

void HttpTransport::run() {
  io_ctx_.restart();
  io_ctx_.run();
}

std::string HttpTransport::send(const WireRequest &request) {
  if (cancelled_) {
    throw Cancelled("request cancelled");
  }

  net::HttpResponse response;
  client_.request(request.url, make_options(request), [&response](net::HttpResponse r) { response = std::move(r); });
  run();

  if (cancelled_) {
    throw Cancelled("request cancelled");
  }
  if (!response.error.empty()) {
    throw NetworkError(response.error, response.status_code);
  }
  if (!response.ok()) {
    spdlog::error("[Transport] {} returned {}", request.url, response.status_code);
    throw NetworkError(describe_http_error(response.status_code, response.body), response.status_code);
  }

  spdlog::debug("[Transport] {} returned {} bytes", request.url, response.body.size());
  return response.body;
}

void HttpTransport::stream(const WireRequest &request, const ChunkCallback &on_chunk) {
  if (cancelled_) {
    throw Cancelled("request cancelled");
  }

  std::exception_ptr callback_error;
  net::HttpResponse response;

  client_.request_stream(
      request.url, make_options(request),
      [&](const std::string &chunk) {
        if (callback_error) return;
        try {
          on_chunk(chunk);
        } catch (const std::exception &) {
          callback_error = std::current_exception();
          client_.cancel();
        }
      },
      [&response](net::HttpResponse r) { response = std::move(r); });
  run();

  if (callback_error) {
    std::rethrow_exception(callback_error);
  }
  if (cancelled_) {
    throw Cancelled("request cancelled");
  }
  if (!response.error.empty()) {
    throw NetworkError(response.error, response.status_code);
  }
  if (!response.ok()) {
    spdlog::error("[Transport] {} returned {}", request.url, response.status_code);
    throw NetworkError(describe_http_error(response.status_code, response.body), response.status_code);
  }
}

void HttpTransport::cancel() {
  cancelled_ = true;
  client_.cancel();
}

void HttpTransport::reset() {
  cancelled_ = false;
}

}  // namespace convo::llm
