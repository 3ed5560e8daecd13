#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace convo::net {

// HTTP response
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;  // lower-case names
  std::string body;
  std::string error;

  bool ok() const {
    return error.empty() && status_code >= 200 && status_code < 300;
  }
};

// HTTP request options
struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout{30};
};

// Streaming data callback, receives decoded body bytes
using StreamDataCallback = std::function<void(const std::string &chunk)>;

using ResponseCallback = std::function<void(HttpResponse)>;

// Incremental decoder for "Transfer-Encoding: chunked" bodies
class ChunkedDecoder {
 public:
  // Decode the next slice of the raw body. Throws std::runtime_error on
  // malformed framing.
  std::string feed(const std::string &data);

  bool done() const {
    return state_ == State::Done;
  }

 private:
  enum class State { Size, Data, DataEnd, Trailer, Done };

  State state_ = State::Size;
  size_t remaining_ = 0;
  std::string line_;
};

// Async HTTP/1.1 client using ASIO. All callbacks run on the io_context.
class HttpClient {
 public:
  explicit HttpClient(asio::io_context &io_ctx);

  ~HttpClient();

  // Buffered request; the callback receives the whole response
  void request(const std::string &url, const HttpOptions &options, ResponseCallback callback);

  // Streaming request. For 2xx responses body bytes go to on_data as they
  // arrive and on_complete gets a response with an empty body; other statuses
  // are buffered into the response passed to on_complete.
  void request_stream(const std::string &url, const HttpOptions &options, StreamDataCallback on_data,
                      ResponseCallback on_complete);

  // Close every in-flight connection. Safe to call from any thread; pending
  // requests complete with error "Request cancelled".
  void cancel();

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  static std::optional<ParsedUrl> parse(const std::string &url);
};

}  // namespace convo::net
