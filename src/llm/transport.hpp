#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <string>

#include "core/types.hpp"
#include "net/http_client.hpp"

namespace convo::llm {

// A provider-ready HTTP request
struct WireRequest {
  std::string url;
  std::map<std::string, std::string> headers;
  json body;
};

using ChunkCallback = std::function<void(const std::string &chunk)>;

// Moves wire requests to a provider and back
class Transport {
 public:
  virtual ~Transport() = default;

  // Buffered exchange, returns the response body.
  // Throws NetworkError for connection failures and non-2xx statuses,
  // Cancelled when cancel() interrupted the request.
  virtual std::string send(const WireRequest &request) = 0;

  // Streaming exchange; on_chunk receives raw body bytes as they arrive.
  // Exceptions thrown by on_chunk abort the request and propagate.
  virtual void stream(const WireRequest &request, const ChunkCallback &on_chunk) = 0;

  // Interrupt the request in flight, callable from another thread
  virtual void cancel() = 0;

  // Clear a previous cancel() before a new run
  virtual void reset() = 0;
};

// Transport over net::HttpClient. Each call runs a private io_context on the
// calling thread until the exchange completes.
class HttpTransport : public Transport {
 public:
  explicit HttpTransport(std::chrono::seconds timeout = std::chrono::seconds(120));

  std::string send(const WireRequest &request) override;

  void stream(const WireRequest &request, const ChunkCallback &on_chunk) override;

  void cancel() override;

  void reset() override;

 private:
  net::HttpOptions make_options(const WireRequest &request) const;

  void run();

  asio::io_context io_ctx_;
  net::HttpClient client_;
  std::chrono::seconds timeout_;
  std::atomic<bool> cancelled_{false};
};

// Human readable message for a failed provider response. Uses the
// provider's error.message (or error string) when the body carries one.
std::string describe_http_error(int status_code, const std::string &body);

}  // namespace convo::llm
