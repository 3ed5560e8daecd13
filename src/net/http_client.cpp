#include "http_client.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace convo::net {

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string &url) {
  std::regex url_regex(R"(^(https?):\/\/([^:\/\s]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::string ChunkedDecoder::feed(const std::string &data) {
  std::string out;
  size_t i = 0;

  // Appends up to the next '\n' into line_, returns false when none yet
  auto take_line = [&]() {
    auto nl = data.find('\n', i);
    if (nl == std::string::npos) {
      line_.append(data, i, std::string::npos);
      i = data.size();
      return false;
    }
    line_.append(data, i, nl - i);
    i = nl + 1;
    if (!line_.empty() && line_.back() == '\r') {
      line_.pop_back();
    }
    return true;
  };

  while (i < data.size() && state_ != State::Done) {
    switch (state_) {
      case State::Size: {
        if (!take_line()) break;
        std::string hex = line_.substr(0, line_.find(';'));
        hex.erase(hex.find_last_not_of(" \t") + 1);
        line_.clear();

        size_t size = 0;
        size_t pos = 0;
        try {
          size = std::stoul(hex, &pos, 16);
        } catch (const std::logic_error &) {
          throw std::runtime_error("invalid chunk size '" + hex + "'");
        }
        if (pos != hex.size()) {
          throw std::runtime_error("invalid chunk size '" + hex + "'");
        }

        if (size == 0) {
          state_ = State::Trailer;
        } else {
          remaining_ = size;
          state_ = State::Data;
        }
        break;
      }
      case State::Data: {
        size_t n = std::min(remaining_, data.size() - i);
        out.append(data, i, n);
        i += n;
        remaining_ -= n;
        if (remaining_ == 0) {
          state_ = State::DataEnd;
        }
        break;
      }
      case State::DataEnd: {
        if (!take_line()) break;
        if (!line_.empty()) {
          throw std::runtime_error("missing CRLF after chunk data");
        }
        state_ = State::Size;
        break;
      }
      case State::Trailer: {
        if (!take_line()) break;
        if (line_.empty()) {
          state_ = State::Done;
        }
        line_.clear();
        break;
      }
      case State::Done:
        break;
    }
  }

  return out;
}

namespace {

template <typename Stream>
struct is_tls : std::false_type {};

template <>
struct is_tls<asio::ssl::stream<asio::ip::tcp::socket>> : std::true_type {};

// One request/response exchange over a plain or TLS stream.
// Kept alive by the handlers it has in flight.
template <typename Stream>
class Exchange : public std::enable_shared_from_this<Exchange<Stream>> {
 public:
  Exchange(asio::io_context &io_ctx, std::unique_ptr<Stream> stream, ParsedUrl url, const HttpOptions &options,
           StreamDataCallback on_data, ResponseCallback on_done)
      : stream_(std::move(stream)),
        resolver_(io_ctx),
        timer_(io_ctx),
        url_(std::move(url)),
        timeout_(options.timeout),
        on_data_(std::move(on_data)),
        on_done_(std::move(on_done)) {
    std::ostringstream req;
    req << options.method << " " << url_.path << url_.query << " HTTP/1.1\r\n";
    req << "Host: " << url_.host;
    if (!url_.port.empty()) {
      req << ":" << url_.port;
    }
    req << "\r\n";
    req << "Connection: close\r\n";
    req << "Accept-Encoding: identity\r\n";

    for (const auto &[key, value] : options.headers) {
      req << key << ": " << value << "\r\n";
    }

    if (!options.body.empty() || options.method == "POST") {
      req << "Content-Length: " << options.body.size() << "\r\n";
    }

    req << "\r\n";
    req << options.body;
    request_ = req.str();
  }

  void set_on_finish(std::function<void()> on_finish) {
    on_finish_ = std::move(on_finish);
  }

  void start() {
    auto self = this->shared_from_this();

    timer_.expires_after(timeout_);
    timer_.async_wait([self](const asio::error_code &ec) {
      if (!ec) {
        self->timed_out_ = true;
        self->close();
      }
    });

    resolver_.async_resolve(url_.host, url_.port_or_default(),
                            [self](const asio::error_code &ec, asio::ip::tcp::resolver::results_type results) {
                              if (ec) {
                                self->finish("DNS resolution failed: " + ec.message());
                                return;
                              }
                              asio::async_connect(self->stream_->lowest_layer(), results,
                                                  [self](const asio::error_code &ec, const asio::ip::tcp::endpoint &) {
                                                    if (ec) {
                                                      self->finish("Connection failed: " + ec.message());
                                                      return;
                                                    }
                                                    self->handshake();
                                                  });
                            });
  }

  // Runs on the io_context
  void abort() {
    if (finished_) return;
    cancelled_ = true;
    resolver_.cancel();
    close();
  }

 private:
  void handshake() {
    if constexpr (is_tls<Stream>::value) {
      auto self = this->shared_from_this();
      SSL_set_tlsext_host_name(stream_->native_handle(), url_.host.c_str());
      stream_->async_handshake(asio::ssl::stream_base::client, [self](const asio::error_code &ec) {
        if (ec) {
          self->finish("SSL handshake failed: " + ec.message());
          return;
        }
        self->write_request();
      });
    } else {
      write_request();
    }
  }

  void write_request() {
    auto self = this->shared_from_this();
    asio::async_write(*stream_, asio::buffer(request_), [self](const asio::error_code &ec, size_t) {
      if (ec) {
        self->finish("Write failed: " + ec.message());
        return;
      }
      self->read_headers();
    });
  }

  void read_headers() {
    auto self = this->shared_from_this();
    asio::async_read_until(*stream_, buffer_, "\r\n\r\n", [self](const asio::error_code &ec, size_t header_bytes) {
      if (ec) {
        self->finish("Failed to read headers: " + ec.message());
        return;
      }

      std::string data(asio::buffers_begin(self->buffer_.data()), asio::buffers_end(self->buffer_.data()));
      self->buffer_.consume(self->buffer_.size());

      if (!self->parse_head(data.substr(0, header_bytes))) {
        return;
      }
      if (!self->deliver(data.substr(header_bytes))) {
        return;
      }
      if (self->body_complete()) {
        self->finish("");
        return;
      }
      self->read_body();
    });
  }

  bool parse_head(const std::string &head) {
    std::istringstream stream(head);
    std::string status_line;
    std::getline(stream, status_line);

    std::regex status_regex(R"(HTTP/\d(?:\.\d)?\s+(\d{3}))");
    std::smatch match;
    if (!std::regex_search(status_line, match, status_regex)) {
      finish("Invalid HTTP response: cannot parse status line");
      return false;
    }
    response_.status_code = std::stoi(match[1].str());

    std::string header_line;
    while (std::getline(stream, header_line) && header_line != "\r" && !header_line.empty()) {
      auto colon = header_line.find(':');
      if (colon == std::string::npos) continue;

      std::string key = header_line.substr(0, colon);
      std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });
      std::string value = header_line.substr(colon + 1);
      value.erase(0, value.find_first_not_of(" \t"));
      value.erase(value.find_last_not_of(" \t\r\n") + 1);
      response_.headers[key] = value;
    }

    if (auto it = response_.headers.find("transfer-encoding"); it != response_.headers.end()) {
      chunked_ = it->second.find("chunked") != std::string::npos;
    }
    if (auto it = response_.headers.find("content-length"); it != response_.headers.end() && !chunked_) {
      try {
        content_length_ = std::stoull(it->second);
      } catch (const std::logic_error &) {
        spdlog::warn("[HttpClient] Ignoring invalid Content-Length: {}", it->second);
      }
    }

    streaming_ = on_data_ && response_.status_code >= 200 && response_.status_code < 300;
    return true;
  }

  // Hands raw body bytes to the decoder and sink; false once finished
  bool deliver(const std::string &raw) {
    if (raw.empty()) return true;

    std::string payload;
    if (chunked_) {
      try {
        payload = decoder_.feed(raw);
      } catch (const std::runtime_error &e) {
        finish(std::string("Malformed chunked body: ") + e.what());
        return false;
      }
    } else {
      payload = raw;
    }
    received_ += payload.size();

    if (payload.empty()) return true;
    if (streaming_) {
      on_data_(payload);
    } else {
      response_.body += payload;
    }
    return true;
  }

  bool body_complete() const {
    if (response_.status_code == 204 || response_.status_code == 304) return true;
    if (chunked_) return decoder_.done();
    return content_length_ && received_ >= *content_length_;
  }

  void read_body() {
    auto self = this->shared_from_this();
    asio::async_read(*stream_, buffer_, asio::transfer_at_least(1), [self](const asio::error_code &ec, size_t) {
      if (self->buffer_.size() > 0) {
        std::string raw(asio::buffers_begin(self->buffer_.data()), asio::buffers_end(self->buffer_.data()));
        self->buffer_.consume(self->buffer_.size());
        if (!self->deliver(raw)) {
          return;
        }
      }

      if (self->body_complete()) {
        self->finish("");
        return;
      }

      if (ec) {
        // TLS peers often close without close_notify
        bool is_eof = (ec == asio::error::eof) || (ec.category() == asio::error::get_ssl_category()) ||
                      ec == asio::ssl::error::stream_truncated;
        if (!is_eof) {
          self->finish("Read failed: " + ec.message());
        } else if (self->chunked_ || self->content_length_) {
          self->finish("Connection closed before the response body was complete");
        } else {
          self->finish("");
        }
        return;
      }

      self->read_body();
    });
  }

  void close() {
    asio::error_code ignored;
    stream_->lowest_layer().close(ignored);
  }

  void finish(std::string error) {
    if (finished_) return;
    finished_ = true;

    timer_.cancel();
    close();

    if (timed_out_) {
      error = "Request timed out";
    } else if (cancelled_) {
      error = "Request cancelled";
    }
    response_.error = std::move(error);

    if (on_finish_) {
      on_finish_();
    }
    on_done_(std::move(response_));
  }

  std::unique_ptr<Stream> stream_;
  asio::ip::tcp::resolver resolver_;
  asio::steady_timer timer_;
  ParsedUrl url_;
  std::chrono::seconds timeout_;
  std::string request_;
  asio::streambuf buffer_;

  StreamDataCallback on_data_;
  ResponseCallback on_done_;
  std::function<void()> on_finish_;

  HttpResponse response_;
  bool streaming_ = false;
  bool chunked_ = false;
  ChunkedDecoder decoder_;
  std::optional<size_t> content_length_;
  size_t received_ = 0;

  bool timed_out_ = false;
  bool cancelled_ = false;
  bool finished_ = false;
};

}  // namespace

// HTTP Client implementation
class HttpClient::Impl {
 public:
  explicit Impl(asio::io_context &io_ctx) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  void start(const std::string &url, const HttpOptions &options, StreamDataCallback on_data, ResponseCallback on_done) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      HttpResponse response;
      response.error = "Invalid URL: " + url;
      on_done(std::move(response));
      return;
    }

    spdlog::debug("[HttpClient] {} {}://{}{}", options.method, parsed->scheme, parsed->host, parsed->path);

    if (parsed->is_https()) {
      launch(std::make_unique<asio::ssl::stream<asio::ip::tcp::socket>>(io_ctx_, ssl_ctx_), *parsed, options,
             std::move(on_data), std::move(on_done));
    } else {
      launch(std::make_unique<asio::ip::tcp::socket>(io_ctx_), *parsed, options, std::move(on_data),
             std::move(on_done));
    }
  }

  void cancel() {
    std::vector<std::function<void()>> aborts;
    {
      std::lock_guard lock(mutex_);
      for (const auto &[id, abort] : active_) {
        aborts.push_back(abort);
      }
    }
    for (auto &abort : aborts) {
      asio::post(io_ctx_, abort);
    }
  }

 private:
  template <typename Stream>
  void launch(std::unique_ptr<Stream> stream, const ParsedUrl &url, const HttpOptions &options,
              StreamDataCallback on_data, ResponseCallback on_done) {
    auto exchange = std::make_shared<Exchange<Stream>>(io_ctx_, std::move(stream), url, options, std::move(on_data),
                                                       std::move(on_done));

    uint64_t id = 0;
    {
      std::lock_guard lock(mutex_);
      id = next_id_++;
      active_[id] = [weak = std::weak_ptr<Exchange<Stream>>(exchange)] {
        if (auto ex = weak.lock()) {
          ex->abort();
        }
      };
    }
    exchange->set_on_finish([this, id] {
      std::lock_guard lock(mutex_);
      active_.erase(id);
    });

    exchange->start();
  }

  asio::io_context &io_ctx_;
  asio::ssl::context ssl_ctx_;

  std::mutex mutex_;
  std::map<uint64_t, std::function<void()>> active_;
  uint64_t next_id_ = 0;
};

// HttpClient public interface
HttpClient::HttpClient(asio::io_context &io_ctx) : impl_(std::make_unique<Impl>(io_ctx)) {}

HttpClient::~HttpClient() = default;

void HttpClient::request(const std::string &url, const HttpOptions &options, ResponseCallback callback) {
  impl_->start(url, options, nullptr, std::move(callback));
}

void HttpClient::request_stream(const std::string &url, const HttpOptions &options, StreamDataCallback on_data,
                                ResponseCallback on_complete) {
  impl_->start(url, options, std::move(on_data), std::move(on_complete));
}

void HttpClient::cancel() {
  impl_->cancel();
}

}  // namespace convo::net
