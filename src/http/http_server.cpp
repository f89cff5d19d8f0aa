// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "http_server.hpp"

#include <edgeperf/exception.hpp>

#include <boost/beast/http.hpp>
#include <boost/core/ignore_unused.hpp>
#include <boost/optional.hpp>

#include <fmt/format.h>

#include <type_traits>
#include <variant>

#include "../logging.hpp"
#include "request_handler.hpp"

namespace edgeperf::impl {

// Handles an HTTP server connection.
// This uses the Curiously Recurring Template Pattern so that
// the same code works with both SSL streams and regular sockets.
template <class Derived> class http_session
{
  std::shared_ptr<Config const> cfg_;

  // Access the derived class, this is part of
  // the Curiously Recurring Template Pattern idiom.
  Derived& derived() { return static_cast<Derived&>(*this); }

  // The parser is stored in an optional container so we can
  // construct it from scratch it at the beginning of each new message.
  boost::optional<http::request_parser<discard_body>> parser_;

  // Keeps the message being written alive until the write completes
  std::shared_ptr<void> res_;

protected:
  beast::flat_buffer buffer_;

public:
  // Construct the session
  http_session(beast::flat_buffer buffer, std::shared_ptr<Config const> cfg)
      : cfg_(std::move(cfg))
      , buffer_(std::move(buffer))
  {
  }

  void do_read()
  {
    // Construct a new parser for each message
    parser_.emplace();

    // Oversized Content-Length values are refused as soon as the header
    // is complete. The limit is narrowed for routes that take no upload.
    parser_->body_limit(cfg_->upload_max_size);

    // Only the header read is bounded in time
    beast::get_lowest_layer(derived().stream())
        .expires_after(cfg_->header_timeout);

    http::async_read_header(
        derived().stream(), buffer_, *parser_,
        beast::bind_front_handler(&http_session::on_read_header,
                                  derived().shared_from_this()));
  }

  void on_read_header(beast::error_code ec, std::size_t bytes_transferred)
  {
    boost::ignore_unused(bytes_transferred);

    // This means they closed the connection
    if (ec == http::error::end_of_stream)
      return derived().do_eof();

    if (ec == http::error::body_limit)
      return reject_oversized();

    if (ec)
      return fail(ec, "read header");

    auto const& req = parser_->get();
    auto const limit = body_limit_for(*cfg_, req.method(), req.target());

    if (limit < cfg_->upload_max_size) {
      auto const content_length = parser_->content_length();
      if (content_length && *content_length > limit)
        return reject_oversized();
      parser_->body_limit(limit);
    }

    // Transfer time is the client's concern
    beast::get_lowest_layer(derived().stream()).expires_never();

    http::async_read(derived().stream(), buffer_, *parser_,
                     beast::bind_front_handler(&http_session::on_read,
                                               derived().shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t bytes_transferred)
  {
    boost::ignore_unused(bytes_transferred);

    if (ec == http::error::body_limit)
      return reject_oversized();

    // An upload interrupted by the client leaves nothing to clean up
    if (ec) {
      EDGEPERF_LOG_DEBUG("Request body aborted after {} bytes",
                         parser_->get().body().received);
      return fail(ec, "read");
    }

    send(handle_request(*cfg_, parser_->get()));
  }

  void reject_oversized()
  {
    auto const& req = parser_->get();
    EDGEPERF_LOG_WARN("Rejecting oversized body for {} {}",
                      req.method_string(), req.target());

    // The unread body makes the connection unusable for another request
    send(make_text_response(http::status::payload_too_large, req.version(),
                            false, "Payload too large"));
  }

  void send(Response&& response)
  {
    std::visit(
        [this](auto&& res) {
          using message_type = std::decay_t<decltype(res)>;

          auto sp = std::make_shared<message_type>(std::move(res));
          res_ = sp;

          // A streamed body is written with backpressure, a slow reader
          // only slows the producer down
          beast::get_lowest_layer(derived().stream()).expires_never();

          http::async_write(derived().stream(), *sp,
                            beast::bind_front_handler(
                                &http_session::on_write,
                                derived().shared_from_this(), sp->need_eof()));
        },
        std::move(response));
  }

  void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred)
  {
    // Dropping the message here also destroys a cancelled stream
    res_ = nullptr;

    if (ec) {
      EDGEPERF_LOG_DEBUG("Response aborted after {} bytes", bytes_transferred);
      return fail(ec, "write");
    }

    if (close) {
      // This means we should close the connection, usually because
      // the response indicated the "Connection: close" semantic.
      return derived().do_eof();
    }

    do_read();
  }
};

//------------------------------------------------------------------------------

// Handles a plain HTTP connection
class plain_http_session
    : public http_session<plain_http_session>,
      public std::enable_shared_from_this<plain_http_session>
{
  beast_tcp_stream_strand stream_;

public:
  // Create the session
  plain_http_session(beast_tcp_stream_strand&& stream,
                     beast::flat_buffer&& buffer,
                     std::shared_ptr<Config const> cfg)
      : http_session<plain_http_session>(std::move(buffer), std::move(cfg))
      , stream_(std::move(stream))
  {
  }

  // Start the session
  void run()
  {
    // We need to be executing within a strand to perform async operations
    // on the I/O objects in this session.
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&plain_http_session::do_read,
                                            shared_from_this()));
  }

  // Called by the base class
  beast_tcp_stream_strand& stream() { return stream_; }

  // Called by the base class
  void do_eof()
  {
    // Send a TCP shutdown
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);

    // At this point the connection is closed gracefully
  }
};

//------------------------------------------------------------------------------

// Handles an SSL HTTP connection
class ssl_http_session : public http_session<ssl_http_session>,
                         public std::enable_shared_from_this<ssl_http_session>
{
  ssl_stream stream_;
  std::chrono::seconds handshake_timeout_;

public:
  // Create the http_session
  ssl_http_session(beast_tcp_stream_strand&& stream,
                   ssl::context& ctx,
                   beast::flat_buffer&& buffer,
                   std::shared_ptr<Config const> cfg)
      : http_session<ssl_http_session>(std::move(buffer), cfg)
      , stream_(std::move(stream), ctx)
      , handshake_timeout_(cfg->header_timeout)
  {
  }

  // Start the session
  void run()
  {
    // Set the timeout.
    beast::get_lowest_layer(stream_).expires_after(handshake_timeout_);

    // Perform the SSL handshake
    // Note, this is the buffered version of the handshake.
    stream_.async_handshake(
        ssl::stream_base::server, buffer_.data(),
        beast::bind_front_handler(&ssl_http_session::on_handshake,
                                  shared_from_this()));
  }

  // Called by the base class
  ssl_stream& stream() { return stream_; }

  // Called by the base class
  void do_eof()
  {
    // Set the timeout.
    beast::get_lowest_layer(stream_).expires_after(handshake_timeout_);

    // Perform the SSL shutdown
    stream_.async_shutdown(beast::bind_front_handler(
        &ssl_http_session::on_shutdown, shared_from_this()));
  }

private:
  void on_handshake(beast::error_code ec, std::size_t bytes_used)
  {
    if (ec)
      return fail(ec, "handshake");

    // Consume the portion of the buffer used by the handshake
    buffer_.consume(bytes_used);

    do_read();
  }

  void on_shutdown(beast::error_code ec)
  {
    if (ec)
      return fail(ec, "shutdown");

    // At this point the connection is closed gracefully
  }
};

//------------------------------------------------------------------------------

// Detects SSL handshakes
class detect_session : public std::enable_shared_from_this<detect_session>
{
  beast_tcp_stream_strand stream_;
  ssl::context& ctx_;
  std::shared_ptr<Config const> cfg_;
  beast::flat_buffer buffer_;

public:
  explicit detect_session(beast_tcp_stream_strand&& socket,
                          ssl::context& ctx,
                          std::shared_ptr<Config const> cfg)
      : stream_(std::move(socket))
      , ctx_(ctx)
      , cfg_(std::move(cfg))
  {
  }

  // Launch the detector
  void run()
  {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&detect_session::on_run,
                                            this->shared_from_this()));
  }

  void on_run()
  {
    // Set the timeout.
    stream_.expires_after(cfg_->header_timeout);

    beast::async_detect_ssl(
        stream_, buffer_,
        beast::bind_front_handler(&detect_session::on_detect,
                                  this->shared_from_this()));
  }

  void on_detect(beast::error_code ec, bool result)
  {
    if (ec)
      return fail(ec, "detect");

    if (result) {
      // Launch SSL session
      std::make_shared<ssl_http_session>(std::move(stream_), ctx_,
                                         std::move(buffer_), cfg_)
          ->run();
      return;
    }

    // Launch plain session
    std::make_shared<plain_http_session>(std::move(stream_), std::move(buffer_),
                                         cfg_)
        ->run();
  }
};

//------------------------------------------------------------------------------

// Accepts incoming connections and launches the sessions
class listener : public std::enable_shared_from_this<listener>
{
  net::io_context& ioc_;
  ssl::context* ctx_;
  tcp::acceptor acceptor_;
  std::shared_ptr<Config const> cfg_;
  bool running_ = true;

  [[noreturn]] static void throw_error(beast::error_code ec, char const* what)
  {
    throw Exception(fmt::format("http listener {}: {}", what, ec.message()));
  }

public:
  listener(net::io_context& ioc,
           ssl::context* ctx,
           tcp::endpoint endpoint,
           std::shared_ptr<Config const> cfg)
      : ioc_(ioc)
      , ctx_(ctx)
      , acceptor_(net::make_strand(ioc))
      , cfg_(std::move(cfg))
  {
    beast::error_code ec;

    // Open the acceptor
    acceptor_.open(endpoint.protocol(), ec);
    if (ec)
      throw_error(ec, "open");

    // Allow address reuse
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec)
      throw_error(ec, "set_option");

    // Bind to the server address
    acceptor_.bind(endpoint, ec);
    if (ec)
      throw_error(ec, "bind");

    // Start listening for connections
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec)
      throw_error(ec, "listen");
  }

  // Start accepting incoming connections
  void run() { do_accept(); }

  void stop()
  {
    // Runs on the acceptor's strand, stop() may be called from any thread
    net::post(acceptor_.get_executor(), [self = shared_from_this()] {
      self->running_ = false;
      beast::error_code ec;
      self->acceptor_.cancel(ec);
      self->acceptor_.close(ec);
    });
  }

  std::uint16_t port() const noexcept
  {
    beast::error_code ec;
    auto const ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
  }

private:
  void do_accept()
  {
    if (!running_)
      return;
    // The new connection gets its own strand
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&listener::on_accept, shared_from_this()));
  }

  void on_accept(beast::error_code ec, tcp_stream_strand socket)
  {
    if (ec) {
      if (ec != net::error::operation_aborted) {
        fail(ec, "accept");
        // Transient failures such as EMFILE must not stop the listener
        do_accept();
      }
      return;
    }
    if (!running_)
      return;

    // Reap peers that vanish in the middle of a long transfer
    socket.set_option(net::socket_base::keep_alive(true), ec);

    if (ctx_) {
      // Create the detector http_session and run it
      std::make_shared<detect_session>(
          beast_tcp_stream_strand(std::move(socket)), *ctx_, cfg_)
          ->run();
    } else {
      std::make_shared<plain_http_session>(
          beast_tcp_stream_strand(std::move(socket)), beast::flat_buffer{},
          cfg_)
          ->run();
    }

    // Accept another connection
    do_accept();
  }
};

//------------------------------------------------------------------------------

HttpServer::HttpServer(net::io_context& ioc,
                       ssl::context* ctx,
                       std::shared_ptr<Config const> cfg)
{
  beast::error_code ec;
  auto const address = net::ip::make_address(cfg->listen_address, ec);
  if (ec)
    throw Exception("invalid listen address: " + cfg->listen_address);

  auto const port = cfg->http_port;

  // Create and launch a listening port
  listener_ = std::make_shared<listener>(ioc, ctx, tcp::endpoint{address, port},
                                         std::move(cfg));
  listener_->run();
  port_ = listener_->port();
}

HttpServer::~HttpServer()
{
  if (listener_)
    listener_->stop();
}

void HttpServer::stop()
{
  if (listener_) {
    listener_->stop();
    listener_.reset();
  }
}

} // namespace edgeperf::impl
