// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

namespace edgeperf::impl {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;

using tcp = net::ip::tcp;
using error_code = boost::system::error_code;

using tcp_stream_strand = net::basic_stream_socket<
  net::ip::tcp, net::strand<net::io_context::executor_type>>;

using beast_tcp_stream_strand = beast::basic_stream<
  net::ip::tcp, net::strand<net::io_context::executor_type>>;

using ssl_stream = beast::ssl_stream<beast_tcp_stream_strand>;

// Report a failure. Peer disconnects are logged at debug level only.
void fail(beast::error_code ec, char const* what);

// Whether `ec` means the peer went away rather than a server side fault
bool is_disconnect(beast::error_code const& ec) noexcept;

} // namespace edgeperf::impl
