// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <edgeperf/config.hpp>
#include <edgeperf/impl/common.hpp>

#include <memory>

namespace edgeperf::impl {

class listener;

/// Accepts connections and runs one HTTP session per connection.
/// TLS and plain HTTP share the port when an SSL context is supplied.
class HttpServer
{
  std::shared_ptr<listener> listener_;
  std::uint16_t port_ = 0;

public:
  /// Throws edgeperf::Exception when the endpoint cannot be bound.
  /// `ctx` may be null, in which case only plain HTTP is served.
  HttpServer(net::io_context& ioc,
             ssl::context* ctx,
             std::shared_ptr<Config const> cfg);
  ~HttpServer();

  std::uint16_t port() const noexcept { return port_; }
  void stop();
};

} // namespace edgeperf::impl
