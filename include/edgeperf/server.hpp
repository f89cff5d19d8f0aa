// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <edgeperf/config.hpp>
#include <edgeperf/export.hpp>

#include <boost/asio/io_context.hpp>

#include <memory>

namespace edgeperf {

/// Running measurement endpoint. Sessions execute on the io_context
/// the server was built with; the caller owns running that context.
class Server
{
public:
  virtual ~Server() = default;

  /// Port the listener is bound to (resolved when configured as 0).
  virtual std::uint16_t port() const noexcept = 0;

  virtual Config const& config() const noexcept = 0;

  /// Stop accepting connections. In-flight sessions finish or are
  /// torn down when the io_context stops.
  virtual void stop() = 0;
};

class ServerBuilder
{
  Config cfg_;

public:
  ServerBuilder& set_log_level(LogLevel level) noexcept
  {
    cfg_.log_level = level;
    return *this;
  }

  ServerBuilder& with_listen_address(std::string address)
  {
    cfg_.listen_address = std::move(address);
    return *this;
  }

  ServerBuilder& with_http(std::uint16_t port) noexcept
  {
    cfg_.http_port = port;
    return *this;
  }

  ServerBuilder& with_size_limits(SizeLimits limits) noexcept
  {
    cfg_.download_limits = limits;
    return *this;
  }

  ServerBuilder& with_chunk_size(std::size_t chunk_size) noexcept
  {
    cfg_.chunk_size = chunk_size;
    return *this;
  }

  ServerBuilder& with_upload_limit(std::uint64_t max_size) noexcept
  {
    cfg_.upload_max_size = max_size;
    return *this;
  }

  ServerBuilder& with_strict_size(bool strict = true) noexcept
  {
    cfg_.strict_size = strict;
    return *this;
  }

  ServerBuilder& with_api_prefix(std::string prefix)
  {
    cfg_.api_prefix = std::move(prefix);
    return *this;
  }

  ServerBuilder& with_ssl(std::string cert_file, std::string key_file)
  {
    cfg_.cert_file = std::move(cert_file);
    cfg_.key_file = std::move(key_file);
    return *this;
  }

  ServerBuilder& with_header_timeout(std::chrono::seconds timeout) noexcept
  {
    cfg_.header_timeout = timeout;
    return *this;
  }

  ServerBuilder& with_random_source(std::shared_ptr<RandomSource> source)
  {
    cfg_.random_source = std::move(source);
    return *this;
  }

  Config const& config() const noexcept { return cfg_; }

  /// Validate the configuration, bind the listener and start accepting.
  /// Throws edgeperf::Exception on invalid configuration or bind failure.
  EDGEPERF_API std::unique_ptr<Server> build(boost::asio::io_context& ioc);
};

} // namespace edgeperf
