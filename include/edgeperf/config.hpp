// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <edgeperf/random_source.hpp>
#include <edgeperf/size_validator.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace edgeperf {

inline constexpr std::string_view version = "1.0.0";

enum class LogLevel {
  trace = 0,
  debug = 1,
  info = 2,
  warn = 3,
  error = 4,
  critical = 5,
  off = 6
};

struct Config {
  std::string               listen_address     = "0.0.0.0";
  std::uint16_t             http_port          = 8080; // 0 picks an ephemeral port
  SizeLimits                download_limits;
  std::size_t               chunk_size         = 64 * KiB;
  std::uint64_t             upload_max_size    = 100 * MiB;
  std::uint64_t             request_body_limit = 8 * KiB; // non-upload routes
  bool                      strict_size        = false;   // 400 on a bad size instead of falling back
  std::string               api_prefix;                   // e.g. "/api"
  std::string               cert_file;                    // TLS is enabled when both are set
  std::string               key_file;
  std::chrono::seconds      header_timeout{30};
  LogLevel                  log_level          = LogLevel::info;
  std::shared_ptr<RandomSource> random_source;            // defaults to OpenSSL

  bool ssl_enabled() const noexcept
  {
    return !cert_file.empty() && !key_file.empty();
  }
};

// Upper bound for a single chunk, keeps per-stream memory predictable
inline constexpr std::size_t max_chunk_size = 16 * MiB;

} // namespace edgeperf
