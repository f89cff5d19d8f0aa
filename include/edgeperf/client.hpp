// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <edgeperf/chunk_generator.hpp>
#include <edgeperf/export.hpp>
#include <edgeperf/size_validator.hpp>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace edgeperf {

struct LatencyResult {
  std::size_t samples = 0;
  std::size_t failures = 0;
  double min_ms = 0;
  double avg_ms = 0;
  double max_ms = 0;
  // Mean absolute difference between consecutive samples
  double jitter_ms = 0;
};

struct ThroughputResult {
  std::uint64_t bytes = 0;
  double seconds = 0;

  double mbps() const noexcept
  {
    return seconds > 0 ? static_cast<double>(bytes) * 8 / seconds / 1e6 : 0;
  }
};

/// Synchronous client for the measurement endpoint (plain HTTP).
/// Timing is done here, the server only moves bytes.
class EDGEPERF_API SpeedTestClient
{
  class Impl;
  std::unique_ptr<Impl> impl_;

public:
  SpeedTestClient(boost::asio::io_context& ioc,
                  std::string host,
                  std::uint16_t port,
                  std::string api_prefix = {},
                  ChunkGenerator generator = ChunkGenerator());
  ~SpeedTestClient();

  SpeedTestClient(SpeedTestClient&&) noexcept;
  SpeedTestClient& operator=(SpeedTestClient&&) noexcept;

  /// Round trip `count` pings over one warm connection.
  /// Throws edgeperf::Exception when every ping failed.
  LatencyResult
  ping(std::size_t count = 5,
       std::chrono::milliseconds interval = std::chrono::milliseconds(200));

  /// Download and discard a stream. Without `size` the server default is
  /// used. Throws when the body is shorter than the declared length.
  ThroughputResult download(std::optional<std::uint64_t> size = std::nullopt);

  /// Stream `size` random bytes to the upload sink.
  /// Throws when the server does not acknowledge with a 2xx status.
  ThroughputResult upload(std::uint64_t size = 5 * MiB);
};

} // namespace edgeperf
