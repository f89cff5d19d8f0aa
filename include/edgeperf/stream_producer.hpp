// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <edgeperf/chunk_generator.hpp>
#include <edgeperf/export.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace edgeperf {

enum class StreamState { streaming, closed, errored, cancelled };

EDGEPERF_API std::string_view to_string(StreamState state) noexcept;

/// Pull-driven producer of a fixed-size random stream.
///
/// Each call to next() is one production step: it generates at most
/// `chunk_size` bytes, so only the chunk the caller currently holds is
/// alive no matter how large the stream is. The producer never restarts;
/// once it reaches a terminal state it yields nothing more.
class EDGEPERF_API StreamProducer
{
  ChunkGenerator generator_;
  std::uint64_t total_size_ = 0;
  std::size_t chunk_size_ = 0;
  std::uint64_t bytes_sent_ = 0;
  StreamState state_ = StreamState::streaming;

public:
  StreamProducer(ChunkGenerator generator,
                 std::uint64_t total_size,
                 std::size_t chunk_size);

  /// Produce the next chunk, or std::nullopt at end-of-stream.
  /// A generation failure moves the producer to `errored` and rethrows;
  /// pulling an errored producer throws edgeperf::Exception.
  std::optional<Chunk> next();

  /// Stop producing. No-op when already terminal.
  void cancel() noexcept;

  StreamState state() const noexcept { return state_; }
  bool is_terminal() const noexcept
  {
    return state_ != StreamState::streaming;
  }

  std::uint64_t bytes_sent() const noexcept { return bytes_sent_; }
  std::uint64_t total_size() const noexcept { return total_size_; }
  std::uint64_t remaining() const noexcept { return total_size_ - bytes_sent_; }
  std::size_t chunk_size() const noexcept { return chunk_size_; }
};

} // namespace edgeperf
