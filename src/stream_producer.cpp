// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <edgeperf/exception.hpp>
#include <edgeperf/stream_producer.hpp>

#include <algorithm>
#include <stdexcept>

namespace edgeperf {

EDGEPERF_API std::string_view to_string(StreamState state) noexcept
{
  switch (state) {
  case StreamState::streaming:
    return "streaming";
  case StreamState::closed:
    return "closed";
  case StreamState::errored:
    return "errored";
  case StreamState::cancelled:
    return "cancelled";
  }
  return "unknown";
}

StreamProducer::StreamProducer(ChunkGenerator generator,
                               std::uint64_t total_size,
                               std::size_t chunk_size)
    : generator_(std::move(generator))
    , total_size_(total_size)
    , chunk_size_(chunk_size)
{
  if (chunk_size_ == 0)
    throw std::invalid_argument("stream chunk size must be positive");
}

std::optional<Chunk> StreamProducer::next()
{
  switch (state_) {
  case StreamState::closed:
  case StreamState::cancelled:
    return std::nullopt;
  case StreamState::errored:
    throw Exception("stream producer is in the errored state");
  case StreamState::streaming:
    break;
  }

  if (bytes_sent_ >= total_size_) {
    state_ = StreamState::closed;
    return std::nullopt;
  }

  auto const step =
      static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size_, remaining()));

  try {
    auto chunk = generator_.generate(step);
    bytes_sent_ += step;
    return chunk;
  } catch (...) {
    state_ = StreamState::errored;
    throw;
  }
}

void StreamProducer::cancel() noexcept
{
  if (state_ == StreamState::streaming)
    state_ = StreamState::cancelled;
}

} // namespace edgeperf
