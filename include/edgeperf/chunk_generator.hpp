// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <edgeperf/export.hpp>
#include <edgeperf/random_source.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace edgeperf {

/// One unit of generated data handed to the transport.
/// Owns its storage; move-only so a chunk is never shared or reused.
class Chunk
{
  std::unique_ptr<std::uint8_t[]> data_;
  std::size_t size_ = 0;

public:
  Chunk() = default;
  Chunk(std::unique_ptr<std::uint8_t[]> data, std::size_t size) noexcept
      : data_(std::move(data))
      , size_(size)
  {
  }

  Chunk(Chunk&&) noexcept = default;
  Chunk& operator=(Chunk&&) noexcept = default;
  Chunk(const Chunk&) = delete;
  Chunk& operator=(const Chunk&) = delete;

  const std::uint8_t* data() const noexcept { return data_.get(); }
  std::size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }

  std::span<const std::uint8_t> bytes() const noexcept
  {
    return {data_.get(), size_};
  }
};

class EDGEPERF_API ChunkGenerator
{
  std::shared_ptr<RandomSource> source_;

public:
  explicit ChunkGenerator(
      std::shared_ptr<RandomSource> source = default_random_source());

  /// Allocate and fill a fresh chunk of exactly `n` bytes.
  /// Throws std::invalid_argument for n == 0 and RandomSourceError
  /// when the source fails.
  Chunk generate(std::size_t n) const;

  const std::shared_ptr<RandomSource>& source() const noexcept
  {
    return source_;
  }
};

} // namespace edgeperf
