// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <edgeperf/export.hpp>

#include <cstdint>
#include <memory>
#include <span>

namespace edgeperf {

/// Fills buffers with unpredictable bytes.
/// Implementations must be safe to call concurrently from several
/// in-flight streams and must not keep per-caller state.
class RandomSource
{
public:
  virtual ~RandomSource() = default;

  /// Fill `out` completely or throw RandomSourceError.
  virtual void fill(std::span<std::uint8_t> out) = 0;
};

/// Cryptographically strong source backed by OpenSSL's RAND_bytes.
class EDGEPERF_API OpenSslRandomSource final : public RandomSource
{
public:
  void fill(std::span<std::uint8_t> out) override;
};

/// Process-wide default source shared by all streams.
EDGEPERF_API std::shared_ptr<RandomSource> default_random_source();

} // namespace edgeperf
