// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <edgeperf/export.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace edgeperf {

inline constexpr std::uint64_t KiB = 1024;
inline constexpr std::uint64_t MiB = 1024 * KiB;

/// Bounds applied to a client supplied transfer size.
struct SizeLimits {
  std::uint64_t min_size = 1 * KiB;
  std::uint64_t default_size = 10 * MiB;
  std::uint64_t max_size = 250 * MiB;

  /// Throws edgeperf::Exception unless 0 < min <= default <= max.
  EDGEPERF_API void validate() const;

  bool contains(std::uint64_t size) const noexcept
  {
    return size >= min_size && size <= max_size;
  }
};

/// Why a requested size was replaced by the default.
enum class SizeFallback { none, missing, not_a_number, out_of_range };

EDGEPERF_API std::string_view to_string(SizeFallback reason) noexcept;

struct SizeResolution {
  std::uint64_t size;
  SizeFallback fallback = SizeFallback::none;

  bool fell_back() const noexcept { return fallback != SizeFallback::none; }
};

/// Resolve an untrusted `size` parameter against `limits`.
/// Never fails: anything absent, non-numeric or out of bounds resolves
/// to `limits.default_size` and records the reason.
EDGEPERF_API SizeResolution
resolve_size(std::optional<std::string_view> raw, SizeLimits const& limits);

} // namespace edgeperf
