// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <edgeperf/exception.hpp>
#include <edgeperf/size_validator.hpp>

#include <fmt/format.h>

#include <charconv>
#include <system_error>

namespace edgeperf {

void SizeLimits::validate() const
{
  if (min_size == 0)
    throw Exception("minimum transfer size must be positive");
  if (min_size > max_size)
    throw Exception(fmt::format(
        "minimum transfer size {} exceeds the maximum {}", min_size, max_size));
  if (!contains(default_size))
    throw Exception(
        fmt::format("default transfer size {} is outside [{}, {}]",
                    default_size, min_size, max_size));
}

EDGEPERF_API std::string_view to_string(SizeFallback reason) noexcept
{
  switch (reason) {
  case SizeFallback::none:
    return "none";
  case SizeFallback::missing:
    return "missing";
  case SizeFallback::not_a_number:
    return "not a number";
  case SizeFallback::out_of_range:
    return "out of range";
  }
  return "unknown";
}

EDGEPERF_API SizeResolution
resolve_size(std::optional<std::string_view> raw, SizeLimits const& limits)
{
  if (!raw || raw->empty())
    return {limits.default_size, SizeFallback::missing};

  std::uint64_t value = 0;
  auto const first = raw->data();
  auto const last = raw->data() + raw->size();
  auto const [ptr, ec] = std::from_chars(first, last, value, 10);

  // Digits that do not fit in 64 bits are certainly above the maximum
  if (ec == std::errc::result_out_of_range && ptr == last)
    return {limits.default_size, SizeFallback::out_of_range};
  if (ec != std::errc{} || ptr != last)
    return {limits.default_size, SizeFallback::not_a_number};
  if (!limits.contains(value))
    return {limits.default_size, SizeFallback::out_of_range};

  return {value, SizeFallback::none};
}

} // namespace edgeperf
