// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <edgeperf/export.hpp>

#include <boost/system/error_code.hpp>

#include <type_traits>

namespace edgeperf {

/// Error codes reported to the transport by the streaming bodies.
enum class error {
  /// The random source failed while producing a chunk.
  /// The response must be aborted, never completed.
  generation_failed = 1,
};

EDGEPERF_API boost::system::error_category const& error_category() noexcept;

inline boost::system::error_code make_error_code(error e) noexcept
{
  return {static_cast<int>(e), error_category()};
}

} // namespace edgeperf

namespace boost::system {
template <> struct is_error_code_enum<::edgeperf::error> {
  static bool const value = true;
};
} // namespace boost::system
