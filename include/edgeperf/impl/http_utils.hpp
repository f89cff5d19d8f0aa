// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace edgeperf::impl {

enum class Route { download, upload, ping, unknown };

struct RequestTarget {
  std::string_view path;
  std::string_view query;
};

/// Split "/path?query" into its path and query parts (query may be empty).
RequestTarget split_target(std::string_view target) noexcept;

/// Decode a form-encoded query component: "%XX" escapes and '+' as space.
std::string url_decode(std::string_view s);

/// Decoded value of the first `name` parameter in a query string.
/// A parameter given without '=' yields an empty value.
std::optional<std::string> query_param(std::string_view query,
                                       std::string_view name);

/// Map a request path to a route. `prefix` is the mount point of the API
/// ("" or e.g. "/api"); a single trailing slash on the path is ignored.
Route match_route(std::string_view path, std::string_view prefix) noexcept;

/// Value for the Allow header of a route.
std::string_view allowed_methods(Route route) noexcept;

/// Normalize an API prefix: "" stays empty, "api/" becomes "/api".
std::string normalize_prefix(std::string_view prefix);

} // namespace edgeperf::impl
