// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <edgeperf/impl/common.hpp>
#include <edgeperf/impl/http_utils.hpp>

#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>

#include "../logging.hpp"

namespace edgeperf::impl {

bool is_disconnect(beast::error_code const& ec) noexcept
{
  return ec == net::error::eof || ec == net::error::connection_reset ||
         ec == net::error::broken_pipe ||
         ec == net::error::operation_aborted ||
         ec == http::error::end_of_stream ||
         ec == http::error::partial_message || ec == beast::error::timeout ||
         ec == ssl::error::stream_truncated;
}

void fail(beast::error_code ec, char const* what)
{
  if (is_disconnect(ec)) {
    EDGEPERF_LOG_DEBUG("{}: {}", what, ec.message());
    return;
  }
  EDGEPERF_LOG_ERROR("{}: {}", what, ec.message());
}

RequestTarget split_target(std::string_view target) noexcept
{
  auto const pos = target.find('?');
  if (pos == std::string_view::npos)
    return {target, {}};
  return {target.substr(0, pos), target.substr(pos + 1)};
}

namespace {

int hex_value(char c) noexcept
{
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

std::string url_decode(std::string_view s)
{
  std::string result;
  result.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    auto const c = s[i];
    if (c == '+') {
      result.push_back(' ');
      continue;
    }
    if (c == '%' && i + 2 < s.size()) {
      auto const hi = hex_value(s[i + 1]);
      auto const lo = hex_value(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        result.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    // Malformed escapes are kept as they are
    result.push_back(c);
  }
  return result;
}

std::optional<std::string> query_param(std::string_view query,
                                       std::string_view name)
{
  while (!query.empty()) {
    auto const amp = query.find('&');
    auto const pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{}
                                          : query.substr(amp + 1);

    auto const eq = pair.find('=');
    if (url_decode(pair.substr(0, eq)) != name)
      continue;
    if (eq == std::string_view::npos)
      return std::string{};
    return url_decode(pair.substr(eq + 1));
  }
  return std::nullopt;
}

Route match_route(std::string_view path, std::string_view prefix) noexcept
{
  if (!prefix.empty()) {
    if (!path.starts_with(prefix))
      return Route::unknown;
    path.remove_prefix(prefix.size());
  }

  if (path.size() > 1 && path.back() == '/')
    path.remove_suffix(1);

  if (path == "/download")
    return Route::download;
  if (path == "/upload")
    return Route::upload;
  if (path == "/ping")
    return Route::ping;
  return Route::unknown;
}

std::string_view allowed_methods(Route route) noexcept
{
  switch (route) {
  case Route::download:
  case Route::ping:
    return "GET, HEAD, OPTIONS";
  case Route::upload:
    return "POST, OPTIONS";
  default:
    return "";
  }
}

std::string normalize_prefix(std::string_view prefix)
{
  std::string result;
  while (!prefix.empty() && prefix.back() == '/')
    prefix.remove_suffix(1);
  if (prefix.empty())
    return result;
  if (prefix.front() != '/')
    result.push_back('/');
  result.append(prefix);
  return result;
}

} // namespace edgeperf::impl
