// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "request_handler.hpp"

#include <edgeperf/size_validator.hpp>

#include <fmt/format.h>

#include <string>

#include "../logging.hpp"

namespace edgeperf::impl {

namespace {

std::string const& server_string()
{
  static std::string const s = fmt::format("edgeperf/{}", version);
  return s;
}

template <class Response> void set_common_headers(Response& res)
{
  res.set(http::field::server, server_string());
  res.set(http::field::access_control_allow_origin, "*");
}

template <class Response> void set_no_cache(Response& res)
{
  res.set(http::field::cache_control,
          "no-store, no-cache, must-revalidate, max-age=0");
  res.set(http::field::pragma, "no-cache");
}

// Preflight answer for the browser client
http::response<http::empty_body> preflight(request_type const& req)
{
  http::response<http::empty_body> res{http::status::no_content,
                                       req.version()};
  set_common_headers(res);
  res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
  res.set(http::field::access_control_allow_headers, "Content-Type, Range");
  res.set(http::field::access_control_max_age, "86400"); // 24 hours
  res.keep_alive(req.keep_alive());
  return res;
}

Response handle_download(Config const& cfg,
                         request_type const& req,
                         std::string_view query)
{
  auto const raw = query_param(query, "size");
  auto const resolved = resolve_size(raw, cfg.download_limits);

  if (resolved.fell_back() && resolved.fallback != SizeFallback::missing) {
    if (cfg.strict_size) {
      return make_text_response(
          http::status::bad_request, req.version(), req.keep_alive(),
          fmt::format("Invalid size parameter '{}': {}. Expected an integer "
                      "in [{}, {}]",
                      *raw, to_string(resolved.fallback),
                      cfg.download_limits.min_size,
                      cfg.download_limits.max_size));
    }
    EDGEPERF_LOG_INFO("Invalid or out-of-range size parameter '{}' ({}). "
                      "Using default size {}",
                      *raw, to_string(resolved.fallback), resolved.size);
  }

  auto const set_download_headers = [&](auto& res) {
    set_common_headers(res);
    set_no_cache(res);
    res.set(http::field::content_type, "application/octet-stream");
    res.set(http::field::access_control_allow_methods, "GET, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
    res.content_length(resolved.size);
    res.keep_alive(req.keep_alive());
  };

  if (req.method() == http::verb::head) {
    http::response<http::empty_body> res{http::status::ok, req.version()};
    set_download_headers(res);
    return res;
  }

  auto source = cfg.random_source ? cfg.random_source : default_random_source();

  http::response<random_body> res{
      http::status::ok, req.version(),
      random_body::value_type{resolved.size, cfg.chunk_size,
                              ChunkGenerator(std::move(source))}};
  set_download_headers(res);

  EDGEPERF_LOG_DEBUG("Download: streaming {} bytes in chunks of {}",
                     resolved.size, cfg.chunk_size);
  return res;
}

Response handle_upload(request_type const& req)
{
  auto const received = req.body().received;
  EDGEPERF_LOG_DEBUG("Upload: drained {} bytes", received);

  auto res = make_text_response(http::status::ok, req.version(),
                                req.keep_alive(), "ok");
  res.set("X-Bytes-Received", std::to_string(received));
  res.set(http::field::access_control_expose_headers, "X-Bytes-Received");
  return res;
}

Response handle_ping(request_type const& req)
{
  if (req.method() == http::verb::head) {
    http::response<http::empty_body> res{http::status::ok, req.version()};
    set_common_headers(res);
    set_no_cache(res);
    res.set(http::field::content_type, "text/plain");
    res.content_length(4);
    res.keep_alive(req.keep_alive());
    return res;
  }
  return make_text_response(http::status::ok, req.version(),
                            req.keep_alive(), "pong");
}

bool method_allowed(Route route, http::verb method) noexcept
{
  switch (route) {
  case Route::download:
  case Route::ping:
    return method == http::verb::get || method == http::verb::head;
  case Route::upload:
    return method == http::verb::post;
  default:
    return false;
  }
}

} // namespace

http::response<http::string_body> make_text_response(http::status status,
                                                     unsigned version,
                                                     bool keep_alive,
                                                     std::string body)
{
  http::response<http::string_body> res{status, version};
  set_common_headers(res);
  set_no_cache(res);
  res.set(http::field::content_type, "text/plain");
  res.keep_alive(keep_alive);
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

std::uint64_t body_limit_for(Config const& cfg,
                             http::verb method,
                             std::string_view target) noexcept
{
  if (method == http::verb::post &&
      match_route(split_target(target).path, cfg.api_prefix) == Route::upload)
    return cfg.upload_max_size;
  return cfg.request_body_limit;
}

Response handle_request(Config const& cfg, request_type const& req)
{
  auto const target = split_target(req.target());
  auto const route = match_route(target.path, cfg.api_prefix);

  if (req.method() == http::verb::unknown)
    return make_text_response(http::status::bad_request, req.version(),
                              req.keep_alive(), "Unknown HTTP-method");

  if (route == Route::unknown)
    return make_text_response(
        http::status::not_found, req.version(), req.keep_alive(),
        "The resource '" + std::string(target.path) + "' was not found.");

  if (req.method() == http::verb::options)
    return preflight(req);

  if (!method_allowed(route, req.method())) {
    auto res = make_text_response(http::status::method_not_allowed,
                                  req.version(), req.keep_alive(),
                                  "Method not allowed");
    res.set(http::field::allow, allowed_methods(route));
    return res;
  }

  switch (route) {
  case Route::download:
    return handle_download(cfg, req, target.query);
  case Route::upload:
    return handle_upload(req);
  case Route::ping:
    return handle_ping(req);
  default:
    break;
  }

  return make_text_response(http::status::internal_server_error,
                            req.version(), req.keep_alive(),
                            "Unhandled route");
}

} // namespace edgeperf::impl
