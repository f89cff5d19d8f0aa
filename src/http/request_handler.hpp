// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <edgeperf/config.hpp>
#include <edgeperf/impl/common.hpp>
#include <edgeperf/impl/http_utils.hpp>

#include <variant>

#include "discard_body.hpp"
#include "random_body.hpp"

namespace edgeperf::impl {

using request_type = http::request<discard_body>;

/// Every response the endpoint can produce. The session writes whichever
/// alternative the handler picked.
using Response = std::variant<http::response<http::string_body>,
                              http::response<http::empty_body>,
                              http::response<random_body>>;

/// Produce the response for a fully read request.
Response handle_request(Config const& cfg, request_type const& req);

/// Plain text response carrying the common headers.
http::response<http::string_body> make_text_response(http::status status,
                                                     unsigned version,
                                                     bool keep_alive,
                                                     std::string body);

/// Largest body accepted for a request whose header has been read.
std::uint64_t body_limit_for(Config const& cfg,
                             http::verb method,
                             std::string_view target) noexcept;

} // namespace edgeperf::impl
