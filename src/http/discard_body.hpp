// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <edgeperf/impl/common.hpp>

#include <boost/optional.hpp>

#include <cstdint>

namespace edgeperf::impl {

//==============================================================================
// discard_body - A Beast body type that counts incoming octets and drops them
//==============================================================================

/// Request body for the upload sink. The payload is never stored; the
/// value counts the body bytes received so far and starts at zero for
/// every message, including those without a body. Size limits are
/// enforced by the parser's body_limit.
struct discard_body {
  struct value_type {
    std::uint64_t received = 0;
  };

  static std::uint64_t size(value_type const& v) noexcept
  {
    return v.received;
  }

  class reader
  {
    value_type& received_;

  public:
    template <bool isRequest, class Fields>
    explicit reader(http::header<isRequest, Fields>&, value_type& b)
        : received_(b)
    {
    }

    void init(boost::optional<std::uint64_t> const&,
              boost::system::error_code& ec)
    {
      received_.received = 0;
      ec = {};
    }

    template <class ConstBufferSequence>
    std::size_t put(ConstBufferSequence const& buffers,
                    boost::system::error_code& ec)
    {
      auto const n = net::buffer_size(buffers);
      received_.received += n;
      ec = {};
      return n;
    }

    void finish(boost::system::error_code& ec) { ec = {}; }
  };
};

} // namespace edgeperf::impl
