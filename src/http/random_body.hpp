// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <edgeperf/error.hpp>
#include <edgeperf/stream_producer.hpp>
#include <edgeperf/impl/common.hpp>

#include <boost/optional.hpp>

#include <cstdint>
#include <exception>
#include <utility>

#include "../logging.hpp"

namespace edgeperf::impl {

//==============================================================================
// random_body - A Beast body type that streams freshly generated random data
//==============================================================================

/// The serializer pulls one chunk per call to writer::get() and only asks
/// for the next one after the previous buffer was written to the stream,
/// which gives the producer transport backpressure for free.
struct random_body {
  /// Immutable description of the stream. The mutable cursor lives in
  /// the writer, so each serialization starts from zero.
  struct value_type {
    std::uint64_t size = 0;
    std::size_t chunk_size = 64 * 1024;
    ChunkGenerator generator;
  };

  static std::uint64_t size(value_type const& v) noexcept { return v.size; }

  class writer
  {
    StreamProducer producer_;
    Chunk current_;

  public:
    using const_buffers_type = net::const_buffer;

    template <bool isRequest, class Fields>
    explicit writer(http::header<isRequest, Fields> const&,
                    value_type const& b)
        : producer_(b.generator, b.size, b.chunk_size)
    {
    }

    // The serializer is destroyed early when the write fails, e.g. the
    // peer closed the connection. Treat that as a cancellation.
    ~writer()
    {
      if (!producer_.is_terminal()) {
        EDGEPERF_LOG_DEBUG("Stream cancelled after {} of {} bytes",
                           producer_.bytes_sent(), producer_.total_size());
        producer_.cancel();
      }
    }

    writer(writer const&) = delete;
    writer& operator=(writer const&) = delete;

    void init(boost::system::error_code& ec) { ec = {}; }

    boost::optional<std::pair<const_buffers_type, bool>>
    get(boost::system::error_code& ec)
    {
      // The previous buffer has been consumed by now, drop it before
      // allocating the next one
      current_ = Chunk{};

      try {
        auto chunk = producer_.next();
        if (!chunk) {
          ec = {};
          return boost::none;
        }
        current_ = std::move(*chunk);
      } catch (std::exception const& e) {
        EDGEPERF_LOG_ERROR("Aborting stream after {} of {} bytes: {}",
                           producer_.bytes_sent(), producer_.total_size(),
                           e.what());
        ec = error::generation_failed;
        return boost::none;
      } catch (...) {
        EDGEPERF_LOG_ERROR("Aborting stream after {} of {} bytes: unknown error",
                           producer_.bytes_sent(), producer_.total_size());
        ec = error::generation_failed;
        return boost::none;
      }

      ec = {};
      // Always report more data; the following call observes the end of
      // the stream and moves the producer to its closed state.
      return std::make_pair(
          const_buffers_type(current_.data(), current_.size()), true);
    }
  };
};

} // namespace edgeperf::impl
