// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <edgeperf/client.hpp>
#include <edgeperf/config.hpp>
#include <edgeperf/exception.hpp>
#include <edgeperf/impl/common.hpp>
#include <edgeperf/impl/http_utils.hpp>

#include <boost/beast/http/buffer_body.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <thread>
#include <vector>

#include "http/random_body.hpp"
#include "logging.hpp"

namespace edgeperf {

using namespace impl;

namespace {

constexpr std::size_t receive_buffer_size = 64 * 1024;

using steady_clock = std::chrono::steady_clock;

double seconds_since(steady_clock::time_point start)
{
  return std::chrono::duration<double>(steady_clock::now() - start).count();
}

} // namespace

class SpeedTestClient::Impl
{
  net::io_context& ioc_;
  std::string host_;
  std::uint16_t port_;
  std::string prefix_;
  ChunkGenerator generator_;

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  bool connected_ = false;

  std::mt19937_64 rng_{std::random_device{}()};
  std::unique_ptr<char[]> receive_buffer_ =
      std::make_unique_for_overwrite<char[]>(receive_buffer_size);

  void connect()
  {
    if (connected_)
      return;
    tcp::resolver resolver(ioc_);
    auto const results = resolver.resolve(host_, std::to_string(port_));
    stream_.connect(results);
    stream_.socket().set_option(tcp::no_delay(true));
    connected_ = true;
  }

  void close() noexcept
  {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream_.close();
    buffer_.clear();
    connected_ = false;
  }

  // Appends a cache buster so no intermediary can answer from a cache
  std::string target(std::string_view route, std::string const& query = {})
  {
    return fmt::format("{}{}?{}{}r={}", prefix_, route, query,
                       query.empty() ? "" : "&", rng_());
  }

  template <class Message> void set_headers(Message& msg)
  {
    msg.set(http::field::host, host_);
    msg.set(http::field::user_agent, fmt::format("edgeperf/{}", version));
    msg.set(http::field::cache_control, "no-store");
  }

  double ping_once()
  {
    connect();

    http::request<http::empty_body> req{http::verb::get, target("/ping"), 11};
    set_headers(req);

    auto const start = steady_clock::now();
    http::write(stream_, req);

    http::response<http::string_body> res;
    http::read(stream_, buffer_, res);
    auto const elapsed = seconds_since(start);

    if (res.result() != http::status::ok)
      throw Exception(fmt::format("ping failed with status {}",
                                  res.result_int()));
    if (!res.keep_alive())
      close();

    return elapsed * 1000;
  }

public:
  Impl(net::io_context& ioc,
       std::string host,
       std::uint16_t port,
       std::string api_prefix,
       ChunkGenerator generator)
      : ioc_(ioc)
      , host_(std::move(host))
      , port_(port)
      , prefix_(std::move(api_prefix))
      , generator_(std::move(generator))
      , stream_(ioc)
  {
  }

  ~Impl() { close(); }

  LatencyResult ping(std::size_t count, std::chrono::milliseconds interval)
  {
    std::vector<double> samples;
    LatencyResult result;

    for (std::size_t i = 0; i < count; ++i) {
      if (i != 0)
        std::this_thread::sleep_for(interval);
      try {
        samples.push_back(ping_once());
      } catch (std::exception const& e) {
        EDGEPERF_LOG_WARN("Ping request failed: {}", e.what());
        ++result.failures;
        close();
      }
    }

    if (samples.empty())
      throw Exception("ping failed: no request succeeded");

    result.samples = samples.size();
    result.min_ms = *std::min_element(samples.begin(), samples.end());
    result.max_ms = *std::max_element(samples.begin(), samples.end());

    double sum = 0;
    for (auto s : samples)
      sum += s;
    result.avg_ms = sum / samples.size();

    if (samples.size() > 1) {
      double jitter = 0;
      for (std::size_t i = 1; i < samples.size(); ++i)
        jitter += std::abs(samples[i] - samples[i - 1]);
      result.jitter_ms = jitter / (samples.size() - 1);
    }
    return result;
  }

  ThroughputResult download(std::optional<std::uint64_t> size)
  {
    connect();

    http::request<http::empty_body> req{
        http::verb::get,
        target("/download", size ? fmt::format("size={}", *size) : ""), 11};
    set_headers(req);

    auto const start = steady_clock::now();
    http::write(stream_, req);

    http::response_parser<http::buffer_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    http::read_header(stream_, buffer_, parser);

    if (parser.get().result() != http::status::ok) {
      close();
      throw Exception(fmt::format("download failed with status {}",
                                  parser.get().result_int()));
    }

    auto const declared = parser.content_length();
    std::uint64_t received = 0;

    // Read the body piecewise, nothing beyond one buffer is kept
    while (!parser.is_done()) {
      auto& body = parser.get().body();
      body.data = receive_buffer_.get();
      body.size = receive_buffer_size;

      beast::error_code ec;
      http::read(stream_, buffer_, parser, ec);
      if (ec == http::error::need_buffer)
        ec = {};

      received += receive_buffer_size - parser.get().body().size;

      if (ec) {
        close();
        throw Exception(fmt::format("download interrupted after {} bytes: {}",
                                    received, ec.message()));
      }
    }

    ThroughputResult result{received, seconds_since(start)};

    if (declared && received != *declared) {
      close();
      throw Exception(fmt::format("download truncated: {} of {} bytes",
                                  received, *declared));
    }
    if (!parser.get().keep_alive())
      close();

    return result;
  }

  ThroughputResult upload(std::uint64_t size)
  {
    connect();

    http::request<random_body> req{
        http::verb::post, target("/upload"), 11,
        random_body::value_type{size, receive_buffer_size, generator_}};
    set_headers(req);
    req.set(http::field::content_type, "application/octet-stream");
    req.prepare_payload();

    auto const start = steady_clock::now();

    beast::error_code write_ec;
    http::write(stream_, req, write_ec);

    // A rejected upload is answered before the body is drained, so try to
    // read the status even when the write was cut short
    http::response<http::string_body> res;
    beast::error_code read_ec;
    http::read(stream_, buffer_, res, read_ec);
    auto const elapsed = seconds_since(start);

    if (read_ec) {
      close();
      auto const& ec = write_ec ? write_ec : read_ec;
      throw Exception("upload failed: " + ec.message());
    }

    if (http::to_status_class(res.result()) !=
        http::status_class::successful) {
      close();
      throw Exception(fmt::format("upload rejected with status {} {}",
                                  res.result_int(), res.reason()));
    }

    if (write_ec) {
      close();
      throw Exception("upload failed: " + write_ec.message());
    }

    auto const ack = res.find("X-Bytes-Received");
    if (ack != res.end() && ack->value() != std::to_string(size)) {
      close();
      throw Exception(fmt::format("upload acknowledged {} of {} bytes",
                                  ack->value(), size));
    }

    if (!res.keep_alive())
      close();

    return {size, elapsed};
  }
};

SpeedTestClient::SpeedTestClient(boost::asio::io_context& ioc,
                                 std::string host,
                                 std::uint16_t port,
                                 std::string api_prefix,
                                 ChunkGenerator generator)
    : impl_(std::make_unique<Impl>(ioc, std::move(host), port,
                                   normalize_prefix(api_prefix),
                                   std::move(generator)))
{
}

SpeedTestClient::~SpeedTestClient() = default;

SpeedTestClient::SpeedTestClient(SpeedTestClient&&) noexcept = default;
SpeedTestClient&
SpeedTestClient::operator=(SpeedTestClient&&) noexcept = default;

LatencyResult SpeedTestClient::ping(std::size_t count,
                                    std::chrono::milliseconds interval)
{
  return impl_->ping(count, interval);
}

ThroughputResult SpeedTestClient::download(std::optional<std::uint64_t> size)
{
  return impl_->download(size);
}

ThroughputResult SpeedTestClient::upload(std::uint64_t size)
{
  return impl_->upload(size);
}

} // namespace edgeperf
