// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <edgeperf/server.hpp>

#include <boost/asio/signal_set.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <iostream>
#include <thread>
#include <vector>

#include "logging.hpp"

int main(int argc, char* argv[])
{
  namespace po = boost::program_options;

  edgeperf::Config defaults;

  std::string address;
  std::uint16_t port;
  edgeperf::SizeLimits limits;
  std::size_t chunk_size;
  std::uint64_t upload_max;
  bool strict_size;
  std::string prefix;
  std::string cert_file;
  std::string key_file;
  unsigned header_timeout;
  std::string log_level;
  unsigned threads;

  po::options_description desc("Allowed options");
  desc.add_options()
    ("help", "produce help message")
    ("address", po::value(&address)->default_value(defaults.listen_address), "Listen address")
    ("port", po::value(&port)->default_value(defaults.http_port), "Listen port, 0 picks a free one")
    ("min-size", po::value(&limits.min_size)->default_value(limits.min_size), "Smallest accepted download size in bytes")
    ("default-size", po::value(&limits.default_size)->default_value(limits.default_size), "Download size used when the requested one is missing or invalid")
    ("max-size", po::value(&limits.max_size)->default_value(limits.max_size), "Largest accepted download size in bytes")
    ("chunk-size", po::value(&chunk_size)->default_value(defaults.chunk_size), "Bytes generated per download chunk")
    ("upload-max", po::value(&upload_max)->default_value(defaults.upload_max_size), "Largest accepted upload body in bytes")
    ("strict", po::bool_switch(&strict_size)->default_value(false), "Reject invalid sizes with 400 instead of falling back")
    ("prefix", po::value(&prefix)->default_value(""), "Path prefix of the API, e.g. /api")
    ("cert", po::value(&cert_file), "TLS certificate chain (PEM)")
    ("key", po::value(&key_file), "TLS private key (PEM)")
    ("header-timeout", po::value(&header_timeout)->default_value(static_cast<unsigned>(defaults.header_timeout.count())), "Seconds to wait for request headers")
    ("log-level", po::value(&log_level)->default_value("info"), "trace, debug, info, warn, error, critical or off")
    ("threads", po::value(&threads)->default_value(1), "Number of I/O threads")
    ;

  try {
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
      std::cout << desc << "\n";
      return 0;
    }
  } catch (po::error& e) {
    std::cerr << e.what() << '\n' << desc << '\n';
    return 1;
  }

  try {
    boost::asio::io_context ioc;

    auto server = edgeperf::ServerBuilder()
                      .set_log_level(edgeperf::impl::parse_log_level(log_level))
                      .with_listen_address(address)
                      .with_http(port)
                      .with_size_limits(limits)
                      .with_chunk_size(chunk_size)
                      .with_upload_limit(upload_max)
                      .with_strict_size(strict_size)
                      .with_api_prefix(prefix)
                      .with_ssl(cert_file, key_file)
                      .with_header_timeout(std::chrono::seconds(header_timeout))
                      .build(ioc);

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](boost::beast::error_code const&, int) {
      server->stop();
      ioc.stop();
    });

    std::vector<std::thread> pool;
    for (unsigned i = 1; i < threads; ++i)
      pool.emplace_back([&ioc] { ioc.run(); });
    ioc.run();

    for (auto& t : pool)
      t.join();
  } catch (std::exception const& e) {
    fmt::print(stderr, "edgeperf_server failed: {}\n", e.what());
    return 1;
  }

  return 0;
}
