// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <edgeperf/client.hpp>

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <iostream>
#include <optional>

int main(int argc, char* argv[])
{
  namespace po = boost::program_options;

  std::string host;
  std::uint16_t port;
  std::string prefix;
  std::size_t ping_count;
  unsigned ping_interval;
  std::uint64_t download_size;
  std::uint64_t upload_size;
  bool skip_ping, skip_download, skip_upload;

  po::options_description desc("Allowed options");
  desc.add_options()
    ("help", "produce help message")
    ("host", po::value(&host)->default_value("127.0.0.1"), "Server host")
    ("port", po::value(&port)->default_value(8080), "Server port")
    ("prefix", po::value(&prefix)->default_value(""), "Path prefix of the API, e.g. /api")
    ("pings", po::value(&ping_count)->default_value(5), "Number of latency pings")
    ("ping-interval", po::value(&ping_interval)->default_value(200), "Milliseconds between pings")
    ("download-size", po::value(&download_size)->default_value(0), "Bytes to download, 0 uses the server default")
    ("upload-size", po::value(&upload_size)->default_value(5 * edgeperf::MiB), "Bytes to upload")
    ("no-ping", po::bool_switch(&skip_ping), "Skip the latency test")
    ("no-download", po::bool_switch(&skip_download), "Skip the download test")
    ("no-upload", po::bool_switch(&skip_upload), "Skip the upload test")
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
    edgeperf::SpeedTestClient client(ioc, host, port, prefix);

    if (!skip_ping) {
      auto const r =
          client.ping(ping_count, std::chrono::milliseconds(ping_interval));
      fmt::print("Ping:     {:.2f} ms (min {:.2f}, max {:.2f}, jitter {:.2f}, "
                 "{} of {} ok)\n",
                 r.avg_ms, r.min_ms, r.max_ms, r.jitter_ms, r.samples,
                 r.samples + r.failures);
    }

    if (!skip_download) {
      auto const r = client.download(
          download_size ? std::optional<std::uint64_t>(download_size)
                        : std::nullopt);
      fmt::print("Download: {:.2f} Mbps ({} bytes in {:.3f} s)\n", r.mbps(),
                 r.bytes, r.seconds);
    }

    if (!skip_upload) {
      auto const r = client.upload(upload_size);
      fmt::print("Upload:   {:.2f} Mbps ({} bytes in {:.3f} s)\n", r.mbps(),
                 r.bytes, r.seconds);
    }
  } catch (std::exception const& e) {
    fmt::print(stderr, "edgeperf_client failed: {}\n", e.what());
    return 1;
  }

  return 0;
}
