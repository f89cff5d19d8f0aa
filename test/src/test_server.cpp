#include <algorithm>
#include <array>
#include <limits>
#include <optional>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <edgeperf/client.hpp>
#include <edgeperf/exception.hpp>
#include <edgeperf/server.hpp>

#include "common/sources.hpp"

using namespace edgeperf;
using namespace edgeperftest;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

struct DownloadResult {
  unsigned status = 0;
  std::optional<std::uint64_t> content_length;
  std::uint64_t received = 0;
  std::string head; // first bytes of the body
  beast::error_code ec;
};

class EdgeperfServerTest : public ::testing::Test
{
protected:
  net::io_context ioc_;
  std::unique_ptr<Server> server_;
  std::thread thread_;

  void start(ServerBuilder builder = ServerBuilder())
  {
    server_ = builder.with_listen_address("127.0.0.1")
                  .with_http(0)
                  .set_log_level(LogLevel::warn)
                  .build(ioc_);
    thread_ = std::thread([this] { ioc_.run(); });
  }

  void TearDown() override
  {
    if (server_)
      server_->stop();
    ioc_.stop();
    if (thread_.joinable())
      thread_.join();
    server_.reset();
  }

  std::uint16_t port() const { return server_->port(); }

  SpeedTestClient make_client(std::string prefix = {})
  {
    return SpeedTestClient(client_ioc_, "127.0.0.1", port(), std::move(prefix));
  }

  beast::tcp_stream connect()
  {
    beast::tcp_stream stream(client_ioc_);
    stream.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port()));
    return stream;
  }

  http::response<http::string_body>
  request(http::verb method, std::string target, std::string body = {})
  {
    auto stream = connect();

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.body() = std::move(body);
    req.prepare_payload();
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.skip(method == http::verb::head);
    http::read(stream, buffer, parser);
    return parser.release();
  }

  // Reads a download without keeping it
  DownloadResult download(std::string target)
  {
    DownloadResult result;
    auto stream = connect();

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    http::read_header(stream, buffer, parser);

    result.status = parser.get().result_int();
    if (auto const length = parser.content_length())
      result.content_length = *length;

    std::array<char, 64 * 1024> buf;
    while (!parser.is_done()) {
      parser.get().body().data = buf.data();
      parser.get().body().size = buf.size();
      http::read(stream, buffer, parser, result.ec);
      if (result.ec == http::error::need_buffer)
        result.ec = {};

      auto const n = buf.size() - parser.get().body().size;
      if (result.head.size() < 64)
        result.head.append(buf.data(),
                           std::min<std::size_t>(n, 64 - result.head.size()));
      result.received += n;
      if (result.ec)
        break;
    }
    return result;
  }

private:
  net::io_context client_ioc_;
};

} // namespace

TEST_F(EdgeperfServerTest, PingAnswersPong) {
  start();

  auto res = request(http::verb::get, "/ping");
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res.body(), "pong");
  EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
  EXPECT_EQ(res[http::field::server], "edgeperf/1.0.0");
}

TEST_F(EdgeperfServerTest, ClientPing) {
  start();

  auto client = make_client();
  auto const r = client.ping(3, std::chrono::milliseconds(0));
  EXPECT_EQ(r.samples, 3u);
  EXPECT_EQ(r.failures, 0u);
  EXPECT_LE(r.min_ms, r.avg_ms);
  EXPECT_LE(r.avg_ms, r.max_ms);
  EXPECT_GE(r.jitter_ms, 0.0);
}

TEST_F(EdgeperfServerTest, DownloadDefaultSize) {
  start();

  auto client = make_client();
  auto const r = client.download();
  EXPECT_EQ(r.bytes, 10485760u);
  EXPECT_GT(r.seconds, 0.0);
  EXPECT_GT(r.mbps(), 0.0);
}

TEST_F(EdgeperfServerTest, DownloadInvalidSizeFallsBack) {
  start();

  auto const r = download("/download?size=abc");
  ASSERT_FALSE(r.ec) << r.ec.message();
  EXPECT_EQ(r.status, 200u);
  ASSERT_TRUE(r.content_length);
  EXPECT_EQ(*r.content_length, 10485760u);
  EXPECT_EQ(r.received, 10485760u);
}

TEST_F(EdgeperfServerTest, DownloadBoundaries) {
  start(ServerBuilder().with_size_limits({1024, 4096, 1024 * 1024}));

  auto expect_size = [&](std::string const& size, std::uint64_t expected) {
    auto const r = download("/download?size=" + size);
    ASSERT_FALSE(r.ec) << size << ": " << r.ec.message();
    EXPECT_EQ(r.status, 200u) << size;
    EXPECT_EQ(r.received, expected) << size;
    EXPECT_EQ(r.content_length.value_or(0), expected) << size;
  };

  expect_size("1024", 1024);
  expect_size("1048576", 1048576);
  expect_size("1048577", 4096);
  expect_size("1023", 4096);
  expect_size("-5", 4096);
  expect_size("abc", 4096);
}

TEST_F(EdgeperfServerTest, DownloadsAreFreshlyGenerated) {
  start();

  auto const a = download("/download?size=65536");
  auto const b = download("/download?size=65536");
  ASSERT_EQ(a.received, 65536u);
  ASSERT_EQ(b.received, 65536u);
  EXPECT_NE(a.head, b.head);
}

TEST_F(EdgeperfServerTest, StrictSizeAnswersBadRequest) {
  start(ServerBuilder().with_strict_size());

  auto res = request(http::verb::get, "/download?size=abc");
  EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(EdgeperfServerTest, KeepAliveAcrossRequests) {
  start();

  auto client = make_client();
  EXPECT_EQ(client.download(4096).bytes, 4096u);
  EXPECT_EQ(client.ping(1).samples, 1u);
  EXPECT_EQ(client.upload(4096).bytes, 4096u);
  EXPECT_EQ(client.download(2048).bytes, 2048u);
}

TEST_F(EdgeperfServerTest, UploadIsCounted) {
  start();

  auto res = request(http::verb::post, "/upload", std::string(1024 * 1024, 'x'));
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res.body(), "ok");
  EXPECT_EQ(res["X-Bytes-Received"], "1048576");

  auto client = make_client();
  auto const r = client.upload(5 * MiB);
  EXPECT_EQ(r.bytes, 5 * MiB);
}

TEST_F(EdgeperfServerTest, UploadCountIsPerRequest) {
  start();

  auto stream = connect();
  std::string const raw = "POST /upload HTTP/1.1\r\n"
                          "Host: 127.0.0.1\r\n"
                          "Content-Length: 5\r\n"
                          "\r\n"
                          "hello"
                          "POST /upload HTTP/1.1\r\n"
                          "Host: 127.0.0.1\r\n"
                          "Content-Length: 0\r\n"
                          "\r\n";
  net::write(stream, net::buffer(raw));

  beast::flat_buffer buffer;
  http::response<http::string_body> first;
  http::read(stream, buffer, first);
  EXPECT_EQ(first["X-Bytes-Received"], "5");

  http::response<http::string_body> second;
  http::read(stream, buffer, second);
  EXPECT_EQ(second.result(), http::status::ok);
  EXPECT_EQ(second["X-Bytes-Received"], "0");

  // Same through the client's kept-alive connection
  auto client = make_client();
  EXPECT_EQ(client.upload(4096).bytes, 4096u);
  EXPECT_EQ(client.upload(0).bytes, 0u);
}

TEST_F(EdgeperfServerTest, OversizedUploadIsRejected) {
  start(ServerBuilder().with_upload_limit(1024 * 1024));

  auto stream = connect();
  std::string const header = "POST /upload HTTP/1.1\r\n"
                             "Host: 127.0.0.1\r\n"
                             "Content-Length: 1048577\r\n"
                             "\r\n";
  net::write(stream, net::buffer(header));

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(stream, buffer, res);
  EXPECT_EQ(res.result(), http::status::payload_too_large);
  EXPECT_FALSE(res.keep_alive());

  auto client = make_client();
  EXPECT_THROW(client.upload(2 * MiB), Exception);
  EXPECT_EQ(make_client().upload(MiB).bytes, MiB);
}

TEST_F(EdgeperfServerTest, BodyOnDownloadRouteIsLimited) {
  start();

  // The answer arrives before any body byte is sent
  auto stream = connect();
  std::string const header = "GET /ping HTTP/1.1\r\n"
                             "Host: 127.0.0.1\r\n"
                             "Content-Length: 65536\r\n"
                             "\r\n";
  net::write(stream, net::buffer(header));

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(stream, buffer, res);
  EXPECT_EQ(res.result(), http::status::payload_too_large);
}

TEST_F(EdgeperfServerTest, RoutingErrors) {
  start();

  auto res = request(http::verb::get, "/nothing");
  EXPECT_EQ(res.result(), http::status::not_found);

  res = request(http::verb::put, "/download");
  EXPECT_EQ(res.result(), http::status::method_not_allowed);
  EXPECT_EQ(res[http::field::allow], "GET, HEAD, OPTIONS");

  res = request(http::verb::options, "/upload");
  EXPECT_EQ(res.result(), http::status::no_content);
  EXPECT_EQ(res[http::field::access_control_max_age], "86400");

  res = request(http::verb::head, "/download?size=2048");
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res[http::field::content_length], "2048");
}

TEST_F(EdgeperfServerTest, ApiPrefix) {
  start(ServerBuilder().with_api_prefix("api/"));

  EXPECT_EQ(server_->config().api_prefix, "/api");
  EXPECT_EQ(request(http::verb::get, "/api/ping").result(), http::status::ok);
  EXPECT_EQ(request(http::verb::get, "/ping").result(),
            http::status::not_found);

  auto client = make_client("/api");
  EXPECT_EQ(client.download(1024).bytes, 1024u);
}

TEST_F(EdgeperfServerTest, AbandonedDownloadDoesNotAffectServer) {
  start();

  {
    auto stream = connect();
    http::request<http::empty_body> req{http::verb::get,
                                        "/download?size=262144000", 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    http::read_header(stream, buffer, parser);
    EXPECT_EQ(parser.get().result(), http::status::ok);
    // Closed here with almost the whole body unread
  }

  auto client = make_client();
  EXPECT_EQ(client.ping(1).samples, 1u);
  EXPECT_EQ(client.download(1024).bytes, 1024u);
}

TEST_F(EdgeperfServerTest, ChunkedUploadIsCounted) {
  start();

  auto stream = connect();
  std::string const raw = "POST /upload HTTP/1.1\r\n"
                          "Host: 127.0.0.1\r\n"
                          "Transfer-Encoding: chunked\r\n"
                          "\r\n"
                          "5\r\nhello\r\n"
                          "6\r\n world\r\n"
                          "0\r\n\r\n";
  net::write(stream, net::buffer(raw));

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(stream, buffer, res);
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res["X-Bytes-Received"], "11");
}

TEST_F(EdgeperfServerTest, DisconnectStopsGeneration) {
  auto source = std::make_shared<CountingSource>();
  start(ServerBuilder().with_random_source(source));

  {
    auto stream = connect();
    http::request<http::empty_body> req{http::verb::get,
                                        "/download?size=262144000", 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    http::read_header(stream, buffer, parser);
  }

  // Let the server observe the reset
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  auto const after_close = source->calls.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(300));

  EXPECT_EQ(source->calls.load(), after_close);
  // Only what the socket buffers absorbed was ever generated
  EXPECT_LT(after_close, 262144000u / 65536u / 10);
}

TEST_F(EdgeperfServerTest, GenerationFailureAbortsResponse) {
  start(ServerBuilder().with_random_source(std::make_shared<FailingSource>(4)));

  auto const r = download("/download?size=1048576");
  EXPECT_EQ(r.status, 200u);
  EXPECT_TRUE(r.ec);
  EXPECT_LT(r.received, 1048576u);

  // The session is gone, the server is not
  auto res = request(http::verb::get, "/ping");
  EXPECT_EQ(res.result(), http::status::ok);
}

TEST_F(EdgeperfServerTest, ClientReportsTruncatedDownload) {
  start(ServerBuilder().with_random_source(std::make_shared<FailingSource>(2)));

  auto client = make_client();
  EXPECT_THROW(client.download(1024 * 1024), Exception);
}

TEST(ServerBuilder, RejectsInvalidConfiguration) {
  net::io_context ioc;

  EXPECT_THROW(ServerBuilder().with_http(0).with_size_limits({0, 10, 20}).build(ioc),
               Exception);
  EXPECT_THROW(ServerBuilder().with_http(0).with_size_limits({100, 50, 200}).build(ioc),
               Exception);
  EXPECT_THROW(ServerBuilder().with_http(0).with_chunk_size(0).build(ioc),
               Exception);
  EXPECT_THROW(ServerBuilder().with_http(0).with_upload_limit(0).build(ioc),
               Exception);
  EXPECT_THROW(ServerBuilder()
                   .with_http(0)
                   .with_header_timeout(std::chrono::seconds(0))
                   .build(ioc),
               Exception);
  EXPECT_THROW(ServerBuilder().with_http(0).with_ssl("cert.pem", "").build(ioc),
               Exception);
  EXPECT_THROW(ServerBuilder()
                   .with_http(0)
                   .with_ssl("/nonexistent/cert.pem", "/nonexistent/key.pem")
                   .build(ioc),
               Exception);
}

TEST(ServerBuilder, ReportsBindFailure) {
  net::io_context ioc;

  auto first = ServerBuilder().with_listen_address("127.0.0.1").with_http(0).build(ioc);
  EXPECT_THROW(ServerBuilder()
                   .with_listen_address("127.0.0.1")
                   .with_http(first->port())
                   .build(ioc),
               Exception);
}

TEST(ServerBuilder, ResolvesEphemeralPort) {
  net::io_context ioc;

  auto server = ServerBuilder().with_listen_address("127.0.0.1").with_http(0).build(ioc);
  EXPECT_NE(server->port(), 0u);
  EXPECT_EQ(server->config().chunk_size, 64 * 1024u);
}
