// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <edgeperf/exception.hpp>
#include <edgeperf/impl/http_utils.hpp>
#include <edgeperf/server.hpp>

#include <boost/asio/ssl/context.hpp>

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <optional>

#include "http/http_server.hpp"
#include "logging.hpp"

namespace edgeperf {

namespace impl {

namespace {

std::string read_file_to_string(std::string const& file)
{
  std::ifstream is(file, std::ios_base::in);
  if (!is) {
    throw Exception("could not open certificate file: \"" + file + "\"");
  }
  return std::string(std::istreambuf_iterator<char>(is),
                     std::istreambuf_iterator<char>());
}

void validate(Config const& cfg)
{
  cfg.download_limits.validate();

  if (cfg.chunk_size == 0)
    throw Exception("chunk size must be positive");
  if (cfg.chunk_size > max_chunk_size)
    throw Exception(fmt::format("chunk size {} exceeds the maximum of {}",
                                cfg.chunk_size, max_chunk_size));
  if (cfg.upload_max_size == 0)
    throw Exception("upload limit must be positive");
  if (cfg.header_timeout.count() <= 0)
    throw Exception("header timeout must be positive");
  if (cfg.cert_file.empty() != cfg.key_file.empty())
    throw Exception(
        "TLS requires both a certificate and a private key file");
}

} // namespace

class ServerImpl : public Server
{
  std::shared_ptr<Config const> cfg_;
  std::optional<ssl::context> ssl_ctx_;
  HttpServer http_;

  static std::optional<ssl::context> make_ssl_context(Config const& cfg)
  {
    if (!cfg.ssl_enabled())
      return std::nullopt;

    std::string const cert = read_file_to_string(cfg.cert_file);
    std::string const key = read_file_to_string(cfg.key_file);

    std::optional<ssl::context> ctx(std::in_place, ssl::context::tls_server);
    ctx->set_options(ssl::context::default_workarounds |
                     ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                     ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 |
                     ssl::context::single_dh_use |
                     ssl::context::no_compression);

    boost::system::error_code ec;
    ctx->use_certificate_chain(boost::asio::buffer(cert.data(), cert.size()),
                               ec);
    if (ec)
      throw Exception("invalid certificate in \"" + cfg.cert_file +
                      "\": " + ec.message());

    ctx->use_private_key(boost::asio::buffer(key.data(), key.size()),
                         ssl::context::file_format::pem, ec);
    if (ec)
      throw Exception("invalid private key in \"" + cfg.key_file +
                      "\": " + ec.message());
    return ctx;
  }

public:
  ServerImpl(net::io_context& ioc, std::shared_ptr<Config const> cfg)
      : cfg_(cfg)
      , ssl_ctx_(make_ssl_context(*cfg))
      , http_(ioc, ssl_ctx_ ? &*ssl_ctx_ : nullptr, cfg)
  {
  }

  std::uint16_t port() const noexcept override { return http_.port(); }

  Config const& config() const noexcept override { return *cfg_; }

  void stop() override
  {
    EDGEPERF_LOG_INFO("Stopping listener on port {}", http_.port());
    http_.stop();
  }
};

} // namespace impl

EDGEPERF_API std::unique_ptr<Server>
ServerBuilder::build(boost::asio::io_context& ioc)
{
  impl::validate(cfg_);

  auto cfg = std::make_shared<Config>(cfg_);
  cfg->api_prefix = impl::normalize_prefix(cfg->api_prefix);
  if (!cfg->random_source)
    cfg->random_source = default_random_source();

  impl::get_logger()->set_level(cfg->log_level);

  auto server = std::make_unique<impl::ServerImpl>(ioc, cfg);

  auto const& limits = cfg->download_limits;
  EDGEPERF_LOG_INFO("Listening on {}://{}:{}{}",
                    cfg->ssl_enabled() ? "http(s)" : "http",
                    cfg->listen_address, server->port(), cfg->api_prefix);
  EDGEPERF_LOG_INFO("Download size [{}, {}] default {}, chunk {}, upload "
                    "limit {}{}",
                    limits.min_size, limits.max_size, limits.default_size,
                    cfg->chunk_size, cfg->upload_max_size,
                    cfg->strict_size ? ", strict size validation" : "");

  return server;
}

} // namespace edgeperf
