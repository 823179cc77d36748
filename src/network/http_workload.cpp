/// @file http_workload.cpp
/// @brief HttpWorkload implementation.

#include "network/http_workload.hpp"
#include "network/stoppable_io.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

namespace surge {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

auto elapsed_since(Clock::time_point begin) -> Outcome::Duration {
  return std::chrono::duration_cast<Outcome::Duration>(Clock::now() - begin);
}

/// Map a transport error to an outcome; @p stage names the failing step.
auto transport_failure(const beast::error_code &ec, const char *stage,
                       const ExecutionContext &ctx, Clock::time_point begin)
    -> Outcome {
  if (ec == beast::error::timeout) {
    return Outcome::timeout(elapsed_since(begin));
  }
  if (ec == net::error::operation_aborted && ctx.stop_requested()) {
    return Outcome::failure("cancelled: stop requested", elapsed_since(begin));
  }
  return Outcome::failure(std::string{stage} + ": " + ec.message(),
                          elapsed_since(begin));
}

} // namespace

auto HttpWorkload::create(std::string name, HttpRequestConfig cfg)
    -> std::expected<std::shared_ptr<HttpWorkload>, Error> {
  auto url = parse_url(cfg.url);
  if (!url) {
    return std::unexpected(url.error());
  }
  if (url->scheme != "http") {
    return std::unexpected(
        configuration_error("HTTP workload needs an http:// URL"));
  }
  if (http::string_to_verb(cfg.method) == http::verb::unknown) {
    return std::unexpected(
        configuration_error("unknown HTTP method '" + cfg.method + "'"));
  }
  if (cfg.timeout.count() <= 0.0) {
    return std::unexpected(configuration_error("HTTP timeout must be > 0"));
  }
  if (name.empty()) {
    name = cfg.method + " " + cfg.url;
  }
  return std::make_shared<HttpWorkload>(Token{}, std::move(name),
                                        std::move(cfg), std::move(*url));
}

HttpWorkload::HttpWorkload(Token, std::string name, HttpRequestConfig cfg,
                           Url url)
    : Workload{std::move(name)}, cfg_{std::move(cfg)}, url_{std::move(url)} {}

auto HttpWorkload::execute(ExecutionContext &ctx) -> Outcome {
  const auto begin = Clock::now();
  StoppableIo io{ctx};
  tcp::resolver resolver{io.context()};
  beast::tcp_stream stream{io.context()};
  stream.expires_after(
      std::chrono::duration_cast<Clock::duration>(cfg_.timeout));

  // 1. Resolve and connect.
  tcp::resolver::results_type endpoints;
  auto ec = io.await(
      [&](StoppableIo::Done done) {
        resolver.async_resolve(
            url_.host, url_.port,
            [&endpoints, done](beast::error_code e,
                               tcp::resolver::results_type r) {
              endpoints = std::move(r);
              done(e);
            });
      },
      [&] { resolver.cancel(); });
  if (ec) {
    return transport_failure(ec, "dns_error", ctx, begin);
  }

  ec = io.await(
      [&](StoppableIo::Done done) {
        stream.async_connect(endpoints,
                             [done](beast::error_code e, const tcp::endpoint &) {
                               done(e);
                             });
      },
      [&] { stream.cancel(); });
  if (ec) {
    return transport_failure(ec, "connection_error", ctx, begin);
  }

  // 2. Request.
  http::request<http::string_body> req{http::string_to_verb(cfg_.method),
                                       url_.target, 11};
  req.set(http::field::host, url_.authority());
  req.set(http::field::user_agent, "surge/0.1");
  for (const auto &[field, value] : cfg_.headers) {
    req.set(field, value);
  }
  auto body = cfg_.body_factory ? cfg_.body_factory(ctx.shared()) : cfg_.body;
  if (!body.empty()) {
    req.set(http::field::content_type, cfg_.content_type);
    req.body() = std::move(body);
  }
  req.keep_alive(false);
  req.prepare_payload();

  ec = io.await(
      [&](StoppableIo::Done done) {
        http::async_write(stream, req,
                          [done](beast::error_code e, std::size_t) { done(e); });
      },
      [&] { stream.cancel(); });
  if (ec) {
    return transport_failure(ec, "write_error", ctx, begin);
  }

  // 3. Response.
  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  ec = io.await(
      [&](StoppableIo::Done done) {
        http::async_read(stream, buffer, res,
                         [done](beast::error_code e, std::size_t) { done(e); });
      },
      [&] { stream.cancel(); });
  if (ec) {
    return transport_failure(ec, "read_error", ctx, begin);
  }

  beast::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

  const auto elapsed = elapsed_since(begin);
  const int code = static_cast<int>(res.result_int());
  ctx.record("response_bytes", static_cast<double>(res.body().size()));
  if (code >= 200 && code < 300) {
    return Outcome::ok(elapsed, code);
  }
  return Outcome::failure("http_error: status " + std::to_string(code),
                          elapsed, code);
}

} // namespace surge
