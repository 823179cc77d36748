/// @file websocket_workload.cpp
/// @brief WebSocketWorkload implementation.

#include "network/websocket_workload.hpp"
#include "network/stoppable_io.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

namespace surge {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace ws = beast::websocket;
using tcp = net::ip::tcp;

namespace {

auto elapsed_since(Clock::time_point begin) -> Outcome::Duration {
  return std::chrono::duration_cast<Outcome::Duration>(Clock::now() - begin);
}

auto socket_failure(const beast::error_code &ec, const char *stage,
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

auto WebSocketWorkload::create(std::string name, WebSocketConfig cfg)
    -> std::expected<std::shared_ptr<WebSocketWorkload>, Error> {
  auto url = parse_url(cfg.url);
  if (!url) {
    return std::unexpected(url.error());
  }
  if (url->scheme != "ws") {
    return std::unexpected(
        configuration_error("WebSocket workload needs a ws:// URL"));
  }
  if (cfg.timeout.count() <= 0.0) {
    return std::unexpected(
        configuration_error("WebSocket timeout must be > 0"));
  }
  if (name.empty()) {
    name = "WS " + cfg.url;
  }
  return std::make_shared<WebSocketWorkload>(Token{}, std::move(name),
                                             std::move(cfg), std::move(*url));
}

WebSocketWorkload::WebSocketWorkload(Token, std::string name, WebSocketConfig cfg,
                                     Url url)
    : Workload{std::move(name)}, cfg_{std::move(cfg)}, url_{std::move(url)} {}

auto WebSocketWorkload::execute(ExecutionContext &ctx) -> Outcome {
  const auto begin = Clock::now();
  const auto budget = std::chrono::duration_cast<Clock::duration>(cfg_.timeout);
  StoppableIo io{ctx};
  tcp::resolver resolver{io.context()};
  ws::stream<beast::tcp_stream> stream{io.context()};
  auto &lowest = beast::get_lowest_layer(stream);
  auto abort = [&] { lowest.cancel(); };

  // 1. TCP connect.
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
    return socket_failure(ec, "dns_error", ctx, begin);
  }

  lowest.expires_after(budget);
  ec = io.await(
      [&](StoppableIo::Done done) {
        lowest.async_connect(endpoints,
                             [done](beast::error_code e, const tcp::endpoint &) {
                               done(e);
                             });
      },
      abort);
  if (ec) {
    return socket_failure(ec, "connection_error", ctx, begin);
  }

  // 2. Handshake; the websocket layer owns timeouts from here on.
  lowest.expires_never();
  ws::stream_base::timeout opt{};
  opt.handshake_timeout = budget;
  opt.idle_timeout = budget;
  opt.keep_alive_pings = false;
  stream.set_option(opt);
  stream.set_option(ws::stream_base::decorator([](ws::request_type &req) {
    req.set(beast::http::field::user_agent, "surge/0.1");
  }));

  ec = io.await(
      [&](StoppableIo::Done done) {
        stream.async_handshake(url_.authority(), url_.target, done);
      },
      abort);
  if (ec) {
    return socket_failure(ec, "handshake_error", ctx, begin);
  }

  // 3. One message, one reply.
  auto message = cfg_.message_factory ? cfg_.message_factory(ctx.shared())
                                      : cfg_.message;
  stream.text(true);
  ec = io.await(
      [&](StoppableIo::Done done) {
        stream.async_write(net::buffer(message),
                           [done](beast::error_code e, std::size_t) { done(e); });
      },
      abort);
  if (ec) {
    return socket_failure(ec, "write_error", ctx, begin);
  }

  if (cfg_.expect_reply) {
    beast::flat_buffer buffer;
    ec = io.await(
        [&](StoppableIo::Done done) {
          stream.async_read(buffer, [done](beast::error_code e,
                                           std::size_t) { done(e); });
        },
        abort);
    if (ec) {
      return socket_failure(ec, "read_error", ctx, begin);
    }
    ctx.record("reply_bytes", static_cast<double>(buffer.size()));
  }

  const auto elapsed = elapsed_since(begin);

  // A failed close does not change the exchange's outcome.
  ec = io.await(
      [&](StoppableIo::Done done) {
        stream.async_close(ws::close_code::normal, done);
      },
      abort);
  if (ec && ec != ws::error::closed) {
    ctx.record("close_errors", 1.0);
  }
  return Outcome::ok(elapsed);
}

} // namespace surge
