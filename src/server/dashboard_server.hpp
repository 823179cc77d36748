#pragma once
/// @file dashboard_server.hpp
/// @brief Boost.Beast HTTP + WebSocket server streaming live run progress.
///
/// HTTP routes (one request per connection):
///   GET /api/stats    current MetricsSnapshot as JSON
///   GET /api/history  recent progress updates as a JSON array
///   GET /metrics      Prometheus text exposition
/// WebSocket clients (any other path with an upgrade header) receive a
/// snapshot on connect and every progress broadcast afterwards. Client
/// messages: {"type":"ping"}, {"type":"get_history","count":N},
/// {"type":"stop"}.

#include <utility>  // boost/asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace surge {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ws = beast::websocket;
using tcp = net::ip::tcp;

/// @brief Returns a JSON (or text) document on demand.
using TextProvider = std::function<std::string()>;

/// @brief Handles one client text message; the optional result is sent
/// back to that client only.
using MessageHandler =
    std::function<std::optional<std::string>(const std::string &)>;

/// @brief Answers a plain HTTP request.
using HttpHandler = std::function<http::response<http::string_body>(
    const http::request<http::string_body> &)>;

/// @brief A single connection: either one HTTP request or a WebSocket.
class DashboardSession
    : public std::enable_shared_from_this<DashboardSession> {
public:
  /// @param greeting Sent once the WebSocket upgrade completes.
  DashboardSession(tcp::socket socket, MessageHandler on_message,
                   HttpHandler on_http, TextProvider greeting);

  /// @brief Read the first request and dispatch to HTTP or WebSocket.
  void run();

  /// @brief Queue a text frame (thread-safe via the session executor).
  void send(std::string message);

  [[nodiscard]] auto is_open() const -> bool;

private:
  void on_accept(beast::error_code ec);
  void do_read();
  void on_read(beast::error_code ec, std::size_t bytes_transferred);
  void handle_http_request();

  beast::flat_buffer buffer_;
  ws::stream<beast::tcp_stream> ws_;
  http::request<http::string_body> req_;
  bool is_websocket_ = false;
  MessageHandler on_message_;
  HttpHandler on_http_;
  TextProvider greeting_;
};

/// @brief Live dashboard for one run.
class DashboardServer {
public:
  static constexpr std::size_t kDefaultHistory = 600;

  /// @param port TCP port; 0 binds an ephemeral port (see port()).
  explicit DashboardServer(unsigned short port,
                           std::size_t history_capacity = kDefaultHistory);

  /// @brief Accept connections. Blocks on io_context::run().
  void run();

  /// @brief Stop the server; run() returns.
  void stop();

  /// @brief Bound port.
  [[nodiscard]] auto port() const -> unsigned short;

  /// @brief Record a progress message in the history and send it to every
  /// WebSocket client.
  void publish(const std::string &message);

  /// @brief Send a message to every WebSocket client without recording it.
  void broadcast(const std::string &message);

  /// @brief Most recent @p count history entries as a JSON array.
  [[nodiscard]] auto history_json(std::size_t count) const -> std::string;

  void set_stats_provider(TextProvider provider);
  void set_metrics_provider(TextProvider provider);
  void set_stop_handler(std::function<void()> handler);

private:
  void do_accept();
  auto handle_message(const std::string &text) -> std::optional<std::string>;
  auto snapshot_message() -> std::string;
  auto handle_http(const http::request<http::string_body> &req)
      -> http::response<http::string_body>;

  net::io_context ioc_{1};
  tcp::acceptor acceptor_;

  // Providers are installed before run() and only read afterwards.
  TextProvider stats_provider_;
  TextProvider metrics_provider_;
  std::function<void()> stop_handler_;

  std::mutex sessions_mutex_;
  std::vector<std::shared_ptr<DashboardSession>> sessions_;

  mutable std::mutex history_mutex_;
  std::deque<std::string> history_;
  std::size_t history_capacity_;
};

} // namespace surge
