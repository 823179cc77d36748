/// @file dashboard_server.cpp
/// @brief Implementation of the live dashboard server.

#include "server/dashboard_server.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>

namespace surge {

// ─── DashboardSession ───────────────────────────────────────────────────

DashboardSession::DashboardSession(tcp::socket socket,
                                   MessageHandler on_message,
                                   HttpHandler on_http, TextProvider greeting)
    : ws_{std::move(socket)}, on_message_{std::move(on_message)},
      on_http_{std::move(on_http)}, greeting_{std::move(greeting)} {}

void DashboardSession::run() {
  http::async_read(
      ws_.next_layer(), buffer_, req_,
      [self = shared_from_this()](beast::error_code ec, std::size_t) {
        if (ec)
          return;

        if (ws::is_upgrade(self->req_)) {
          self->ws_.async_accept(self->req_, [self](beast::error_code ec2) {
            self->on_accept(ec2);
          });
        } else {
          self->handle_http_request();
        }
      });
}

void DashboardSession::on_accept(beast::error_code ec) {
  if (ec)
    return;
  is_websocket_ = true;
  ws_.text(true);
  if (greeting_) {
    send(greeting_());
  }
  do_read();
}

void DashboardSession::do_read() {
  ws_.async_read(buffer_, [self = shared_from_this()](beast::error_code ec,
                                                      std::size_t bytes) {
    self->on_read(ec, bytes);
  });
}

void DashboardSession::on_read(beast::error_code ec,
                               std::size_t /*bytes_transferred*/) {
  if (ec == ws::error::closed)
    return;
  if (ec)
    return;

  auto msg = beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  if (!msg.empty() && on_message_) {
    if (auto reply = on_message_(msg)) {
      send(std::move(*reply));
    }
  }
  do_read();
}

void DashboardSession::send(std::string message) {
  if (!is_websocket_)
    return;

  auto msg = std::make_shared<std::string>(std::move(message));

  net::post(ws_.get_executor(), [self = shared_from_this(), msg]() {
    beast::error_code ec;
    self->ws_.write(net::buffer(*msg), ec);
  });
}

auto DashboardSession::is_open() const -> bool {
  return is_websocket_ && ws_.is_open();
}

void DashboardSession::handle_http_request() {
  auto response = on_http_(req_);
  response.set(http::field::server, "surge-dashboard/0.1");
  response.set(http::field::access_control_allow_origin, "*");
  // One request per connection.
  response.keep_alive(false);
  response.prepare_payload();

  beast::error_code ec;
  http::write(ws_.next_layer(), response, ec);
  ws_.next_layer().socket().shutdown(tcp::socket::shutdown_send, ec);
}

// ─── DashboardServer ────────────────────────────────────────────────────

DashboardServer::DashboardServer(unsigned short port,
                                 std::size_t history_capacity)
    : acceptor_{ioc_}, history_capacity_{std::max<std::size_t>(1,
                                                               history_capacity)} {
  tcp::endpoint endpoint{tcp::v4(), port};
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(net::socket_base::max_listen_connections);
}

void DashboardServer::run() {
  std::cout << "[Dashboard] Listening on http://localhost:" << port() << "\n";
  std::cout << "[Dashboard] WebSocket at ws://localhost:" << port()
            << "/ws\n";

  do_accept();
  ioc_.run();
}

void DashboardServer::stop() { ioc_.stop(); }

auto DashboardServer::port() const -> unsigned short {
  return acceptor_.local_endpoint().port();
}

void DashboardServer::do_accept() {
  acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
    if (ec)
      return;

    auto session = std::make_shared<DashboardSession>(
        std::move(socket),
        [this](const std::string &text) { return handle_message(text); },
        [this](const http::request<http::string_body> &req) {
          return handle_http(req);
        },
        [this] { return snapshot_message(); });

    {
      std::lock_guard lock(sessions_mutex_);
      sessions_.push_back(session);
    }

    session->run();
    do_accept();
  });
}

void DashboardServer::publish(const std::string &message) {
  {
    std::lock_guard lock(history_mutex_);
    history_.push_back(message);
    while (history_.size() > history_capacity_) {
      history_.pop_front();
    }
  }
  broadcast(message);
}

void DashboardServer::broadcast(const std::string &message) {
  std::lock_guard lock(sessions_mutex_);

  std::erase_if(sessions_, [](const auto &s) { return !s->is_open(); });

  for (auto &session : sessions_) {
    session->send(message);
  }
}

auto DashboardServer::history_json(std::size_t count) const -> std::string {
  auto arr = nlohmann::json::array();
  std::lock_guard lock(history_mutex_);
  const auto n = std::min(count, history_.size());
  for (auto it = history_.end() - static_cast<std::ptrdiff_t>(n);
       it != history_.end(); ++it) {
    arr.push_back(nlohmann::json::parse(*it, nullptr, false));
  }
  return arr.dump();
}

void DashboardServer::set_stats_provider(TextProvider provider) {
  stats_provider_ = std::move(provider);
}

void DashboardServer::set_metrics_provider(TextProvider provider) {
  metrics_provider_ = std::move(provider);
}

void DashboardServer::set_stop_handler(std::function<void()> handler) {
  stop_handler_ = std::move(handler);
}

auto DashboardServer::snapshot_message() -> std::string {
  nlohmann::json j;
  j["type"] = "snapshot";
  j["metrics"] = stats_provider_
                     ? nlohmann::json::parse(stats_provider_(), nullptr, false)
                     : nlohmann::json::object();
  return j.dump();
}

namespace {

auto error_reply(const std::string &message) -> std::string {
  return nlohmann::json{{"type", "error"}, {"message", message}}.dump();
}

} // namespace

auto DashboardServer::handle_message(const std::string &text)
    -> std::optional<std::string> {
  auto msg = nlohmann::json::parse(text, nullptr, false);
  if (msg.is_discarded() || !msg.is_object()) {
    return error_reply("invalid JSON");
  }

  try {
    const auto type_it = msg.find("type");
    if (type_it == msg.end() || !type_it->is_string()) {
      return error_reply("missing message type");
    }
    const auto type = type_it->get<std::string>();

    if (type == "ping") {
      return nlohmann::json{{"type", "pong"}}.dump();
    }
    if (type == "get_history") {
      std::size_t count = 100;
      if (auto it = msg.find("count"); it != msg.end()) {
        if (!it->is_number_unsigned()) {
          return error_reply("count must be a non-negative integer");
        }
        count = it->get<std::size_t>();
      }
      nlohmann::json reply;
      reply["type"] = "history";
      reply["data"] = nlohmann::json::parse(history_json(count));
      return reply.dump();
    }
    if (type == "stop") {
      std::cout << "[Dashboard] Stop requested by client\n";
      if (stop_handler_) {
        stop_handler_();
      }
      return nlohmann::json{{"type", "stopping"}}.dump();
    }
    return error_reply("unknown message type '" + type + "'");
  } catch (const nlohmann::json::exception &e) {
    // Malformed client input must not take down the io thread.
    return error_reply(e.what());
  }
}

auto DashboardServer::handle_http(const http::request<http::string_body> &req)
    -> http::response<http::string_body> {
  auto target = std::string(req.target());
  if (auto q = target.find('?'); q != std::string::npos) {
    target.resize(q);
  }

  http::response<http::string_body> res{http::status::ok, req.version()};
  if (req.method() != http::verb::get) {
    res.result(http::status::method_not_allowed);
    res.set(http::field::content_type, "text/plain");
    res.body() = "405 Method Not Allowed";
  } else if (target == "/api/stats" && stats_provider_) {
    res.set(http::field::content_type, "application/json");
    res.body() = stats_provider_();
  } else if (target == "/api/history") {
    res.set(http::field::content_type, "application/json");
    res.body() = history_json(history_capacity_);
  } else if (target == "/metrics" && metrics_provider_) {
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = metrics_provider_();
  } else {
    res.result(http::status::not_found);
    res.set(http::field::content_type, "text/plain");
    res.body() = "404 Not Found: " + target;
  }
  return res;
}

} // namespace surge
