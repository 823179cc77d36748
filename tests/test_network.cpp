/// @file test_network.cpp
/// @brief Dashboard server, HTTP and WebSocket workloads over loopback.

#include "network/http_workload.hpp"
#include "network/url.hpp"
#include "network/websocket_workload.hpp"
#include "orchestrator/load_test.hpp"
#include "server/dashboard_server.hpp"
#include "workload/function_workload.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>

using namespace surge;
using namespace std::chrono_literals;

namespace {

/// Synchronous GET used to inspect dashboard responses.
auto http_get(unsigned short port, const std::string &target)
    -> http::response<http::string_body> {
  net::io_context ioc;
  beast::tcp_stream stream{ioc};
  stream.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port});
  http::request<http::string_body> req{http::verb::get, target, 11};
  req.set(http::field::host, "127.0.0.1");
  http::write(stream, req);
  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(stream, buffer, res);
  return res;
}

auto ws_connect(net::io_context &ioc, unsigned short port)
    -> std::unique_ptr<ws::stream<tcp::socket>> {
  auto stream = std::make_unique<ws::stream<tcp::socket>>(ioc);
  stream->next_layer().connect(
      tcp::endpoint{net::ip::make_address("127.0.0.1"), port});
  stream->handshake("127.0.0.1:" + std::to_string(port), "/ws");
  stream->text(true);
  return stream;
}

auto ws_exchange(ws::stream<tcp::socket> &stream, const std::string &msg)
    -> nlohmann::json {
  stream.write(net::buffer(msg));
  beast::flat_buffer buffer;
  stream.read(buffer);
  return nlohmann::json::parse(beast::buffers_to_string(buffer.data()));
}

auto closed_port() -> unsigned short {
  net::io_context ioc;
  tcp::acceptor acceptor{ioc,
                         tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}};
  return acceptor.local_endpoint().port();
}

} // namespace

// ─── URL ────────────────────────────────────────────────────────────────

TEST(UrlTest, SplitsParts) {
  auto u = parse_url("http://example.com:8080/api/v1?x=1");
  ASSERT_TRUE(u.has_value());
  EXPECT_EQ(u->scheme, "http");
  EXPECT_EQ(u->host, "example.com");
  EXPECT_EQ(u->port, "8080");
  EXPECT_EQ(u->target, "/api/v1?x=1");
  EXPECT_EQ(u->authority(), "example.com:8080");

  auto bare = parse_url("WS://localhost");
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->scheme, "ws");
  EXPECT_EQ(bare->port, "80");
  EXPECT_EQ(bare->target, "/");
  EXPECT_EQ(bare->authority(), "localhost");
}

TEST(UrlTest, RejectsUnsupported) {
  EXPECT_FALSE(parse_url("https://secure.example.com").has_value());
  EXPECT_FALSE(parse_url("example.com/path").has_value());
  EXPECT_FALSE(parse_url("http://host:abc/").has_value());
  EXPECT_FALSE(parse_url("http:///path").has_value());
}

TEST(WorkloadFactoryTest, RejectsBadConfig) {
  EXPECT_FALSE(HttpWorkload::create("x", {.url = "ws://host/"}).has_value());
  EXPECT_FALSE(
      HttpWorkload::create("x", {.method = "FETCH", .url = "http://host/"})
          .has_value());
  EXPECT_FALSE(
      WebSocketWorkload::create("x", {.url = "http://host/"}).has_value());

  auto named = HttpWorkload::create("", {.url = "http://host/a"});
  ASSERT_TRUE(named.has_value());
  EXPECT_EQ((*named)->name(), "GET http://host/a");
  EXPECT_EQ((*named)->kind(), WorkloadKind::NetworkCall);
}

TEST(WorkloadFactoryTest, CreatedWorkloadsOwnTheirConfig) {
  HttpRequestConfig req;
  req.method = "POST";
  req.url = "http://host:8080/orders";
  req.body = R"({"id":1})";
  auto http = HttpWorkload::create("orders", std::move(req));
  ASSERT_TRUE(http.has_value());
  EXPECT_EQ(http->use_count(), 1);
  EXPECT_EQ((*http)->name(), "orders");
  EXPECT_EQ((*http)->config().method, "POST");
  EXPECT_EQ((*http)->config().body, R"({"id":1})");

  WebSocketConfig wcfg;
  wcfg.url = "ws://host:9000/feed";
  auto socket = WebSocketWorkload::create("", std::move(wcfg));
  ASSERT_TRUE(socket.has_value());
  EXPECT_EQ(socket->use_count(), 1);
  EXPECT_EQ((*socket)->name(), "WS ws://host:9000/feed");
  EXPECT_EQ((*socket)->kind(), WorkloadKind::Socket);
}

// ─── Dashboard + workloads ──────────────────────────────────────────────

class DashboardTest : public ::testing::Test {
protected:
  void SetUp() override {
    server_ = std::make_unique<DashboardServer>(0, 10);
    server_->set_stats_provider(
        [] { return nlohmann::json{{"total_requests", 5}}.dump(); });
    server_->set_metrics_provider(
        [] { return std::string{"surge_requests_total 5\n"}; });
    server_->set_stop_handler([this] { ++stops_; });
    thread_ = std::thread([this] { server_->run(); });
    port_ = server_->port();
  }

  void TearDown() override {
    server_->stop();
    thread_.join();
  }

  auto run_workload(Workload &w, std::stop_token stop = {}) -> Outcome {
    DispatchEvent event{.sequence = 1, .scheduled_at = Clock::now()};
    ExecutionContext ctx{event, Phase::Measuring, shared_, std::move(stop)};
    auto outcome = w.execute(ctx);
    custom_ = ctx.take_custom();
    return outcome;
  }

  std::unique_ptr<DashboardServer> server_;
  std::thread thread_;
  unsigned short port_ = 0;
  std::atomic<int> stops_{0};
  SharedContext shared_;
  CustomMetrics custom_;
};

TEST_F(DashboardTest, ServesStatsAndMetrics) {
  auto stats = http_get(port_, "/api/stats");
  EXPECT_EQ(stats.result(), http::status::ok);
  EXPECT_EQ(nlohmann::json::parse(stats.body())["total_requests"], 5);

  auto metrics = http_get(port_, "/metrics");
  EXPECT_EQ(metrics.result(), http::status::ok);
  EXPECT_EQ(metrics.body(), "surge_requests_total 5\n");

  auto missing = http_get(port_, "/nope");
  EXPECT_EQ(missing.result(), http::status::not_found);
}

TEST_F(DashboardTest, HistoryIsBounded) {
  for (int i = 0; i < 15; ++i) {
    server_->publish(nlohmann::json{{"type", "progress"}, {"i", i}}.dump());
  }
  auto history = nlohmann::json::parse(http_get(port_, "/api/history").body());
  ASSERT_TRUE(history.is_array());
  ASSERT_EQ(history.size(), 10u);
  EXPECT_EQ(history.front()["i"], 5);
  EXPECT_EQ(history.back()["i"], 14);
}

TEST_F(DashboardTest, WebSocketProtocol) {
  server_->publish(nlohmann::json{{"type", "progress"}, {"i", 1}}.dump());
  server_->publish(nlohmann::json{{"type", "progress"}, {"i", 2}}.dump());

  net::io_context ioc;
  auto stream = ws_connect(ioc, port_);

  beast::flat_buffer buffer;
  stream->read(buffer);
  auto greeting = nlohmann::json::parse(beast::buffers_to_string(buffer.data()));
  EXPECT_EQ(greeting["type"], "snapshot");
  EXPECT_EQ(greeting["metrics"]["total_requests"], 5);

  EXPECT_EQ(ws_exchange(*stream, R"({"type":"ping"})")["type"], "pong");

  auto history = ws_exchange(*stream, R"({"type":"get_history","count":1})");
  EXPECT_EQ(history["type"], "history");
  ASSERT_EQ(history["data"].size(), 1u);
  EXPECT_EQ(history["data"][0]["i"], 2);

  EXPECT_EQ(ws_exchange(*stream, "not json")["type"], "error");

  EXPECT_EQ(ws_exchange(*stream, R"({"type":"stop"})")["type"], "stopping");
  EXPECT_EQ(stops_.load(), 1);

  stream->close(ws::close_code::normal);
}

TEST_F(DashboardTest, MalformedMessagesGetErrorReplies) {
  server_->publish(nlohmann::json{{"type", "progress"}, {"i", 1}}.dump());

  net::io_context ioc;
  auto stream = ws_connect(ioc, port_);
  beast::flat_buffer greeting;
  stream->read(greeting);

  EXPECT_EQ(ws_exchange(*stream, R"({"type":"get_history","count":"abc"})")
                ["type"],
            "error");
  EXPECT_EQ(
      ws_exchange(*stream, R"({"type":"get_history","count":-3})")["type"],
      "error");
  EXPECT_EQ(ws_exchange(*stream, R"({"type":42})")["type"], "error");
  EXPECT_EQ(ws_exchange(*stream, R"([1,2,3])")["type"], "error");

  // The server keeps serving the same connection and new ones.
  EXPECT_EQ(ws_exchange(*stream, R"({"type":"ping"})")["type"], "pong");
  auto history = ws_exchange(*stream, R"({"type":"get_history","count":5})");
  ASSERT_EQ(history["data"].size(), 1u);
  EXPECT_EQ(http_get(port_, "/api/stats").result(), http::status::ok);

  stream->close(ws::close_code::normal);
}

TEST_F(DashboardTest, HttpWorkloadSuccessAndStatusFailure) {
  auto ok = HttpWorkload::create(
      "stats", {.url = "http://127.0.0.1:" + std::to_string(port_) +
                       "/api/stats"});
  ASSERT_TRUE(ok.has_value());
  auto outcome = run_workload(**ok);
  EXPECT_TRUE(outcome.success()) << outcome.error.value_or("");
  EXPECT_EQ(outcome.status_code, 200);
  EXPECT_GT(outcome.duration.count(), 0);
  ASSERT_EQ(custom_.size(), 1u);
  EXPECT_EQ(custom_[0].first, "response_bytes");

  auto missing = HttpWorkload::create(
      "missing", {.url = "http://127.0.0.1:" + std::to_string(port_) + "/x"});
  ASSERT_TRUE(missing.has_value());
  auto failed = run_workload(**missing);
  EXPECT_EQ(failed.status, OutcomeStatus::Failure);
  EXPECT_EQ(failed.status_code, 404);
  EXPECT_EQ(failed.error->rfind("http_error", 0), 0u);

  auto post = HttpWorkload::create(
      "post", {.method = "POST",
               .url = "http://127.0.0.1:" + std::to_string(port_) + "/api/stats",
               .body = R"({"a":1})"});
  ASSERT_TRUE(post.has_value());
  EXPECT_EQ(run_workload(**post).status_code, 405);
}

TEST_F(DashboardTest, WebSocketWorkloadExchangesOneMessage) {
  auto w = WebSocketWorkload::create(
      "ws", {.url = "ws://127.0.0.1:" + std::to_string(port_) + "/ws"});
  ASSERT_TRUE(w.has_value());
  EXPECT_EQ((*w)->kind(), WorkloadKind::Socket);

  auto outcome = run_workload(**w);
  EXPECT_TRUE(outcome.success()) << outcome.error.value_or("");
  ASSERT_FALSE(custom_.empty());
  EXPECT_EQ(custom_[0].first, "reply_bytes");
  EXPECT_GT(custom_[0].second, 0.0);
}

TEST_F(DashboardTest, StoppedExecutionReturnsPromptly) {
  auto w = HttpWorkload::create(
      "stats", {.url = "http://127.0.0.1:" + std::to_string(port_) +
                       "/api/stats"});
  ASSERT_TRUE(w.has_value());
  std::stop_source source;
  source.request_stop();
  auto outcome = run_workload(**w, source.get_token());
  EXPECT_EQ(outcome.status, OutcomeStatus::Failure);
  EXPECT_EQ(outcome.error->rfind("cancelled", 0), 0u);
}

TEST(NetworkWorkloadTest, ConnectionRefusedIsFailure) {
  const auto port = closed_port();
  SharedContext shared;
  DispatchEvent event{.sequence = 1, .scheduled_at = Clock::now()};

  auto http_w = HttpWorkload::create(
      "down", {.url = "http://127.0.0.1:" + std::to_string(port) + "/",
               .timeout = Seconds{2.0}});
  ASSERT_TRUE(http_w.has_value());
  ExecutionContext ctx{event, Phase::Measuring, shared, {}};
  auto outcome = (*http_w)->execute(ctx);
  EXPECT_EQ(outcome.status, OutcomeStatus::Failure);
  EXPECT_EQ(outcome.error->rfind("connection_error", 0), 0u);

  auto ws_w = WebSocketWorkload::create(
      "down", {.url = "ws://127.0.0.1:" + std::to_string(port) + "/",
               .timeout = Seconds{2.0}});
  ASSERT_TRUE(ws_w.has_value());
  ExecutionContext ws_ctx{event, Phase::Measuring, shared, {}};
  auto ws_outcome = (*ws_w)->execute(ws_ctx);
  EXPECT_EQ(ws_outcome.status, OutcomeStatus::Failure);
  EXPECT_EQ(ws_outcome.error->rfind("connection_error", 0), 0u);
}

// ─── LoadTest with live dashboard ───────────────────────────────────────

TEST(LoadTestDashboardTest, StopCommandEndsTheRun) {
  RunConfig cfg;
  cfg.name = "dashboard";
  cfg.duration = Seconds{30.0};
  cfg.warmup_duration = Seconds{0.0};
  cfg.console_output = false;
  cfg.progress_interval = Seconds{0.1};
  cfg.dashboard_port = 0;

  LoadTest test{cfg};
  ASSERT_TRUE(test.add_scenario(std::make_shared<FunctionWorkload>(
                                    "noop", [](ExecutionContext &) {}))
                  .has_value());
  ASSERT_TRUE(test.set_pattern(*RatePattern::constant(50.0)).has_value());

  std::atomic<bool> saw_stats{false};
  std::thread client([&] {
    std::optional<unsigned short> port;
    for (int i = 0; i < 200 && !port; ++i) {
      std::this_thread::sleep_for(10ms);
      port = test.dashboard_port();
    }
    if (!port) {
      return;
    }
    std::this_thread::sleep_for(300ms);
    auto stats = nlohmann::json::parse(http_get(*port, "/api/stats").body());
    saw_stats = stats["total_requests"].get<std::size_t>() > 0;

    net::io_context ioc;
    auto stream = ws_connect(ioc, *port);
    beast::flat_buffer greeting;
    stream->read(greeting);
    stream->write(net::buffer(std::string{R"({"type":"stop"})"}));
  });

  const auto begin = std::chrono::steady_clock::now();
  auto result = test.run();
  client.join();
  ASSERT_TRUE(result.has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);
  EXPECT_EQ(result->final_phase, Phase::Stopped);
  EXPECT_TRUE(saw_stats.load());
  EXPECT_FALSE(test.dashboard_port().has_value());
}
