/// @file load_test.cpp
/// @brief LoadTest lifecycle: configure, run, stop/cancel, report.

#include "orchestrator/load_test.hpp"
#include "serialization/json_serializer.hpp"
#include "server/dashboard_server.hpp"
#include "workload/shared_context.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace surge {

LoadTest::LoadTest(RunConfig cfg) : cfg_{std::move(cfg)} {}

LoadTest::~LoadTest() = default;

// ─── Configuration ──────────────────────────────────────────────────────

auto LoadTest::ensure_configurable(const char *what) const
    -> std::expected<void, Error> {
  if (started_.load(std::memory_order_acquire)) {
    return std::unexpected(
        state_error(std::string{what} + " called after run() started"));
  }
  return {};
}

auto LoadTest::configure(RunConfig cfg) -> std::expected<void, Error> {
  if (auto ok = ensure_configurable("configure()"); !ok) {
    return ok;
  }
  if (auto ok = validate(cfg); !ok) {
    return ok;
  }
  cfg_ = std::move(cfg);
  return {};
}

auto LoadTest::add_scenario(std::shared_ptr<Workload> workload, double weight)
    -> std::expected<void, Error> {
  if (auto ok = ensure_configurable("add_scenario()"); !ok) {
    return ok;
  }
  return registry_.add(std::move(workload), weight);
}

auto LoadTest::set_pattern(RatePattern pattern) -> std::expected<void, Error> {
  if (auto ok = ensure_configurable("set_pattern()"); !ok) {
    return ok;
  }
  pattern_ = std::move(pattern);
  return {};
}

auto LoadTest::set_progress_callback(ProgressCallback cb)
    -> std::expected<void, Error> {
  if (auto ok = ensure_configurable("set_progress_callback()"); !ok) {
    return ok;
  }
  user_progress_ = std::move(cb);
  return {};
}

// ─── run ────────────────────────────────────────────────────────────────

auto LoadTest::run() -> std::expected<Result, Error> {
  if (started_.exchange(true)) {
    return std::unexpected(state_error("run() may only be called once"));
  }
  if (auto ok = validate(cfg_); !ok) {
    finished_ = true;
    return std::unexpected(ok.error());
  }
  if (registry_.empty()) {
    finished_ = true;
    return std::unexpected(configuration_error("no scenarios registered"));
  }
  if (!pattern_) {
    finished_ = true;
    return std::unexpected(configuration_error("no rate pattern set"));
  }
  if (auto ok = registry_.freeze(); !ok) {
    finished_ = true;
    return std::unexpected(ok.error());
  }

  SharedContext shared{cfg_.seed};
  {
    std::lock_guard lock(control_mutex_);
    metrics_ = std::make_unique<MetricsAggregator>(cfg_.max_samples, cfg_.seed);
  }

  // 1. Optional live dashboard on its own thread.
  std::unique_ptr<DashboardServer> dashboard;
  std::thread dashboard_thread;
  if (cfg_.dashboard_port) {
    try {
      dashboard = std::make_unique<DashboardServer>(*cfg_.dashboard_port);
    } catch (const boost::system::system_error &e) {
      finished_ = true;
      return std::unexpected(configuration_error(
          "cannot start dashboard on port " +
          std::to_string(*cfg_.dashboard_port) + ": " + e.what()));
    }
    dashboard->set_stats_provider(
        [this] { return nlohmann::json(statistics()).dump(); });
    dashboard->set_metrics_provider(
        [this] { return PrometheusReport{}.render(statistics(), cfg_.name); });
    dashboard->set_stop_handler([this] { stop(); });
    dashboard_thread = std::thread([d = dashboard.get()] { d->run(); });
  }

  // 2. Scheduler, published for stop()/cancel().
  Scheduler scheduler{cfg_, *pattern_, registry_, *metrics_, shared};
  scheduler.set_progress_callback(
      [this, d = dashboard.get()](const ProgressUpdate &update) {
        on_progress(update);
        if (d) {
          d->publish(nlohmann::json(update).dump());
        }
      });
  {
    std::lock_guard lock(control_mutex_);
    scheduler_ = &scheduler;
    dashboard_ = dashboard.get();
    // Requests that arrived while the dashboard was starting.
    if (pending_cancel_) {
      scheduler.cancel();
    } else if (pending_stop_) {
      scheduler.stop();
    }
  }

  auto stats = scheduler.run();

  {
    std::lock_guard lock(control_mutex_);
    scheduler_ = nullptr;
    dashboard_ = nullptr;
  }
  if (dashboard) {
    dashboard->stop();
    dashboard_thread.join();
  }

  if (!stats) {
    final_phase_ = Phase::Cancelled;
    finished_ = true;
    return std::unexpected(stats.error());
  }

  result_ = Result{.config = cfg_,
                   .pattern = pattern_->describe(),
                   .snapshot = metrics_->get_statistics(),
                   .final_phase = stats->final_phase,
                   .dispatched = stats->dispatched,
                   .admitted = stats->admitted,
                   .peak_in_flight = stats->peak_in_flight,
                   .peak_running = stats->peak_running};
  final_phase_ = stats->final_phase;
  finished_ = true;
  return *result_;
}

// ─── Control ────────────────────────────────────────────────────────────

void LoadTest::stop() {
  std::lock_guard lock(control_mutex_);
  if (scheduler_) {
    scheduler_->stop();
  } else if (running()) {
    pending_stop_ = true;
  }
}

void LoadTest::cancel() {
  std::lock_guard lock(control_mutex_);
  if (scheduler_) {
    scheduler_->cancel();
  } else if (running()) {
    pending_cancel_ = true;
  }
}

auto LoadTest::running() const noexcept -> bool {
  return started_.load(std::memory_order_acquire) &&
         !finished_.load(std::memory_order_acquire);
}

auto LoadTest::phase() const -> Phase {
  std::lock_guard lock(control_mutex_);
  if (scheduler_) {
    return scheduler_->phase();
  }
  return final_phase_.load(std::memory_order_acquire);
}

auto LoadTest::dashboard_port() const -> std::optional<unsigned short> {
  std::lock_guard lock(control_mutex_);
  if (dashboard_) {
    return dashboard_->port();
  }
  return std::nullopt;
}

auto LoadTest::statistics() const -> MetricsSnapshot {
  const MetricsAggregator *metrics = nullptr;
  {
    std::lock_guard lock(control_mutex_);
    metrics = metrics_.get();
  }
  return metrics ? metrics->get_statistics() : MetricsSnapshot{};
}

// ─── Reporting ──────────────────────────────────────────────────────────

auto LoadTest::report(ReportFormat format,
                      const std::optional<std::filesystem::path> &output) const
    -> std::expected<std::string, Error> {
  return report(*make_renderer(format), output);
}

auto LoadTest::report(const ReportRenderer &renderer,
                      const std::optional<std::filesystem::path> &output) const
    -> std::expected<std::string, Error> {
  if (!finished_.load(std::memory_order_acquire) || !result_) {
    return std::unexpected(state_error("no result: run() has not completed"));
  }

  auto text = renderer.render(*result_);

  if (output) {
    std::ofstream file(*output, std::ios::binary | std::ios::trunc);
    if (!file) {
      return std::unexpected(configuration_error(
          "cannot open report output '" + output->string() + "'"));
    }
    file << text;
    if (!file) {
      return std::unexpected(configuration_error(
          "failed writing report output '" + output->string() + "'"));
    }
  }
  return text;
}

// ─── Progress ───────────────────────────────────────────────────────────

void LoadTest::on_progress(const ProgressUpdate &update) {
  if (cfg_.console_output) {
    print_progress(update);
  }
  if (user_progress_) {
    user_progress_(update);
  }
}

void LoadTest::print_progress(const ProgressUpdate &u) const {
  const auto &c = u.counters;
  std::ostringstream line;
  line << std::fixed << std::setprecision(1) << "\r  [" << to_string(u.phase)
       << "] " << u.elapsed_seconds << "s  rate " << u.target_rate
       << "/s  in-flight " << u.in_flight << "  ok " << c.successful
       << "  failed " << c.failed << "  timeout " << c.timed_out
       << "  throttled " << c.throttled;
  if (c.abandoned > 0) {
    line << "  abandoned " << c.abandoned;
  }
  if (u.phase == Phase::Warmup || c.warmup > 0) {
    line << "  warmup " << c.warmup;
  }
  line << "    ";

  std::cout << line.str() << std::flush;
  if (u.phase == Phase::Stopped || u.phase == Phase::Cancelled) {
    std::cout << '\n';
  }
}

} // namespace surge
