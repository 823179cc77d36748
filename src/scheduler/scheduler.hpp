#pragma once
/// @file scheduler.hpp
/// @brief Rate-driven dispatcher: turns a RatePattern into dispatch events,
///        enforces the admission ceiling and drives the run phases.
///
/// Threading: run() executes a single-threaded boost::asio::io_context on
/// the calling thread (ticks, timeouts, slot release, queue pumping,
/// progress). Workloads run on a bounded boost::asio::thread_pool, so the
/// scheduling loop never blocks on workload I/O. stop() and cancel() may be
/// called from any thread.

#include "core/error.hpp"
#include "core/types.hpp"
#include "metrics/metrics_aggregator.hpp"
#include "pattern/rate_pattern.hpp"
#include "scheduler/run_config.hpp"
#include "workload/shared_context.hpp"
#include "workload/workload_registry.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace surge {

namespace net = boost::asio;

/// @brief Periodic progress sample, emitted on the scheduling thread.
struct ProgressUpdate {
  Phase phase = Phase::Idle;
  double elapsed_seconds = 0.0;
  double target_rate = 0.0;
  std::size_t in_flight = 0; ///< Admitted, holding a slot.
  std::size_t running = 0;   ///< Currently inside Workload::execute().
  std::size_t queued = 0;
  std::uint64_t dispatched = 0;
  LiveCounters counters;
};

using ProgressCallback = std::function<void(const ProgressUpdate &)>;

/// @brief Scheduler-side totals for a finished run.
struct RunStats {
  Phase final_phase = Phase::Stopped; ///< Stopped or Cancelled.
  std::uint64_t dispatched = 0;       ///< Dispatch events emitted.
  std::uint64_t admitted = 0;         ///< Events that obtained a slot.
  std::size_t peak_in_flight = 0; ///< Peak admission slots held.
  std::size_t peak_running = 0;   ///< Peak executions on a worker at once.
};

/// @brief Single-use scheduler for one run.
///
/// Phases: Idle -> Warmup -> Measuring -> Draining -> Stopped | Cancelled.
/// Measuring ends once warmup_duration + duration have elapsed.
class Scheduler {
public:
  /// @param registry Must be frozen; must outlive the scheduler.
  Scheduler(RunConfig cfg, const RatePattern &pattern,
            const WorkloadRegistry &registry, MetricsAggregator &metrics,
            SharedContext &shared);
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  /// @brief Install the progress callback. Call before run().
  void set_progress_callback(ProgressCallback cb);

  /// @brief Run to completion on the calling thread.
  /// @return Totals, or an error for invalid configuration, a second call,
  ///         or an unrecoverable fault.
  auto run() -> std::expected<RunStats, Error>;

  /// @brief Stop dispatching; in-flight work finishes and is recorded.
  /// A request made before run() ends the run as soon as it starts; after
  /// run() has returned this is a no-op.
  void stop();

  /// @brief Stop dispatching; in-flight work is recorded as abandoned.
  /// Latched like stop() when called before run().
  void cancel();

  [[nodiscard]] auto phase() const noexcept -> Phase {
    return phase_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto in_flight() const noexcept -> std::size_t {
    return in_flight_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto peak_in_flight() const noexcept -> std::size_t {
    return peak_in_flight_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto peak_running() const noexcept -> std::size_t {
    return peak_running_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto dispatched() const noexcept -> std::uint64_t {
    return dispatched_.load(std::memory_order_acquire);
  }

private:
  struct Execution;
  using ExecutionPtr = std::shared_ptr<Execution>;

  // All of these run on the scheduling thread.
  void schedule_tick();
  void on_tick();
  void admit(const DispatchEvent &event);
  void launch(const DispatchEvent &event);
  void arm_deadline(const ExecutionPtr &exec);
  void pump_queue();
  void flush_queue();
  void on_timeout(const ExecutionPtr &exec);
  void release_slot(const ExecutionPtr &exec);
  void begin_drain(bool cancel);
  void abandon_all();
  void finish();
  void schedule_progress();
  void emit_progress();

  // Worker thread.
  void execute(const ExecutionPtr &exec);

  void request_shutdown(bool cancel);
  [[nodiscard]] auto completion_phase(Clock::time_point at) const -> Phase;
  [[nodiscard]] auto dispatch_allowed() const noexcept -> bool;
  void log(const std::string &msg) const;

  RunConfig cfg_;
  const RatePattern &pattern_;
  const WorkloadRegistry &registry_;
  MetricsAggregator &metrics_;
  SharedContext &shared_;
  ProgressCallback on_progress_;

  // Declared first so it outlives every timer and execution below.
  net::io_context ioc_{1};
  net::steady_timer tick_timer_;
  net::steady_timer grace_timer_;
  net::steady_timer progress_timer_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_;
  std::unique_ptr<net::thread_pool> pool_;

  std::atomic<Phase> phase_{Phase::Idle};
  std::atomic<bool> started_{false};
  std::atomic<bool> done_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> cancel_requested_{false};
  // Held around each dispatch and while raising the stop flags, so no
  // dispatch can begin once stop()/cancel() has returned.
  std::mutex dispatch_mutex_;

  Clock::time_point t0_{};
  Clock::time_point next_tick_{};
  Seconds last_elapsed_{0.0};
  double owed_ = 0.0;
  double current_rate_ = 0.0;
  std::uint64_t next_sequence_ = 1;
  bool cancelled_ = false;
  bool finished_ = false;

  std::atomic<std::uint64_t> dispatched_{0};
  std::atomic<std::uint64_t> admitted_{0};
  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> peak_in_flight_{0};
  std::atomic<std::size_t> running_{0};
  std::atomic<std::size_t> peak_running_{0};

  std::deque<DispatchEvent> queue_;
  std::unordered_map<std::uint64_t, ExecutionPtr> active_;
  WorkloadRegistry::Engine engine_;
};

} // namespace surge
