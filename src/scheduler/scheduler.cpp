/// @file scheduler.cpp
/// @brief Tick accumulator, admission control and phase machine.

#include "scheduler/scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <random>
#include <stop_token>
#include <utility>
#include <vector>

namespace surge {

namespace {

auto to_clock(Seconds s) -> Clock::duration {
  return std::chrono::duration_cast<Clock::duration>(s);
}

auto to_outcome_duration(Clock::duration d) -> Outcome::Duration {
  return std::chrono::duration_cast<Outcome::Duration>(d);
}

void raise_peak(std::atomic<std::size_t> &peak, std::size_t value) {
  auto current = peak.load(std::memory_order_relaxed);
  while (value > current &&
         !peak.compare_exchange_weak(current, value,
                                     std::memory_order_acq_rel)) {
  }
}

} // namespace

// ─── Execution ──────────────────────────────────────────────────────────

/// One admitted execution. Exactly one of the worker, the deadline timer
/// and abandon_all() wins the CAS out of Running; the winner records the
/// outcome and releases the slot. The deadline is armed only once a worker
/// has picked the execution up, so waiting for a free worker never counts
/// against the execution budget.
struct Scheduler::Execution {
  enum class State : std::uint8_t { Running, Completed, TimedOut, Abandoned };

  Execution(const DispatchEvent &ev, std::shared_ptr<Workload> w,
            Phase admitted, net::io_context &ioc)
      : event{ev}, workload{std::move(w)}, admitted_phase{admitted},
        deadline{ioc} {}

  auto claim(State to) -> bool {
    auto expected = State::Running;
    return state.compare_exchange_strong(expected, to,
                                         std::memory_order_acq_rel);
  }

  [[nodiscard]] auto running() const -> bool {
    return state.load(std::memory_order_acquire) == State::Running;
  }

  /// Time since a worker started it; zero if it never started.
  [[nodiscard]] auto elapsed(Clock::time_point now) const -> Clock::duration {
    const auto begin = started.load(std::memory_order_acquire);
    return begin == Clock::time_point{} ? Clock::duration{0} : now - begin;
  }

  DispatchEvent event;
  std::shared_ptr<Workload> workload;
  Phase admitted_phase;
  std::atomic<Clock::time_point> started{Clock::time_point{}};
  std::atomic<State> state{State::Running};
  std::stop_source stop;
  net::steady_timer deadline;
};

// ─── Construction ───────────────────────────────────────────────────────

Scheduler::Scheduler(RunConfig cfg, const RatePattern &pattern,
                     const WorkloadRegistry &registry,
                     MetricsAggregator &metrics, SharedContext &shared)
    : cfg_{std::move(cfg)}, pattern_{pattern}, registry_{registry},
      metrics_{metrics}, shared_{shared}, tick_timer_{ioc_},
      grace_timer_{ioc_}, progress_timer_{ioc_},
      engine_{cfg_.seed.value_or(std::random_device{}())} {}

Scheduler::~Scheduler() = default;

void Scheduler::set_progress_callback(ProgressCallback cb) {
  on_progress_ = std::move(cb);
}

// ─── run ────────────────────────────────────────────────────────────────

auto Scheduler::run() -> std::expected<RunStats, Error> {
  if (started_.exchange(true)) {
    return std::unexpected(state_error("scheduler has already been run"));
  }
  if (auto ok = validate(cfg_); !ok) {
    done_ = true;
    return std::unexpected(ok.error());
  }
  if (!registry_.frozen() || registry_.empty()) {
    done_ = true;
    return std::unexpected(
        configuration_error("workload registry must be frozen and non-empty"));
  }

  for (const auto &entry : registry_.entries()) {
    try {
      entry.workload->setup(shared_);
    } catch (const std::exception &e) {
      done_ = true;
      return std::unexpected(scheduler_error(
          "setup of '" + std::string{entry.workload->name()} +
          "' failed: " + e.what()));
    }
  }

  pool_ = std::make_unique<net::thread_pool>(effective_workers(cfg_));
  work_.emplace(net::make_work_guard(ioc_));

  log("Starting '" + cfg_.name + "' (" + pattern_.describe() + ", " +
      std::to_string(cfg_.max_concurrent) + " slots, " +
      std::to_string(effective_workers(cfg_)) + " workers)");

  metrics_.start();
  t0_ = Clock::now();
  next_tick_ = t0_;
  phase_.store(cfg_.warmup_duration.count() > 0.0 ? Phase::Warmup
                                                  : Phase::Measuring,
               std::memory_order_release);

  // A stop or cancel requested before run() takes effect here.
  net::post(ioc_, [this] {
    bool stop = false;
    bool cancel = false;
    {
      std::lock_guard lock(dispatch_mutex_);
      stop = stop_requested_.load(std::memory_order_acquire);
      cancel = cancel_requested_.load(std::memory_order_acquire);
    }
    if (stop) {
      begin_drain(cancel);
      return;
    }
    on_tick();
  });
  if (on_progress_) {
    schedule_progress();
  }

  std::optional<Error> fault;
  try {
    ioc_.run();
  } catch (const std::exception &e) {
    fault = scheduler_error(std::string{"scheduling loop failed: "} +
                            e.what());
    log(fault->message);
    // Nothing else will complete on this loop.
    {
      std::lock_guard lock(dispatch_mutex_);
      stop_requested_ = true;
      cancel_requested_ = true;
    }
    phase_ = Phase::Draining;
    abandon_all();
    flush_queue();
    metrics_.finalize();
    phase_ = Phase::Cancelled;
    work_.reset();
  }
  done_ = true;

  pool_->join();

  for (const auto &entry : registry_.entries()) {
    try {
      entry.workload->teardown(shared_);
    } catch (const std::exception &e) {
      std::cerr << "[Scheduler] teardown of '" << entry.workload->name()
                << "' failed: " << e.what() << "\n";
    }
  }

  if (fault) {
    return std::unexpected(*fault);
  }

  return RunStats{.final_phase = phase(),
                  .dispatched = dispatched(),
                  .admitted = admitted_.load(std::memory_order_acquire),
                  .peak_in_flight = peak_in_flight(),
                  .peak_running = peak_running()};
}

// ─── External control ───────────────────────────────────────────────────

void Scheduler::stop() { request_shutdown(false); }

void Scheduler::cancel() { request_shutdown(true); }

void Scheduler::request_shutdown(bool cancel) {
  if (done_.load(std::memory_order_acquire)) {
    return;
  }
  {
    std::lock_guard lock(dispatch_mutex_);
    if (cancel) {
      if (cancel_requested_.exchange(true)) {
        return;
      }
    } else if (stop_requested_.load(std::memory_order_acquire)) {
      return;
    }
    stop_requested_ = true;
    // Before run() the flags alone are enough: the first handler on the
    // loop reads them under this mutex.
    if (!started_.load(std::memory_order_acquire)) {
      return;
    }
  }
  net::post(ioc_, [this, cancel] { begin_drain(cancel); });
}

auto Scheduler::dispatch_allowed() const noexcept -> bool {
  return !stop_requested_.load(std::memory_order_acquire);
}

// ─── Ticks ──────────────────────────────────────────────────────────────

void Scheduler::schedule_tick() {
  next_tick_ += cfg_.tick_interval;
  // Absolute grid; a late tick is not rescheduled relative to now.
  tick_timer_.expires_at(next_tick_);
  tick_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec) {
      return;
    }
    on_tick();
  });
}

void Scheduler::on_tick() {
  if (finished_ || phase() == Phase::Draining) {
    return;
  }

  const auto now = Clock::now();
  const Seconds elapsed = now - t0_;
  const Seconds end = cfg_.warmup_duration + cfg_.duration;

  if (phase() == Phase::Warmup && elapsed >= cfg_.warmup_duration) {
    phase_.store(Phase::Measuring, std::memory_order_release);
    log("Warmup complete, measuring");
  }

  const Seconds upto = std::min(elapsed, end);
  const double dt = (upto - last_elapsed_).count();
  if (dt > 0.0) {
    current_rate_ = pattern_.rate_at(upto);
    owed_ += current_rate_ * dt;
    const double whole = std::floor(owed_);
    owed_ -= whole;
    const auto count = static_cast<std::uint64_t>(whole);

    for (std::uint64_t i = 0; i < count; ++i) {
      // Spread across (last_elapsed_, upto]; non-decreasing by construction.
      const Seconds at =
          last_elapsed_ + Seconds{dt * static_cast<double>(i + 1) /
                                  static_cast<double>(count)};
      std::lock_guard lock(dispatch_mutex_);
      if (!dispatch_allowed()) {
        break;
      }
      DispatchEvent event{.sequence = next_sequence_++,
                          .scheduled_at = t0_ + to_clock(at),
                          .elapsed = at};
      dispatched_.fetch_add(1, std::memory_order_acq_rel);
      admit(event);
    }
  }
  last_elapsed_ = upto;

  if (elapsed >= end) {
    log("Run duration reached, draining");
    begin_drain(false);
    return;
  }
  schedule_tick();
}

// ─── Admission ──────────────────────────────────────────────────────────

void Scheduler::admit(const DispatchEvent &event) {
  if (in_flight() < cfg_.max_concurrent) {
    launch(event);
    return;
  }
  if (queue_.size() < cfg_.queue_capacity) {
    queue_.push_back(event);
    return;
  }
  metrics_.record(Outcome::throttled(), phase());
}

void Scheduler::launch(const DispatchEvent &event) {
  const auto &entry = registry_.select(engine_);
  auto exec = std::make_shared<Execution>(event, entry.workload, phase(), ioc_);

  raise_peak(peak_in_flight_,
             in_flight_.fetch_add(1, std::memory_order_acq_rel) + 1);
  admitted_.fetch_add(1, std::memory_order_acq_rel);
  active_.emplace(event.sequence, exec);

  net::post(*pool_, [this, exec] { execute(exec); });
}

void Scheduler::arm_deadline(const ExecutionPtr &exec) {
  if (finished_ || !exec->running()) {
    return;
  }
  exec->deadline.expires_at(exec->started.load(std::memory_order_acquire) +
                            to_clock(*cfg_.execution_timeout));
  exec->deadline.async_wait([this, exec](const boost::system::error_code &ec) {
    if (ec) {
      return;
    }
    on_timeout(exec);
  });
}

void Scheduler::pump_queue() {
  while (!queue_.empty() && in_flight() < cfg_.max_concurrent) {
    auto event = queue_.front();
    queue_.pop_front();
    launch(event);
  }
}

void Scheduler::flush_queue() {
  while (!queue_.empty()) {
    queue_.pop_front();
    metrics_.record(Outcome::throttled(), phase());
  }
}

// ─── Completion ─────────────────────────────────────────────────────────

void Scheduler::execute(const ExecutionPtr &exec) {
  if (!exec->running()) {
    return; // Abandoned while waiting for a worker.
  }
  ExecutionContext ctx{exec->event, exec->admitted_phase, shared_,
                       exec->stop.get_token()};
  const auto begin = Clock::now();
  exec->started.store(begin, std::memory_order_release);
  raise_peak(peak_running_,
             running_.fetch_add(1, std::memory_order_acq_rel) + 1);
  if (cfg_.execution_timeout) {
    net::post(ioc_, [this, exec] { arm_deadline(exec); });
  }

  Outcome outcome;
  try {
    outcome = exec->workload->execute(ctx);
  } catch (const std::exception &e) {
    outcome = Outcome::failure(std::string{"exception: "} + e.what());
  } catch (...) {
    outcome = Outcome::failure("exception: non-standard exception thrown");
  }
  const auto end = Clock::now();
  running_.fetch_sub(1, std::memory_order_acq_rel);

  if (!exec->claim(Execution::State::Completed)) {
    return; // Already recorded as timed out or abandoned.
  }

  if (outcome.duration == Outcome::Duration{0}) {
    outcome.duration = to_outcome_duration(end - begin);
  }
  outcome.workload = std::string{exec->workload->name()};
  for (auto &metric : ctx.take_custom()) {
    outcome.custom.push_back(std::move(metric));
  }
  metrics_.record(outcome, completion_phase(end));

  net::post(ioc_, [this, exec] { release_slot(exec); });
}

void Scheduler::on_timeout(const ExecutionPtr &exec) {
  if (!exec->claim(Execution::State::TimedOut)) {
    return;
  }
  exec->stop.request_stop();
  const auto now = Clock::now();
  auto outcome = Outcome::timeout(to_outcome_duration(exec->elapsed(now)));
  outcome.workload = std::string{exec->workload->name()};
  metrics_.record(outcome, completion_phase(now));
  release_slot(exec);
}

void Scheduler::release_slot(const ExecutionPtr &exec) {
  if (active_.erase(exec->event.sequence) == 0) {
    return;
  }
  exec->deadline.cancel();
  in_flight_.fetch_sub(1, std::memory_order_acq_rel);

  if (phase() == Phase::Draining) {
    if (in_flight() == 0) {
      finish();
    }
    return;
  }
  if (dispatch_allowed()) {
    pump_queue();
  }
}

auto Scheduler::completion_phase(Clock::time_point at) const -> Phase {
  return Seconds{at - t0_} < cfg_.warmup_duration ? Phase::Warmup
                                                   : Phase::Measuring;
}

// ─── Draining ───────────────────────────────────────────────────────────

void Scheduler::begin_drain(bool cancel) {
  if (finished_) {
    return;
  }

  if (phase() != Phase::Draining) {
    phase_.store(Phase::Draining, std::memory_order_release);
    {
      std::lock_guard lock(dispatch_mutex_);
      stop_requested_ = true;
    }
    tick_timer_.cancel();
    flush_queue();
    log("Draining " + std::to_string(in_flight()) + " in-flight executions");

    const auto grace = cfg_.grace_timeout;
    if (std::isfinite(grace.count())) {
      grace_timer_.expires_after(to_clock(grace));
      grace_timer_.async_wait([this](const boost::system::error_code &ec) {
        if (ec || finished_) {
          return;
        }
        log("Grace timeout elapsed, abandoning " +
            std::to_string(in_flight()) + " executions");
        abandon_all();
        if (in_flight() == 0) {
          finish();
        }
      });
    }
  }

  if (cancel && !cancelled_) {
    cancelled_ = true;
    log("Cancelled, abandoning " + std::to_string(in_flight()) +
        " executions");
    abandon_all();
  }

  if (in_flight() == 0) {
    finish();
  }
}

void Scheduler::abandon_all() {
  // release_slot() erases from active_.
  std::vector<ExecutionPtr> pending;
  pending.reserve(active_.size());
  for (const auto &[seq, exec] : active_) {
    pending.push_back(exec);
  }

  const auto now = Clock::now();
  for (const auto &exec : pending) {
    if (!exec->claim(Execution::State::Abandoned)) {
      continue; // Completion already posted.
    }
    exec->stop.request_stop();
    auto outcome = Outcome::abandoned(to_outcome_duration(exec->elapsed(now)));
    outcome.workload = std::string{exec->workload->name()};
    metrics_.record(outcome, completion_phase(now));
    exec->deadline.cancel();
    active_.erase(exec->event.sequence);
    in_flight_.fetch_sub(1, std::memory_order_acq_rel);
  }
}

void Scheduler::finish() {
  if (finished_) {
    return;
  }
  finished_ = true;

  tick_timer_.cancel();
  grace_timer_.cancel();
  progress_timer_.cancel();
  flush_queue();
  metrics_.finalize();

  phase_.store(cancelled_ ? Phase::Cancelled : Phase::Stopped,
               std::memory_order_release);
  emit_progress();
  log(std::string{"Run "} + to_string(phase()) + " after " +
      std::to_string(dispatched()) + " dispatches (peak " +
      std::to_string(peak_in_flight()) + " in flight, " +
      std::to_string(peak_running()) + " running)");

  work_.reset();
  ioc_.stop();
}

// ─── Progress ───────────────────────────────────────────────────────────

void Scheduler::schedule_progress() {
  progress_timer_.expires_after(to_clock(cfg_.progress_interval));
  progress_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || finished_) {
      return;
    }
    emit_progress();
    schedule_progress();
  });
}

void Scheduler::emit_progress() {
  if (!on_progress_) {
    return;
  }
  ProgressUpdate update{.phase = phase(),
                        .elapsed_seconds = to_seconds(Clock::now() - t0_),
                        .target_rate = current_rate_,
                        .in_flight = in_flight(),
                        .running = running_.load(std::memory_order_acquire),
                        .queued = queue_.size(),
                        .dispatched = dispatched(),
                        .counters = metrics_.counters()};
  try {
    on_progress_(update);
  } catch (const std::exception &e) {
    std::cerr << "[Scheduler] progress callback failed: " << e.what() << "\n";
  }
}

void Scheduler::log(const std::string &msg) const {
  if (cfg_.console_output) {
    std::cout << "[Scheduler] " << msg << "\n";
  }
}

} // namespace surge
