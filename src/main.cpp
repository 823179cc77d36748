/// @file main.cpp
/// @brief `surge` command-line driver.
///
/// Builds a RatePattern and one workload (HTTP, WebSocket or a simulated
/// service) from the command line, runs a LoadTest, and prints or writes
/// the report. Ctrl-C stops gracefully; a second Ctrl-C cancels.

#include "network/http_workload.hpp"
#include "network/websocket_workload.hpp"
#include "orchestrator/load_test.hpp"
#include "workload/simulated_workload.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <expected>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

using namespace surge;

// ─── CLI argument parsing ───────────────────────────────────────────────

struct CliArgs {
  RunConfig run;
  std::string pattern = "constant";
  double rate = 10.0;      // Base / start / target rate.
  double rate_end = 100.0; // Ramp, step and spike peak rate.
  double ramp_seconds = 30.0;
  double interval_seconds = 10.0; // Spike interval, step duration.
  double spike_seconds = 2.0;
  double burst_delay = 5.0;
  double jitter = 0.1;
  std::size_t steps = 5;
  std::optional<std::uint64_t> pattern_seed;

  std::string url; // Empty = simulated service.
  std::string method = "GET";
  std::string body;
  std::size_t min_latency_ms = 5;
  std::size_t max_latency_ms = 50;
  double failure_rate = 0.0;

  ReportFormat format = ReportFormat::Console;
  std::optional<std::string> output;
};

void print_usage(const char *prog) {
  std::cout
      << "Usage: " << prog << " [options]\n\n"
      << "Run:\n"
      << "  --name <S>             Test name (default: Load Test)\n"
      << "  --duration <SEC>       Measured duration (default: 60)\n"
      << "  --warmup <SEC>         Warmup excluded from metrics (default: 5)\n"
      << "  --max-concurrent <N>   Admission slots (default: 1000)\n"
      << "  --queue <N>            Wait queue when slots are full (default: "
         "0)\n"
      << "  --grace <SEC>          Drain grace timeout (default: 30)\n"
      << "  --timeout <SEC>        Per-execution timeout (default: none)\n"
      << "  --workers <N>          Worker threads (default: auto)\n"
      << "  --seed <N>             Seed workload selection\n"
      << "\nPattern:\n"
      << "  --pattern <P>          constant|ramp|spike|burst|steady|step|chaos\n"
      << "  --rate <R>             Base, start or target rate (default: 10)\n"
      << "  --rate-end <R>         Peak or end rate (default: 100)\n"
      << "  --ramp <SEC>           Ramp duration (default: 30)\n"
      << "  --interval <SEC>       Spike interval / step length (default: 10)\n"
      << "  --spike <SEC>          Spike or burst length (default: 2)\n"
      << "  --delay <SEC>          Burst start (default: 5)\n"
      << "  --jitter <F>           Steady-state jitter fraction (default: 0.1)\n"
      << "  --steps <N>            Step count (default: 5)\n"
      << "  --pattern-seed <N>     Seed steady/chaos randomness\n"
      << "\nTarget:\n"
      << "  --url <URL>            http:// or ws:// target (default: "
         "simulated)\n"
      << "  --method <M>           HTTP method (default: GET)\n"
      << "  --body <S>             Request body / WebSocket message\n"
      << "  --latency <MIN:MAX>    Simulated latency in ms (default: 5:50)\n"
      << "  --failure-rate <F>     Simulated failure probability (default: "
         "0)\n"
      << "\nOutput:\n"
      << "  --dashboard <PORT>     Serve the live dashboard\n"
      << "  --report <F>           console|json|prometheus (default: "
         "console)\n"
      << "  --output <PATH>        Also write the report to PATH\n"
      << "  --no-progress          Disable progress output\n"
      << "  --help                 Show this help\n";
}

auto parse_args(int argc, char *argv[]) -> CliArgs {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "--name" && i + 1 < argc) {
      args.run.name = argv[++i];
    } else if (arg == "--duration" && i + 1 < argc) {
      args.run.duration = Seconds{std::stod(argv[++i])};
    } else if (arg == "--warmup" && i + 1 < argc) {
      args.run.warmup_duration = Seconds{std::stod(argv[++i])};
    } else if (arg == "--max-concurrent" && i + 1 < argc) {
      args.run.max_concurrent = std::stoull(argv[++i]);
    } else if (arg == "--queue" && i + 1 < argc) {
      args.run.queue_capacity = std::stoull(argv[++i]);
    } else if (arg == "--grace" && i + 1 < argc) {
      args.run.grace_timeout = Seconds{std::stod(argv[++i])};
    } else if (arg == "--timeout" && i + 1 < argc) {
      args.run.execution_timeout = Seconds{std::stod(argv[++i])};
    } else if (arg == "--workers" && i + 1 < argc) {
      args.run.worker_threads = std::stoull(argv[++i]);
    } else if (arg == "--seed" && i + 1 < argc) {
      args.run.seed = std::stoull(argv[++i]);
    } else if (arg == "--pattern" && i + 1 < argc) {
      args.pattern = argv[++i];
    } else if (arg == "--rate" && i + 1 < argc) {
      args.rate = std::stod(argv[++i]);
    } else if (arg == "--rate-end" && i + 1 < argc) {
      args.rate_end = std::stod(argv[++i]);
    } else if (arg == "--ramp" && i + 1 < argc) {
      args.ramp_seconds = std::stod(argv[++i]);
    } else if (arg == "--interval" && i + 1 < argc) {
      args.interval_seconds = std::stod(argv[++i]);
    } else if (arg == "--spike" && i + 1 < argc) {
      args.spike_seconds = std::stod(argv[++i]);
    } else if (arg == "--delay" && i + 1 < argc) {
      args.burst_delay = std::stod(argv[++i]);
    } else if (arg == "--jitter" && i + 1 < argc) {
      args.jitter = std::stod(argv[++i]);
    } else if (arg == "--steps" && i + 1 < argc) {
      args.steps = std::stoull(argv[++i]);
    } else if (arg == "--pattern-seed" && i + 1 < argc) {
      args.pattern_seed = std::stoull(argv[++i]);
    } else if (arg == "--url" && i + 1 < argc) {
      args.url = argv[++i];
    } else if (arg == "--method" && i + 1 < argc) {
      args.method = argv[++i];
    } else if (arg == "--body" && i + 1 < argc) {
      args.body = argv[++i];
    } else if (arg == "--latency" && i + 1 < argc) {
      std::string range = argv[++i];
      auto colon = range.find(':');
      args.min_latency_ms = std::stoull(range.substr(0, colon));
      args.max_latency_ms = colon == std::string::npos
                                ? args.min_latency_ms
                                : std::stoull(range.substr(colon + 1));
    } else if (arg == "--failure-rate" && i + 1 < argc) {
      args.failure_rate = std::stod(argv[++i]);
    } else if (arg == "--dashboard" && i + 1 < argc) {
      args.run.dashboard_port = static_cast<unsigned short>(std::stoul(argv[++i]));
    } else if (arg == "--report" && i + 1 < argc) {
      auto format = parse_report_format(argv[++i]);
      if (!format) {
        throw std::invalid_argument(format.error().message);
      }
      args.format = *format;
    } else if (arg == "--output" && i + 1 < argc) {
      args.output = argv[++i];
    } else if (arg == "--no-progress") {
      args.run.console_output = false;
    } else {
      throw std::invalid_argument("unknown or incomplete option '" + arg + "'");
    }
  }
  return args;
}

auto build_pattern(const CliArgs &a) -> std::expected<RatePattern, Error> {
  if (a.pattern == "constant")
    return RatePattern::constant(a.rate);
  if (a.pattern == "ramp")
    return RatePattern::ramp(a.rate, a.rate_end, Seconds{a.ramp_seconds});
  if (a.pattern == "spike")
    return RatePattern::spike(a.rate, a.rate_end, Seconds{a.spike_seconds},
                              Seconds{a.interval_seconds});
  if (a.pattern == "burst")
    return RatePattern::burst(a.rate, a.rate_end, Seconds{a.spike_seconds},
                              Seconds{a.burst_delay});
  if (a.pattern == "steady")
    return RatePattern::jittered(a.rate, a.jitter, Distribution::Uniform,
                                 a.pattern_seed);
  if (a.pattern == "step")
    return RatePattern::step_ladder(a.rate, a.rate_end, a.steps,
                                    Seconds{a.interval_seconds});
  if (a.pattern == "chaos")
    return RatePattern::chaos({.min_rate = a.rate,
                               .max_rate = a.rate_end,
                               .distribution = Distribution::Uniform,
                               .change_interval = Seconds{1.0},
                               .seed = a.pattern_seed});
  return std::unexpected(
      configuration_error("unknown pattern '" + a.pattern + "'"));
}

auto build_workload(const CliArgs &a)
    -> std::expected<std::shared_ptr<Workload>, Error> {
  if (a.url.empty()) {
    return std::make_shared<SimulatedWorkload>(
        "simulated",
        SimulatedServiceConfig{
            .min_latency = std::chrono::milliseconds(a.min_latency_ms),
            .max_latency = std::chrono::milliseconds(a.max_latency_ms),
            .failure_rate = a.failure_rate,
            .payload_bytes = 0,
        });
  }
  if (a.url.starts_with("ws://")) {
    WebSocketConfig cfg;
    cfg.url = a.url;
    if (!a.body.empty()) {
      cfg.message = a.body;
    }
    auto w = WebSocketWorkload::create({}, std::move(cfg));
    if (!w) {
      return std::unexpected(w.error());
    }
    return std::shared_ptr<Workload>(std::move(*w));
  }
  HttpRequestConfig req;
  req.method = a.method;
  req.url = a.url;
  req.body = a.body;
  auto w = HttpWorkload::create({}, std::move(req));
  if (!w) {
    return std::unexpected(w.error());
  }
  return std::shared_ptr<Workload>(std::move(*w));
}

} // namespace

// ─── Main ───────────────────────────────────────────────────────────────

int main(int argc, char *argv[]) {
  CliArgs args;
  try {
    args = parse_args(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << "ERROR: " << e.what() << "\n\n";
    print_usage(argv[0]);
    return 2;
  }

  // 1. Pattern and workload.
  auto pattern = build_pattern(args);
  if (!pattern) {
    std::cerr << "ERROR: " << pattern.error().what() << '\n';
    return 2;
  }
  auto workload = build_workload(args);
  if (!workload) {
    std::cerr << "ERROR: " << workload.error().what() << '\n';
    return 2;
  }

  std::cout << "\n  " << args.run.name << '\n'
            << "  Pattern:    " << pattern->describe() << '\n'
            << "  Target:     " << (*workload)->name() << '\n'
            << "  Duration:   " << args.run.duration.count() << " s (+"
            << args.run.warmup_duration.count() << " s warmup)\n";
  if (args.run.dashboard_port) {
    std::cout << "  Dashboard:  http://localhost:" << *args.run.dashboard_port
              << "/api/stats\n";
  }
  std::cout << '\n';

  // 2. Configure the test.
  LoadTest test;
  auto configured = test.configure(args.run);
  if (configured) {
    configured = test.add_scenario(*workload);
  }
  if (configured) {
    configured = test.set_pattern(std::move(*pattern));
  }
  if (!configured) {
    std::cerr << "ERROR: " << configured.error().what() << '\n';
    return 2;
  }

  // 3. Ctrl-C: first stops, second cancels.
  boost::asio::io_context signal_ioc{1};
  boost::asio::signal_set signals{signal_ioc, SIGINT, SIGTERM};
  std::function<void(const boost::system::error_code &, int)> on_signal;
  int interrupts = 0;
  on_signal = [&](const boost::system::error_code &ec, int) {
    if (ec)
      return;
    if (++interrupts == 1) {
      std::cout << "\n[surge] Stopping (Ctrl-C again to cancel)\n";
      test.stop();
    } else {
      std::cout << "\n[surge] Cancelling\n";
      test.cancel();
    }
    signals.async_wait(on_signal);
  };
  signals.async_wait(on_signal);
  std::thread signal_thread([&signal_ioc] { signal_ioc.run(); });

  // 4. Run.
  auto result = test.run();

  signal_ioc.stop();
  signal_thread.join();

  if (!result) {
    std::cerr << "ERROR: " << result.error().what() << '\n';
    return 1;
  }

  // 5. Report.
  auto report = test.report(args.format, args.output);
  if (!report) {
    std::cerr << "ERROR: " << report.error().what() << '\n';
    return 1;
  }
  std::cout << *report << '\n';
  if (args.output) {
    std::cout << "  Report written to " << *args.output << '\n';
  }

  return result->cancelled() ? 130 : 0;
}
