/// @file report.cpp
/// @brief Console, JSON and Prometheus renderers.

#include "report/report.hpp"
#include "serialization/json_serializer.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace surge {

auto parse_report_format(std::string_view name)
    -> std::expected<ReportFormat, Error> {
  if (name == "console" || name == "text")
    return ReportFormat::Console;
  if (name == "json")
    return ReportFormat::Json;
  if (name == "prometheus" || name == "prom")
    return ReportFormat::Prometheus;
  return std::unexpected(configuration_error(
      "unknown report format '" + std::string{name} +
      "' (expected console|json|prometheus)"));
}

auto make_renderer(ReportFormat format) -> std::unique_ptr<ReportRenderer> {
  switch (format) {
  case ReportFormat::Console:
    return std::make_unique<ConsoleReport>();
  case ReportFormat::Json:
    return std::make_unique<JsonReport>();
  case ReportFormat::Prometheus:
    return std::make_unique<PrometheusReport>();
  }
  return std::make_unique<ConsoleReport>();
}

// ─── Console ────────────────────────────────────────────────────────────

namespace {

void separator(std::ostringstream &os) { os << std::string(60, '=') << '\n'; }

auto percent_of(std::size_t part, std::size_t whole) -> double {
  return whole > 0 ? 100.0 * static_cast<double>(part) /
                         static_cast<double>(whole)
                   : 0.0;
}

} // namespace

auto ConsoleReport::render(const Result &result) const -> std::string {
  const auto &m = result.snapshot;
  std::ostringstream os;

  os << '\n';
  separator(os);
  os << "  " << result.config.name << " (" << to_string(result.final_phase)
     << ")\n";
  separator(os);

  os << std::fixed << std::setprecision(1);

  os << "\n  Load\n"
     << "    Pattern:     " << result.pattern << '\n'
     << "    Dispatched:  " << result.dispatched << '\n'
     << "    Admitted:    " << result.admitted << '\n'
     << "    Peak Slots:  " << result.peak_in_flight << " / "
     << result.config.max_concurrent << '\n'
     << "    Peak Busy:   " << result.peak_running << " / "
     << effective_workers(result.config) << " workers\n";

  os << "\n  Requests\n"
     << "    Total:       " << m.total_requests << '\n'
     << "    Successful:  " << m.successful << '\n'
     << "    Failed:      " << m.failed << '\n'
     << "    Success Rate:" << std::setw(7) << m.success_rate() << " %\n";

  // Client-side limits, kept apart from target failures.
  const auto attempted = m.total_requests + m.throttled + m.abandoned;
  os << "\n  Not Completed\n"
     << "    Timed Out:   " << m.timed_out << std::setw(8)
     << percent_of(m.timed_out, attempted) << " %\n"
     << "    Throttled:   " << m.throttled << std::setw(8)
     << percent_of(m.throttled, attempted) << " %\n"
     << "    Abandoned:   " << m.abandoned << std::setw(8)
     << percent_of(m.abandoned, attempted) << " %\n"
     << "    Warmup:      " << m.warmup << " (excluded)\n";

  os << "\n  Throughput\n"
     << "    Duration:    " << std::setprecision(3) << m.elapsed_seconds
     << " s\n"
     << "    Rate:        " << std::setprecision(1) << m.throughput_rps()
     << " req/s\n";

  os << std::setprecision(2);
  os << "\n  Latency\n"
     << "    Min:         " << m.latency.min_ms << " ms\n"
     << "    Avg:         " << m.latency.mean_ms << " ms\n"
     << "    P50:         " << m.latency.p50_ms << " ms\n"
     << "    P90:         " << m.latency.p90_ms << " ms\n"
     << "    P95:         " << m.latency.p95_ms << " ms\n"
     << "    P99:         " << m.latency.p99_ms << " ms\n"
     << "    Max:         " << m.latency.max_ms << " ms\n";

  if (!m.status_codes.empty()) {
    os << "\n  Status Codes\n";
    for (const auto &[code, count] : m.status_codes) {
      os << "    " << std::left << std::setw(13) << code << std::right
         << count << '\n';
    }
  }

  if (!m.errors.empty()) {
    os << "\n  Errors\n";
    for (const auto &[type, count] : m.errors) {
      os << "    " << std::left << std::setw(13) << type << std::right
         << count << '\n';
    }
  }

  if (m.workloads.size() > 1) {
    os << "\n  Workloads\n";
    for (const auto &[name, w] : m.workloads) {
      os << "    " << name << ": " << w.total << " total, " << w.successful
         << " ok, " << w.failed << " failed, " << w.timed_out
         << " timed out\n";
    }
  }

  if (!m.custom_metrics.empty()) {
    os << "\n  Custom Metrics\n";
    for (const auto &[name, s] : m.custom_metrics) {
      os << "    " << name << ": n=" << s.count << " mean=" << s.mean
         << " p95=" << s.p95 << " max=" << s.max << '\n';
    }
  }

  separator(os);
  return os.str();
}

// ─── JSON ───────────────────────────────────────────────────────────────

auto JsonReport::render(const Result &result) const -> std::string {
  return nlohmann::json(result).dump(indent_);
}

// ─── Prometheus ─────────────────────────────────────────────────────────

auto sanitize_metric_name(std::string_view name) -> std::string {
  std::string out;
  out.reserve(name.size() + 1);
  for (char c : name) {
    const auto u = static_cast<unsigned char>(c);
    out.push_back(std::isalnum(u) || c == '_' || c == ':' ? c : '_');
  }
  if (!out.empty() && std::isdigit(static_cast<unsigned char>(out.front()))) {
    out.insert(out.begin(), '_');
  }
  return out;
}

auto escape_label_value(std::string_view value) -> std::string {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\n':
      out += "\\n";
      break;
    default:
      out.push_back(c);
    }
  }
  return out;
}

namespace {

class Exposition {
public:
  Exposition(std::string prefix, std::string test_label)
      : prefix_{std::move(prefix)}, test_{std::move(test_label)} {}

  void family(std::string_view name, std::string_view type,
              std::string_view help) {
    current_ = sanitize_metric_name(prefix_ + "_" + std::string{name});
    os_ << "# HELP " << current_ << ' ' << help << '\n'
        << "# TYPE " << current_ << ' ' << type << '\n';
  }

  /// @param labels Pre-formatted extra labels, e.g. `code="200"`.
  void sample(double value, std::string_view labels = {},
              std::string_view suffix = {}) {
    os_ << current_ << suffix << "{test=\"" << test_ << '"';
    if (!labels.empty()) {
      os_ << ',' << labels;
    }
    os_ << "} " << value << '\n';
  }

  [[nodiscard]] auto str() const -> std::string { return os_.str(); }

private:
  std::string prefix_;
  std::string test_;
  std::string current_;
  std::ostringstream os_;
};

auto label(std::string_view key, std::string_view value) -> std::string {
  return std::string{key} + "=\"" + escape_label_value(value) + '"';
}

auto as_double(std::size_t v) -> double { return static_cast<double>(v); }

} // namespace

auto PrometheusReport::render(const MetricsSnapshot &m,
                              std::string_view test_name) const
    -> std::string {
  Exposition ex{prefix_, escape_label_value(test_name)};

  ex.family("requests_total", "counter", "Completed measured requests.");
  ex.sample(as_double(m.total_requests));

  ex.family("requests_by_outcome_total", "counter",
            "Executions by outcome, including throttled and abandoned.");
  ex.sample(as_double(m.successful), label("outcome", "success"));
  ex.sample(as_double(m.failed), label("outcome", "failure"));
  ex.sample(as_double(m.timed_out), label("outcome", "timeout"));
  ex.sample(as_double(m.throttled), label("outcome", "throttled"));
  ex.sample(as_double(m.abandoned), label("outcome", "abandoned"));

  ex.family("warmup_requests_total", "counter",
            "Requests completed during warmup (excluded).");
  ex.sample(as_double(m.warmup));

  ex.family("success_rate_percent", "gauge", "Successful share of total.");
  ex.sample(m.success_rate());

  ex.family("throughput_rps", "gauge", "Completed requests per second.");
  ex.sample(m.throughput_rps());

  ex.family("response_time_seconds", "summary", "Execution duration.");
  const std::pair<const char *, double> quantiles[] = {
      {"0.5", m.latency.p50_ms},  {"0.9", m.latency.p90_ms},
      {"0.95", m.latency.p95_ms}, {"0.99", m.latency.p99_ms},
      {"0.999", m.latency.p999_ms},
  };
  for (const auto &[q, ms] : quantiles) {
    ex.sample(ms / 1000.0, label("quantile", q));
  }
  ex.sample(m.latency.mean_ms / 1000.0 * as_double(m.latency.samples), {},
            "_sum");
  ex.sample(as_double(m.latency.samples), {}, "_count");

  if (!m.status_codes.empty()) {
    ex.family("responses_by_code_total", "counter",
              "Responses by status code.");
    for (const auto &[code, count] : m.status_codes) {
      ex.sample(as_double(count), label("code", std::to_string(code)));
    }
  }

  if (!m.errors.empty()) {
    ex.family("errors_total", "counter", "Errors by type.");
    for (const auto &[type, count] : m.errors) {
      ex.sample(as_double(count), label("type", type));
    }
  }

  for (const auto &[name, s] : m.custom_metrics) {
    ex.family("custom_" + name, "summary", "Custom metric " + name + ".");
    ex.sample(s.p50, label("quantile", "0.5"));
    ex.sample(s.p95, label("quantile", "0.95"));
    ex.sample(s.p99, label("quantile", "0.99"));
    ex.sample(s.sum, {}, "_sum");
    ex.sample(as_double(s.count), {}, "_count");
  }

  ex.family("elapsed_seconds", "gauge", "Measured window length.");
  ex.sample(m.elapsed_seconds);

  return ex.str();
}

auto PrometheusReport::render(const Result &result) const -> std::string {
  auto text = render(result.snapshot, result.config.name);

  Exposition ex{prefix_, escape_label_value(result.config.name)};
  ex.family("dispatched_total", "counter", "Dispatch events emitted.");
  ex.sample(static_cast<double>(result.dispatched));
  ex.family("peak_in_flight", "gauge", "Peak admission slots held.");
  ex.sample(as_double(result.peak_in_flight));
  ex.family("peak_running", "gauge", "Peak executions running on workers.");
  ex.sample(as_double(result.peak_running));
  ex.family("max_concurrent", "gauge", "Admission ceiling.");
  ex.sample(as_double(result.config.max_concurrent));

  return text + ex.str();
}

} // namespace surge
