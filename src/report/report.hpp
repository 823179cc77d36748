#pragma once
/// @file report.hpp
/// @brief Renderers turning a Result into console text, JSON or Prometheus
///        exposition format.

#include "core/error.hpp"
#include "orchestrator/result.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace surge {

/// @brief Built-in report formats.
enum class ReportFormat : std::uint8_t {
  Console,
  Json,
  Prometheus,
};

[[nodiscard]] constexpr auto to_string(ReportFormat f) -> const char * {
  switch (f) {
  case ReportFormat::Console:
    return "console";
  case ReportFormat::Json:
    return "json";
  case ReportFormat::Prometheus:
    return "prometheus";
  }
  return "unknown";
}

/// @brief Parse "console", "json" or "prometheus".
[[nodiscard]] auto parse_report_format(std::string_view name)
    -> std::expected<ReportFormat, Error>;

/// @brief Extension point for report formats (HTML, CSV, ...).
class ReportRenderer {
public:
  virtual ~ReportRenderer() = default;
  [[nodiscard]] virtual auto render(const Result &result) const
      -> std::string = 0;
};

/// @brief Human-readable summary. Throttled, abandoned and timed-out
/// counts are listed apart from application failures.
class ConsoleReport final : public ReportRenderer {
public:
  [[nodiscard]] auto render(const Result &result) const -> std::string override;
};

class JsonReport final : public ReportRenderer {
public:
  explicit JsonReport(int indent = 2) : indent_{indent} {}
  [[nodiscard]] auto render(const Result &result) const -> std::string override;

private:
  int indent_;
};

/// @brief Prometheus text exposition (version 0.0.4).
class PrometheusReport final : public ReportRenderer {
public:
  explicit PrometheusReport(std::string prefix = "surge")
      : prefix_{std::move(prefix)} {}
  [[nodiscard]] auto render(const Result &result) const -> std::string override;

  /// @brief Prometheus exposition for a snapshot alone (dashboard /metrics).
  [[nodiscard]] auto render(const MetricsSnapshot &snapshot,
                            std::string_view test_name) const -> std::string;

private:
  std::string prefix_;
};

[[nodiscard]] auto make_renderer(ReportFormat format)
    -> std::unique_ptr<ReportRenderer>;

/// @brief Replace characters outside [a-zA-Z0-9_:] with '_' and prefix a
///        leading digit with '_'.
[[nodiscard]] auto sanitize_metric_name(std::string_view name) -> std::string;

/// @brief Escape backslash, double quote and newline in a label value.
[[nodiscard]] auto escape_label_value(std::string_view value) -> std::string;

} // namespace surge
