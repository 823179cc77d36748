#pragma once
/// @file http_workload.hpp
/// @brief Workload issuing one HTTP/1.1 request per execution (Boost.Beast).

#include "core/error.hpp"
#include "core/types.hpp"
#include "network/url.hpp"
#include "workload/workload.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace surge {

/// @brief Request template for HttpWorkload.
struct HttpRequestConfig {
  std::string method = "GET";
  std::string url; ///< http://host[:port]/path
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  std::string content_type = "application/json";
  /// Builds a fresh body per execution; overrides @c body when set.
  std::function<std::string(SharedContext &)> body_factory;
  Seconds timeout{30.0}; ///< Whole-request budget.
};

/// @brief One connection and one request per execution. A 2xx status is a
/// success; any other status is a failure carrying the code.
class HttpWorkload final : public Workload {
public:
  /// @brief Validate the URL and method.
  [[nodiscard]] static auto create(std::string name, HttpRequestConfig cfg)
      -> std::expected<std::shared_ptr<HttpWorkload>, Error>;

  [[nodiscard]] auto kind() const noexcept -> WorkloadKind override {
    return WorkloadKind::NetworkCall;
  }

  [[nodiscard]] auto execute(ExecutionContext &ctx) -> Outcome override;

  [[nodiscard]] auto config() const noexcept -> const HttpRequestConfig & {
    return cfg_;
  }

private:
  struct Token {
    explicit Token() = default;
  };

public:
  /// @brief Only reachable through create().
  HttpWorkload(Token, std::string name, HttpRequestConfig cfg, Url url);

private:
  HttpRequestConfig cfg_;
  Url url_;
};

} // namespace surge
