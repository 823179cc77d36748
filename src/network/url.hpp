#pragma once
/// @file url.hpp
/// @brief Minimal URL splitting for http:// and ws:// targets.

#include "core/error.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace surge {

struct Url {
  std::string scheme; ///< "http" or "ws".
  std::string host;
  std::string port;   ///< Defaults to "80".
  std::string target; ///< Path plus query, at least "/".

  /// @brief Host header value ("host" or "host:port").
  [[nodiscard]] auto authority() const -> std::string {
    return port == "80" ? host : host + ":" + port;
  }
};

/// @brief Split @p text into its parts. TLS schemes are rejected.
[[nodiscard]] auto parse_url(std::string_view text)
    -> std::expected<Url, Error>;

} // namespace surge
