#pragma once
/// @file websocket_workload.hpp
/// @brief Workload opening a WebSocket, sending one text message and
///        awaiting one reply per execution (Boost.Beast).

#include "core/error.hpp"
#include "core/types.hpp"
#include "network/url.hpp"
#include "workload/workload.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <string>

namespace surge {

struct WebSocketConfig {
  std::string url; ///< ws://host[:port]/path
  std::string message = R"({"type":"ping"})";
  /// Builds a fresh message per execution; overrides @c message when set.
  std::function<std::string(SharedContext &)> message_factory;
  bool expect_reply = true;
  Seconds timeout{30.0}; ///< Budget for each step (connect, handshake, I/O).
};

class WebSocketWorkload final : public Workload {
public:
  [[nodiscard]] static auto create(std::string name, WebSocketConfig cfg)
      -> std::expected<std::shared_ptr<WebSocketWorkload>, Error>;

  [[nodiscard]] auto kind() const noexcept -> WorkloadKind override {
    return WorkloadKind::Socket;
  }

  [[nodiscard]] auto execute(ExecutionContext &ctx) -> Outcome override;

private:
  struct Token {
    explicit Token() = default;
  };

public:
  /// @brief Only reachable through create().
  WebSocketWorkload(Token, std::string name, WebSocketConfig cfg, Url url);

private:
  WebSocketConfig cfg_;
  Url url_;
};

} // namespace surge
