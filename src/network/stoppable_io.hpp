#pragma once
/// @file stoppable_io.hpp
/// @brief Runs one asynchronous operation at a time on a private
///        io_context, polling an execution's stop token between slices.
///
/// Workloads run on pool threads and must return promptly once their
/// execution times out or the run is cancelled, which blocking Beast calls
/// cannot do.

#include "workload/workload.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core/error.hpp>

#include <chrono>
#include <functional>

namespace surge {

class StoppableIo {
public:
  using Done = std::function<void(boost::beast::error_code)>;

  static constexpr std::chrono::milliseconds kSlice{10};

  explicit StoppableIo(ExecutionContext &ctx) : ctx_{ctx} {}

  [[nodiscard]] auto context() noexcept -> boost::asio::io_context & {
    return ioc_;
  }

  /// @brief Start an operation and wait for it.
  /// @param start  Initiates the operation; must invoke the given Done.
  /// @param cancel Aborts the pending operation when a stop is requested.
  /// @return The operation's error, or operation_aborted after a stop.
  template <typename Start, typename Cancel>
  auto await(Start &&start, Cancel &&cancel) -> boost::beast::error_code {
    boost::beast::error_code result;
    bool done = false;
    ioc_.restart();
    start(Done{[&result, &done](boost::beast::error_code ec) {
      result = ec;
      done = true;
    }});

    while (!done) {
      if (ctx_.stop_requested()) {
        cancel();
        ioc_.run();
        return boost::asio::error::operation_aborted;
      }
      ioc_.run_one_for(kSlice);
    }
    return result;
  }

private:
  ExecutionContext &ctx_;
  boost::asio::io_context ioc_{1};
};

} // namespace surge
