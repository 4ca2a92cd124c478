#pragma once

#include "buzz/core/common.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>

#include <system_error>

namespace buzz::core {

/**
 * @brief 基于 asio::steady_timer 的轻量定时器封装。
 *
 * 约定：
 * - async_sleep(d)：等待 d 时长到期，正常到期返回 ok
 * - cancel()：取消等待，等待者返回 cancelled
 */
class Timer final {
 public:
  explicit Timer(asio::any_io_executor ex);

  void cancel() noexcept;

  asio::awaitable<std::error_code> async_sleep(duration d);

 private:
  asio::steady_timer timer_;
};

}  // namespace buzz::core
