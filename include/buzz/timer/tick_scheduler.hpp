#pragma once

#include "buzz/core/common.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <cstdint>
#include <functional>
#include <memory>

namespace buzz::timer {

/**
 * @brief 可取消的周期触发器（协作式，运行在给定执行器上）。
 *
 * 语义：
 * - start(period, cb)：启动一个循环协程，每次回调返回后再等待 period 才触发下一次
 *   （不是固定频率；宿主延迟了某次触发时，不补发错过的 tick）。
 * - cancel()：取消当前循环；cancel() 返回后，之前安排的 tick 不会再执行回调。
 * - 再次 start() 隐含 cancel() 上一轮。
 *
 * 注意：
 * - 默认假设 start/cancel 与回调都在同一执行器/线程语境下调用；
 *   跨线程请先 asio::post 到该执行器。
 * - 回调内部可以调用 cancel()（例如序列结束时）。
 */
class TickScheduler final {
 public:
  explicit TickScheduler(asio::any_io_executor ex);
  ~TickScheduler();

  TickScheduler(const TickScheduler&) = delete;
  TickScheduler& operator=(const TickScheduler&) = delete;

  [[nodiscard]] asio::any_io_executor executor() const noexcept { return executor_; }

  void start(core::duration period, std::function<void()> on_tick);
  void cancel() noexcept;

  [[nodiscard]] bool is_armed() const noexcept;

  // 每次 start/cancel 都会递增；仅用于诊断与测试。
  [[nodiscard]] std::uint64_t generation() const noexcept;

 private:
  struct State;

  static asio::awaitable<void> run_loop_(
    std::shared_ptr<State> state,
    std::uint64_t gen,
    core::duration period);

  asio::any_io_executor executor_{};
  std::shared_ptr<State> state_{};
};

}  // namespace buzz::timer
