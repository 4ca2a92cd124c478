#include "buzz/timer/tick_scheduler.hpp"

#include "buzz/core/timer.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace buzz::timer {

/*
 * 取消模型：
 *
 * - 循环协程持有 State 的 shared_ptr，而不是 TickScheduler 的 this；
 *   TickScheduler 先于执行器销毁时，挂起中的协程醒来后只会看到 generation 已变化并退出。
 *
 * - generation 在每次 start()/cancel() 时递增。循环在“睡眠醒来后、调用回调前”
 *   比较自己的 gen：不一致说明这一轮已被取消/替换，直接退出，不再回调。
 *
 * - 同一个 Timer 在各轮之间复用：cancel() 会唤醒旧一轮的等待，新一轮的
 *   expires_after() 也会顺带取消旧等待；旧协程醒来后同样因为 gen 不一致而退出。
 */
struct TickScheduler::State final {
  explicit State(asio::any_io_executor ex) : timer(std::move(ex)) {}

  core::Timer timer;
  std::uint64_t generation{0};
  bool armed{false};
  std::function<void()> on_tick{};
};

TickScheduler::TickScheduler(asio::any_io_executor ex)
  : executor_(ex),
    state_(std::make_shared<State>(ex)) {}

TickScheduler::~TickScheduler() {
  cancel();
}

void TickScheduler::start(core::duration period, std::function<void()> on_tick) {
  cancel();

  const auto gen = ++state_->generation;
  state_->armed = true;
  state_->on_tick = std::move(on_tick);

  asio::co_spawn(
    executor_,
    [state = state_, gen, period]() -> asio::awaitable<void> { co_await run_loop_(state, gen, period); },
    asio::detached);
}

void TickScheduler::cancel() noexcept {
  if (!state_->armed) {
    return;
  }
  ++state_->generation;
  state_->armed = false;
  state_->timer.cancel();
}

bool TickScheduler::is_armed() const noexcept {
  return state_->armed;
}

std::uint64_t TickScheduler::generation() const noexcept {
  return state_->generation;
}

asio::awaitable<void> TickScheduler::run_loop_(
  std::shared_ptr<State> state,
  std::uint64_t gen,
  core::duration period) {
  while (state->generation == gen) {
    auto ec = co_await state->timer.async_sleep(period);
    if (state->generation != gen) {
      co_return;
    }
    if (ec) {
      // cancelled 以外的错误（理论上不会出现）：结束本轮，避免空转。
      spdlog::warn("tick scheduler: timer wait failed: {}", ec.message());
      state->armed = false;
      co_return;
    }
    // 拷贝一份再调用：回调内部可能 start() 新一轮并替换 on_tick。
    auto cb = state->on_tick;
    if (cb) {
      cb();
    }
  }
}

}  // namespace buzz::timer
