#pragma once

#include "buzz/core/clock.hpp"
#include "buzz/core/common.hpp"
#include "buzz/timer/collaborators.hpp"
#include "buzz/timer/interval.hpp"
#include "buzz/timer/notification_throttle.hpp"
#include "buzz/timer/observer.hpp"
#include "buzz/timer/tick_scheduler.hpp"

#include <asio/any_io_executor.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <vector>

namespace buzz::timer {

enum class EngineStatus : std::uint8_t {
  idle = 0,
  running = 1,
  paused = 2,
  completed = 3,
};

[[nodiscard]] std::string_view to_string(EngineStatus status) noexcept;

struct EngineOptions final {
  // tick 周期（倒计时重新计算与 on_tick 上报的频率）。
  core::duration tick_period{core::kDefaultTickPeriod};

  // 周期性状态刷新的最小间隔（状态迁移触发的刷新不受限制）。
  core::duration notify_interval{core::kDefaultNotifyInterval};

  core::duration haptic_pulse{core::kDefaultHapticPulse};
  core::duration background_lease{core::kDefaultBackgroundLease};
};

// 常驻状态显示上的按钮动作；stop 等价于 reset()。
enum class Command : std::uint8_t {
  pause = 0,
  resume = 1,
  stop = 2,
};

/**
 * @brief 区间序列计时引擎（状态机 + 调度循环）。
 *
 * 状态：idle -> running <-> paused -> completed -> idle（stop/reset）。
 *
 * 计时模型：
 * - 剩余时间始终由 deadline - clock.now() 推导，从不累减 tick 周期；
 *   宿主延迟调度时，累计误差不超过一次调度延迟。
 * - 区间到期后以“当前时刻”为起点计算下一个区间的 deadline。
 *
 * 错误模型：
 * - 前置条件不满足的操作是静默 no-op，返回 invalid_state / empty_sequence，
 *   状态与 observer 均不受影响。
 * - 协作方（震动/状态显示/后台保活）失败只记录 warn 日志，计时照常进行。
 *
 * 并发：
 * - 非线程安全。所有公开方法与 tick 都必须在 executor() 上调用；
 *   其他线程请 asio::post 过来。observer 回调也在该执行器上同步投递。
 */
class TimerEngine final {
 public:
  TimerEngine(asio::any_io_executor ex, core::Clock& clock, EngineOptions options = {});
  ~TimerEngine();

  TimerEngine(const TimerEngine&) = delete;
  TimerEngine& operator=(const TimerEngine&) = delete;

  [[nodiscard]] asio::any_io_executor executor() const noexcept { return scheduler_.executor(); }
  [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

  // 替换（而不是追加）当前 observer；nullptr 表示解除。
  void set_observer(EngineObserver* observer) noexcept { observer_ = observer; }
  void set_collaborators(Collaborators collaborators) noexcept { collaborators_ = collaborators; }

  // 保存序列快照；running/paused 时忽略（需先 stop）。
  std::error_code set_sequence(IntervalSequence sequence);

  std::error_code start();
  std::error_code pause();
  std::error_code resume();
  std::error_code stop();
  std::error_code reset();

  std::error_code dispatch(Command command);

  // 调度循环的回调；仅在 running 时生效。
  void tick();

  [[nodiscard]] EngineStatus status() const noexcept { return status_; }
  [[nodiscard]] bool is_running() const noexcept { return status_ == EngineStatus::running; }
  [[nodiscard]] int current_index() const noexcept { return current_index_; }
  [[nodiscard]] const Interval* current_interval() const noexcept;
  [[nodiscard]] std::vector<Interval> intervals() const { return sequence_.intervals; }
  [[nodiscard]] const IntervalSequence& sequence() const noexcept { return sequence_; }
  [[nodiscard]] bool is_circular() const noexcept { return sequence_.circular; }
  [[nodiscard]] int lap_count() const noexcept { return lap_count_; }
  [[nodiscard]] std::int64_t remaining_ms() const noexcept { return remaining_ms_; }
  [[nodiscard]] StatusSnapshot status_snapshot() const;

 private:
  template <class F>
  void notify_(F&& f) {
    if (observer_ != nullptr) {
      f(*observer_);
    }
  }

  // observer 回调里可能重入 stop()/reset()/start()，回调后用它判断本轮是否还有效。
  [[nodiscard]] bool still_current_(std::uint64_t run) const noexcept {
    return run == run_generation_ && status_ == EngineStatus::running;
  }

  void enter_interval_(std::size_t index, core::time_point now);
  void teardown_(EngineStatus final_status);

  void refresh_status_(RefreshMode mode, core::time_point now);
  void pulse_haptic_();
  void acquire_background_();
  void release_background_() noexcept;

  core::Clock& clock_;
  EngineOptions options_{};
  TickScheduler scheduler_;
  NotificationThrottle throttle_;

  EngineObserver* observer_{nullptr};
  Collaborators collaborators_{};

  IntervalSequence sequence_{};

  EngineStatus status_{EngineStatus::idle};
  int current_index_{-1};
  std::int64_t remaining_ms_{0};
  core::time_point deadline_{};
  int lap_count_{0};

  std::uint64_t run_generation_{0};
  bool background_held_{false};
};

}  // namespace buzz::timer
