#pragma once

#include <cstdint>

namespace buzz::timer {

/**
 * @brief 引擎事件监听者（单订阅者）。
 *
 * 约定：
 * - 所有回调都在引擎的执行器上串行投递，实现方无需自行加锁。
 * - 引擎同一时刻最多持有一个 observer；set_observer() 替换旧的，不做多播，
 *   也不补发替换前错过的事件。
 * - index 为 -1 表示“当前没有活动区间”（reset 之后）。
 */
class EngineObserver {
 public:
  virtual ~EngineObserver() = default;

  virtual void on_tick(std::int64_t remaining_ms) = 0;
  virtual void on_interval_complete(int index) = 0;
  virtual void on_sequence_complete() = 0;
  virtual void on_lap_count_changed(int lap_count) = 0;
  virtual void on_current_interval_changed(int index) = 0;
  virtual void on_paused() = 0;
  virtual void on_resumed() = 0;
  virtual void on_stopped() = 0;
};

}  // namespace buzz::timer
