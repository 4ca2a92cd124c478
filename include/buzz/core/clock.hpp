#pragma once

#include "buzz/core/common.hpp"

namespace buzz::core {

/**
 * @brief 单调时钟抽象（不受系统休眠/改时影响）。
 *
 * 引擎只通过该接口读时间：生产环境用 SteadyClock，
 * 测试/无头环境用 ManualClock 精确控制“现在”。
 */
class Clock {
 public:
  virtual ~Clock() = default;

  [[nodiscard]] virtual time_point now() const noexcept = 0;
};

class SteadyClock final : public Clock {
 public:
  [[nodiscard]] time_point now() const noexcept override { return steady_clock::now(); }
};

/**
 * @brief 手动推进的时钟（用于单元测试）。
 */
class ManualClock final : public Clock {
 public:
  ManualClock() = default;
  explicit ManualClock(time_point start) : now_(start) {}

  [[nodiscard]] time_point now() const noexcept override { return now_; }

  void set(time_point t) noexcept { now_ = t; }
  void advance(duration d) noexcept { now_ += d; }

 private:
  time_point now_{};
};

}  // namespace buzz::core
