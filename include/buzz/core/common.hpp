#pragma once

#include <chrono>
#include <cstdint>

namespace buzz::core {

using steady_clock = std::chrono::steady_clock;
using duration = steady_clock::duration;
using time_point = steady_clock::time_point;

// 引擎对外暴露的时间值统一用毫秒计数（std::int64_t）。
using millis = std::chrono::milliseconds;

// 调度周期：100ms 一次，保证倒计时显示足够平滑。
inline constexpr millis kDefaultTickPeriod{100};

// 状态显示（常驻通知）刷新窗口：1s 内最多刷新一次，避免被宿主限流。
inline constexpr millis kDefaultNotifyInterval{1000};

// 区间结束时的震动脉冲时长。
inline constexpr millis kDefaultHapticPulse{800};

// 后台运行保障的租期（到期由宿主自动回收，防止泄漏）。
inline constexpr millis kDefaultBackgroundLease{10 * 60 * 1000};

[[nodiscard]] constexpr std::int64_t to_millis(duration d) noexcept {
  return std::chrono::duration_cast<millis>(d).count();
}

}  // namespace buzz::core
