#pragma once

#include "buzz/core/common.hpp"

#include <optional>

namespace buzz::timer {

/**
 * @brief 判断距离上次刷新是否已过 min_interval（纯函数）。
 *
 * now 早于 last_refresh（时钟被手动回拨）时同样视为“已过窗口”，避免卡死。
 */
[[nodiscard]] bool should_refresh(
  core::time_point now,
  core::time_point last_refresh,
  core::duration min_interval) noexcept;

/**
 * @brief 常驻状态显示的刷新节流。
 *
 * 语义：
 * - 只保存一个 last_refresh 时间戳；调用方仅在真正刷新后 mark(now)。
 * - reset() 后（或从未刷新过）下一次 should_refresh 必然返回 true。
 * - 状态迁移触发的“强制刷新”不经过节流判断，但同样 mark 时间戳。
 */
class NotificationThrottle final {
 public:
  explicit NotificationThrottle(core::duration min_interval = core::kDefaultNotifyInterval) noexcept
    : min_interval_(min_interval) {}

  [[nodiscard]] bool should_refresh(core::time_point now) const noexcept;

  void mark(core::time_point now) noexcept { last_refresh_ = now; }
  void reset() noexcept { last_refresh_.reset(); }

  [[nodiscard]] std::optional<core::time_point> last_refresh() const noexcept { return last_refresh_; }
  [[nodiscard]] core::duration min_interval() const noexcept { return min_interval_; }

 private:
  core::duration min_interval_;
  std::optional<core::time_point> last_refresh_{};
};

}  // namespace buzz::timer
