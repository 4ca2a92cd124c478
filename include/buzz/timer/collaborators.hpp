#pragma once

#include "buzz/core/common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace buzz::timer {

/**
 * @brief 区间结束时的单次震动（或等价的提示）。
 *
 * 引擎不重试、不等待；返回错误只会被记录到日志。
 */
class HapticAction {
 public:
  virtual ~HapticAction() = default;

  virtual std::error_code pulse(core::duration length) = 0;
};

// 常驻状态显示上可用的操作按钮。
enum class StatusAction : std::uint8_t {
  pause = 0,
  resume = 1,
  stop = 2,
};

/**
 * @brief 渲染常驻状态所需的全部信息（由引擎生成的快照）。
 */
struct StatusSnapshot final {
  // 计时已结束（stop/序列完成）；宿主可据此撤下常驻显示。
  bool stopped{false};
  bool paused{false};
  std::optional<std::string> interval_name{};
  std::int64_t remaining_ms{0};

  // 暂停时为 "Timer paused"，否则为区间名称（无名称时为 "Buzz Timer"）。
  [[nodiscard]] std::string title() const;

  // 暂停时为 "MM:SS"，运行时为 "Time remaining: MM:SS"。
  [[nodiscard]] std::string text() const;

  // 暂停：resume + stop；运行：pause + stop；已结束：无。
  [[nodiscard]] std::vector<StatusAction> actions() const;
};

enum class RefreshMode : std::uint8_t {
  throttled = 0,  // 周期刷新：静默更新
  forced = 1,     // 状态迁移：立即刷新，不受节流限制
};

class StatusDisplay {
 public:
  virtual ~StatusDisplay() = default;

  virtual std::error_code refresh(const StatusSnapshot& snapshot, RefreshMode mode) = 0;
};

/**
 * @brief “后台保持运行”保障（前台服务/唤醒锁等宿主机制的抽象）。
 *
 * acquire 失败不影响计时，只是降低了后台可靠性。
 */
class BackgroundGuard {
 public:
  virtual ~BackgroundGuard() = default;

  virtual std::error_code acquire(core::duration lease) = 0;
  virtual void release() noexcept = 0;
};

/**
 * @brief 引擎使用的协作方集合（均为非拥有指针，可以为空）。
 */
struct Collaborators final {
  HapticAction* haptic{nullptr};
  StatusDisplay* status{nullptr};
  BackgroundGuard* background{nullptr};
};

}  // namespace buzz::timer
