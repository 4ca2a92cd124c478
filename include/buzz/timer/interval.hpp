#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace buzz::timer {

// 单个区间允许的最大分钟数（一年）。
inline constexpr std::int64_t kMaxIntervalMinutes = 24 * 60 * 365;

/**
 * @brief 序列中的一个计时区间（不可变值类型）。
 *
 * 约定：
 * - duration_ms >= 0；引擎容忍 0 时长（下一次 tick 立即到期）。
 * - 调用方的校验策略（validate_interval）另外禁止 0m 0s。
 */
struct Interval final {
  std::int64_t duration_ms{0};
  std::optional<std::string> name{};

  // (minutes*60 + seconds) * 1000；空白名称视为“无名称”。
  // 不做策略校验（见 validate_interval）；负值按 0 处理，总时长上限为一年。
  [[nodiscard]] static Interval from_minutes_seconds(
    std::int64_t minutes,
    std::int64_t seconds,
    std::optional<std::string> name = std::nullopt);

  [[nodiscard]] std::int64_t minutes() const noexcept { return duration_ms / 60000; }
  [[nodiscard]] std::int64_t seconds() const noexcept { return (duration_ms / 1000) % 60; }

  friend bool operator==(const Interval&, const Interval&) = default;
};

struct IntervalSequence final {
  std::vector<Interval> intervals{};
  bool circular{false};

  [[nodiscard]] bool empty() const noexcept { return intervals.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return intervals.size(); }

  friend bool operator==(const IntervalSequence&, const IntervalSequence&) = default;
};

// "1m 30s"，有名称时为 "Work (1m 30s)"。
[[nodiscard]] std::string display_string(const Interval& interval);

// 剩余时间显示为 MM:SS：先加 500ms 再截断到整秒（负值按 0 处理）。
[[nodiscard]] std::string format_time(std::int64_t remaining_ms);

/**
 * @brief 调用方的区间校验策略（编辑器/配置层使用，引擎本身不依赖）。
 *
 * 拒绝：负值、0m 0s、seconds >= 60。
 */
[[nodiscard]] std::error_code validate_interval(std::int64_t minutes, std::int64_t seconds) noexcept;

/**
 * @brief 解析文本形式的区间：`[name=]<N>m<N>s | <N>m | <N>s`。
 *
 * 例："Work=25m"、"1m30s"、"Rest=45s"。
 * 解析失败或未通过 validate_interval 时返回 invalid_argument，out 保持不变。
 */
[[nodiscard]] std::error_code parse_interval(std::string_view text, Interval& out);

}  // namespace buzz::timer
