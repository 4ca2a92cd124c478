#include "buzz/timer/interval.hpp"

#include "buzz/core/error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <utility>

namespace buzz::timer {
namespace {

using buzz::core::errc;
using buzz::core::make_error_code;

constexpr std::int64_t kMaxMinutes = kMaxIntervalMinutes;

[[nodiscard]] bool is_blank(std::string_view s) noexcept {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.remove_suffix(1);
  }
  return s;
}

// 读取一段十进制数字；没有数字或溢出时返回 false。
[[nodiscard]] bool read_number(std::string_view& s, std::int64_t& out) noexcept {
  std::int64_t value = 0;
  std::size_t n = 0;
  while (n < s.size() && std::isdigit(static_cast<unsigned char>(s[n])) != 0) {
    value = value * 10 + (s[n] - '0');
    if (value > kMaxMinutes * 60) {
      return false;
    }
    ++n;
  }
  if (n == 0) {
    return false;
  }
  s.remove_prefix(n);
  out = value;
  return true;
}

}  // namespace

Interval Interval::from_minutes_seconds(
  std::int64_t minutes,
  std::int64_t seconds,
  std::optional<std::string> name) {
  // 越界值先夹到 [0, kMaxMinutes] 范围内，避免毫秒换算溢出。
  minutes = std::clamp<std::int64_t>(minutes, 0, kMaxMinutes);
  seconds = std::clamp<std::int64_t>(seconds, 0, kMaxMinutes * 60);
  Interval interval{};
  interval.duration_ms = std::min<std::int64_t>(minutes * 60 + seconds, kMaxMinutes * 60) * 1000;
  if (name.has_value() && !is_blank(*name)) {
    interval.name = std::move(name);
  }
  return interval;
}

std::string display_string(const Interval& interval) {
  std::string time = std::to_string(interval.minutes()) + "m " + std::to_string(interval.seconds()) + "s";
  if (!interval.name.has_value() || is_blank(*interval.name)) {
    return time;
  }
  return *interval.name + " (" + time + ")";
}

std::string format_time(std::int64_t remaining_ms) {
  const auto rounded = std::max<std::int64_t>(remaining_ms, 0) + 500;
  const auto total_seconds = rounded / 1000;
  const auto minutes = total_seconds / 60;
  const auto seconds = total_seconds % 60;

  char buf[32]{};
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld",
                static_cast<long long>(minutes), static_cast<long long>(seconds));
  return buf;
}

std::error_code validate_interval(std::int64_t minutes, std::int64_t seconds) noexcept {
  if (minutes < 0 || seconds < 0) {
    return make_error_code(errc::invalid_argument);
  }
  if (minutes == 0 && seconds == 0) {
    return make_error_code(errc::invalid_argument);
  }
  if (seconds >= 60 || minutes > kMaxMinutes) {
    return make_error_code(errc::invalid_argument);
  }
  return {};
}

std::error_code parse_interval(std::string_view text, Interval& out) {
  std::optional<std::string> name{};

  auto rest = trim(text);
  if (const auto eq = rest.find('='); eq != std::string_view::npos) {
    const auto n = trim(rest.substr(0, eq));
    if (!n.empty()) {
      name = std::string(n);
    }
    rest = trim(rest.substr(eq + 1));
  }

  std::int64_t minutes = 0;
  std::int64_t seconds = 0;
  bool has_minutes = false;
  bool has_seconds = false;

  while (!rest.empty()) {
    std::int64_t value = 0;
    if (!read_number(rest, value) || rest.empty()) {
      return make_error_code(errc::invalid_argument);
    }
    const char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(rest.front())));
    rest.remove_prefix(1);
    // 分钟必须写在秒之前，且每个单位只能出现一次。
    if (unit == 'm' && !has_minutes && !has_seconds) {
      minutes = value;
      has_minutes = true;
    } else if (unit == 's' && !has_seconds) {
      seconds = value;
      has_seconds = true;
    } else {
      return make_error_code(errc::invalid_argument);
    }
  }

  if (!has_minutes && !has_seconds) {
    return make_error_code(errc::invalid_argument);
  }
  if (auto ec = validate_interval(minutes, seconds)) {
    return ec;
  }

  out = Interval::from_minutes_seconds(minutes, seconds, std::move(name));
  return {};
}

}  // namespace buzz::timer
