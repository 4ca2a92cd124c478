#include "buzz/timer/notification_throttle.hpp"

namespace buzz::timer {

bool should_refresh(
  core::time_point now,
  core::time_point last_refresh,
  core::duration min_interval) noexcept {
  if (now < last_refresh) {
    return true;
  }
  return now - last_refresh >= min_interval;
}

bool NotificationThrottle::should_refresh(core::time_point now) const noexcept {
  if (!last_refresh_.has_value()) {
    return true;
  }
  return timer::should_refresh(now, *last_refresh_, min_interval_);
}

}  // namespace buzz::timer
