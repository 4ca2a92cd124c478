#include "buzz/timer/collaborators.hpp"

#include "buzz/timer/interval.hpp"

namespace buzz::timer {
namespace {

constexpr const char* kAppTitle = "Buzz Timer";
constexpr const char* kPausedTitle = "Timer paused";

}  // namespace

std::string StatusSnapshot::title() const {
  if (stopped) {
    return kAppTitle;
  }
  if (paused) {
    return kPausedTitle;
  }
  if (interval_name.has_value() && !interval_name->empty()) {
    return *interval_name;
  }
  return kAppTitle;
}

std::string StatusSnapshot::text() const {
  if (paused) {
    return format_time(remaining_ms);
  }
  return "Time remaining: " + format_time(remaining_ms);
}

std::vector<StatusAction> StatusSnapshot::actions() const {
  if (stopped) {
    return {};
  }
  if (paused) {
    return {StatusAction::resume, StatusAction::stop};
  }
  return {StatusAction::pause, StatusAction::stop};
}

}  // namespace buzz::timer
