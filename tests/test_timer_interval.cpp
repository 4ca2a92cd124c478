#include "buzz/core/error.hpp"
#include "buzz/timer/collaborators.hpp"
#include "buzz/timer/interval.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace {

using buzz::core::errc;
using buzz::core::make_error_code;

using buzz::timer::display_string;
using buzz::timer::format_time;
using buzz::timer::Interval;
using buzz::timer::IntervalSequence;
using buzz::timer::parse_interval;
using buzz::timer::StatusAction;
using buzz::timer::StatusSnapshot;
using buzz::timer::validate_interval;

void test_format_time() {
  TEST_EXPECT_EQ(format_time(0), "00:00");
  TEST_EXPECT_EQ(format_time(499), "00:00");
  TEST_EXPECT_EQ(format_time(500), "00:01");
  TEST_EXPECT_EQ(format_time(61400), "01:01");
  TEST_EXPECT_EQ(format_time(61900), "01:02");
  TEST_EXPECT_EQ(format_time(59600), "01:00");
  TEST_EXPECT_EQ(format_time(25 * 60 * 1000), "25:00");
  TEST_EXPECT_EQ(format_time(100 * 60 * 1000), "100:00");
  TEST_EXPECT_EQ(format_time(-1500), "00:00");
}

void test_from_minutes_seconds() {
  auto a = Interval::from_minutes_seconds(1, 30);
  TEST_EXPECT_EQ(a.duration_ms, 90000);
  TEST_EXPECT_EQ(a.minutes(), 1);
  TEST_EXPECT_EQ(a.seconds(), 30);
  TEST_EXPECT(!a.name.has_value());

  auto b = Interval::from_minutes_seconds(0, 45, std::string("   "));
  TEST_EXPECT(!b.name.has_value());

  auto c = Interval::from_minutes_seconds(25, 0, std::string("Work"));
  TEST_EXPECT(c.name.has_value());
  TEST_EXPECT_EQ(*c.name, "Work");
}

void test_from_minutes_seconds_clamps_out_of_range() {
  constexpr std::int64_t kYearMs = buzz::timer::kMaxIntervalMinutes * 60 * 1000;

  auto huge = Interval::from_minutes_seconds(std::numeric_limits<std::int64_t>::max(), 0);
  TEST_EXPECT_EQ(huge.duration_ms, kYearMs);

  auto huge_seconds = Interval::from_minutes_seconds(10, std::numeric_limits<std::int64_t>::max());
  TEST_EXPECT_EQ(huge_seconds.duration_ms, kYearMs);

  auto negative = Interval::from_minutes_seconds(-3, -20);
  TEST_EXPECT_EQ(negative.duration_ms, 0);

  auto edge = Interval::from_minutes_seconds(buzz::timer::kMaxIntervalMinutes, 0);
  TEST_EXPECT_EQ(edge.duration_ms, kYearMs);
}

void test_display_string() {
  TEST_EXPECT_EQ(display_string(Interval::from_minutes_seconds(1, 5)), "1m 5s");
  TEST_EXPECT_EQ(display_string(Interval::from_minutes_seconds(25, 0, std::string("Work"))), "Work (25m 0s)");
  TEST_EXPECT_EQ(display_string(Interval{3000, std::string(" ")}), "0m 3s");
}

void test_validate_interval() {
  TEST_EXPECT_OK(validate_interval(0, 1));
  TEST_EXPECT_OK(validate_interval(5, 0));
  TEST_EXPECT_OK(validate_interval(1, 59));
  TEST_EXPECT_EQ(validate_interval(0, 0), make_error_code(errc::invalid_argument));
  TEST_EXPECT_EQ(validate_interval(-1, 10), make_error_code(errc::invalid_argument));
  TEST_EXPECT_EQ(validate_interval(1, -1), make_error_code(errc::invalid_argument));
  TEST_EXPECT_EQ(validate_interval(1, 60), make_error_code(errc::invalid_argument));
}

void test_parse_interval() {
  Interval out{};
  TEST_EXPECT_OK(parse_interval("Work=25m", out));
  TEST_EXPECT_EQ(out.duration_ms, 25 * 60 * 1000);
  TEST_EXPECT(out.name.has_value());
  TEST_EXPECT_EQ(*out.name, "Work");

  TEST_EXPECT_OK(parse_interval("1m30s", out));
  TEST_EXPECT_EQ(out.duration_ms, 90000);
  TEST_EXPECT(!out.name.has_value());

  TEST_EXPECT_OK(parse_interval(" Rest = 45S ", out));
  TEST_EXPECT_EQ(out.duration_ms, 45000);
  TEST_EXPECT_EQ(*out.name, "Rest");

  TEST_EXPECT_OK(parse_interval("=10s", out));
  TEST_EXPECT(!out.name.has_value());
}

void test_parse_interval_rejects() {
  const auto invalid = make_error_code(errc::invalid_argument);
  Interval out = Interval::from_minutes_seconds(0, 7);

  TEST_EXPECT_EQ(parse_interval("", out), invalid);
  TEST_EXPECT_EQ(parse_interval("Work=", out), invalid);
  TEST_EXPECT_EQ(parse_interval("10", out), invalid);
  TEST_EXPECT_EQ(parse_interval("0s", out), invalid);
  TEST_EXPECT_EQ(parse_interval("0m0s", out), invalid);
  TEST_EXPECT_EQ(parse_interval("90s", out), invalid);
  TEST_EXPECT_EQ(parse_interval("30s1m", out), invalid);
  TEST_EXPECT_EQ(parse_interval("1m1m", out), invalid);
  TEST_EXPECT_EQ(parse_interval("5h", out), invalid);
  TEST_EXPECT_EQ(parse_interval("-5s", out), invalid);
  TEST_EXPECT_EQ(parse_interval("99999999999m", out), invalid);

  // 失败时保持输出不变
  TEST_EXPECT_EQ(out.duration_ms, 7000);
}

void test_sequence_value() {
  IntervalSequence seq{};
  TEST_EXPECT(seq.empty());
  TEST_EXPECT(!seq.circular);

  seq.intervals.push_back(Interval{3000, std::string("A")});
  seq.intervals.push_back(Interval{2000, std::string("B")});
  TEST_EXPECT_EQ(seq.size(), 2U);

  auto copy = seq;
  seq.intervals[0].duration_ms = 1;
  TEST_EXPECT_EQ(copy.intervals[0].duration_ms, 3000);
  TEST_EXPECT(!(copy == seq));
}

void test_status_snapshot_presentation() {
  StatusSnapshot running{};
  running.interval_name = "Work";
  running.remaining_ms = 61900;
  TEST_EXPECT_EQ(running.title(), "Work");
  TEST_EXPECT_EQ(running.text(), "Time remaining: 01:02");
  TEST_EXPECT(running.actions() == (std::vector<StatusAction>{StatusAction::pause, StatusAction::stop}));

  StatusSnapshot unnamed{};
  unnamed.remaining_ms = 500;
  TEST_EXPECT_EQ(unnamed.title(), "Buzz Timer");

  StatusSnapshot paused{};
  paused.paused = true;
  paused.interval_name = "Work";
  paused.remaining_ms = 500;
  TEST_EXPECT_EQ(paused.title(), "Timer paused");
  TEST_EXPECT_EQ(paused.text(), "00:01");
  TEST_EXPECT(paused.actions() == (std::vector<StatusAction>{StatusAction::resume, StatusAction::stop}));

  StatusSnapshot stopped{};
  stopped.stopped = true;
  TEST_EXPECT_EQ(stopped.title(), "Buzz Timer");
  TEST_EXPECT(stopped.actions().empty());
}

}  // namespace

int main() {
  test_format_time();
  test_from_minutes_seconds();
  test_from_minutes_seconds_clamps_out_of_range();
  test_display_string();
  test_validate_interval();
  test_parse_interval();
  test_parse_interval_rejects();
  test_sequence_value();
  test_status_snapshot_presentation();
  return ::buzz::tests::run_and_report();
}
