#include "buzz/core/clock.hpp"
#include "buzz/timer/engine.hpp"

#include "test_main.hpp"

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace {

using buzz::core::SteadyClock;
using buzz::timer::EngineObserver;
using buzz::timer::EngineOptions;
using buzz::timer::EngineStatus;
using buzz::timer::Interval;
using buzz::timer::IntervalSequence;
using buzz::timer::TimerEngine;

using namespace std::chrono_literals;

// 真实 io_context + SteadyClock：由 TickScheduler 驱动 tick。
class LoopObserver final : public EngineObserver {
public:
    explicit LoopObserver(asio::io_context& ioc) : ioc_(ioc) {}

    void on_tick(std::int64_t remaining_ms) override {
        ++ticks;
        if (remaining_ms > max_remaining) {
            max_remaining = remaining_ms;
        }
    }
    void on_interval_complete(int index) override { completed.push_back(index); }
    void on_sequence_complete() override { ++sequence_completes; }
    void on_lap_count_changed(int lap_count) override { last_lap = lap_count; }
    void on_current_interval_changed(int) override {}
    void on_paused() override { ++paused; }
    void on_resumed() override { ++resumed; }
    void on_stopped() override {
        ++stopped;
        ioc_.stop();
    }

    std::vector<int> completed{};
    int ticks{0};
    std::int64_t max_remaining{0};
    int sequence_completes{0};
    int last_lap{-1};
    int paused{0};
    int resumed{0};
    int stopped{0};

private:
    asio::io_context& ioc_;
};

EngineOptions fast_options() {
    EngineOptions options{};
    options.tick_period = 5ms;
    options.notify_interval = 20ms;
    return options;
}

void arm_watchdog(asio::io_context& ioc, asio::steady_timer& watchdog) {
    watchdog.expires_after(5s);
    watchdog.async_wait([&](const std::error_code& ec) {
        if (!ec) {
            TEST_FAIL("watchdog fired (sequence did not finish)");
            ioc.stop();
        }
    });
}

void test_sequence_runs_to_completion() {
    asio::io_context ioc;
    SteadyClock clock;
    TimerEngine engine(ioc.get_executor(), clock, fast_options());
    LoopObserver observer(ioc);
    engine.set_observer(&observer);

    IntervalSequence seq{};
    seq.intervals = {Interval{40, std::string("A")}, Interval{30, std::nullopt}, Interval{20, std::string("C")}};
    TEST_EXPECT_OK(engine.set_sequence(seq));

    asio::steady_timer watchdog(ioc);
    arm_watchdog(ioc, watchdog);

    const auto begin = std::chrono::steady_clock::now();
    TEST_EXPECT_OK(engine.start());
    ioc.run();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    TEST_EXPECT_EQ(observer.completed, (std::vector<int>{0, 1, 2}));
    TEST_EXPECT_EQ(observer.sequence_completes, 1);
    TEST_EXPECT_EQ(observer.stopped, 1);
    TEST_EXPECT(observer.ticks > 0);
    TEST_EXPECT(observer.max_remaining <= 40);
    TEST_EXPECT_EQ(engine.status(), EngineStatus::completed);
    TEST_EXPECT(elapsed >= 90ms);
}

void test_circular_until_stopped() {
    asio::io_context ioc;
    SteadyClock clock;
    TimerEngine engine(ioc.get_executor(), clock, fast_options());
    LoopObserver observer(ioc);
    engine.set_observer(&observer);

    IntervalSequence seq{};
    seq.circular = true;
    seq.intervals = {Interval{15, std::nullopt}, Interval{15, std::nullopt}};
    TEST_EXPECT_OK(engine.set_sequence(seq));

    asio::steady_timer watchdog(ioc);
    arm_watchdog(ioc, watchdog);

    // 跑一段时间后在同一执行器上 stop
    asio::steady_timer stopper(ioc);
    stopper.expires_after(200ms);
    stopper.async_wait([&](const std::error_code& ec) {
        if (!ec) {
            TEST_EXPECT_OK(engine.stop());
        }
    });

    TEST_EXPECT_OK(engine.start());
    ioc.run();

    TEST_EXPECT(observer.last_lap >= 2);
    TEST_EXPECT_EQ(engine.lap_count(), observer.last_lap);
    TEST_EXPECT_EQ(observer.sequence_completes, 0);
    TEST_EXPECT_EQ(observer.stopped, 1);
    TEST_EXPECT_EQ(engine.status(), EngineStatus::idle);
}

void test_pause_holds_countdown() {
    asio::io_context ioc;
    SteadyClock clock;
    TimerEngine engine(ioc.get_executor(), clock, fast_options());
    LoopObserver observer(ioc);
    engine.set_observer(&observer);

    IntervalSequence seq{};
    seq.intervals = {Interval{60, std::nullopt}};
    TEST_EXPECT_OK(engine.set_sequence(seq));

    asio::steady_timer watchdog(ioc);
    arm_watchdog(ioc, watchdog);

    // 20ms 时暂停，暂停 150ms 后继续：总耗时约为 60 + 150ms，且暂停期间没有 tick
    asio::steady_timer control(ioc);
    int ticks_at_pause = 0;
    control.expires_after(20ms);
    control.async_wait([&](const std::error_code& ec) {
        if (ec) {
            return;
        }
        TEST_EXPECT_OK(engine.pause());
        ticks_at_pause = observer.ticks;
        control.expires_after(150ms);
        control.async_wait([&](const std::error_code& ec2) {
            if (ec2) {
                return;
            }
            TEST_EXPECT_EQ(observer.ticks, ticks_at_pause);
            TEST_EXPECT(engine.remaining_ms() > 0);
            TEST_EXPECT_OK(engine.resume());
        });
    });

    const auto begin = std::chrono::steady_clock::now();
    TEST_EXPECT_OK(engine.start());
    ioc.run();

    TEST_EXPECT_EQ(observer.paused, 1);
    TEST_EXPECT_EQ(observer.resumed, 1);
    TEST_EXPECT_EQ(observer.completed, (std::vector<int>{0}));
    TEST_EXPECT(std::chrono::steady_clock::now() - begin >= 200ms);
}

} // namespace

int main() {
    test_sequence_runs_to_completion();
    test_circular_until_stopped();
    test_pause_holds_countdown();
    return ::buzz::tests::run_and_report();
}
