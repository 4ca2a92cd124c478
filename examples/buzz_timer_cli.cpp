/**
 * @file buzz_timer_cli.cpp
 * @brief 命令行计时器示例 - 依次运行若干区间，区间结束时响铃
 *
 * 用法: ./buzz_timer_cli [--circular] [--log-level <level>] <interval>...
 * 区间格式: [name=]<N>m<N>s | <N>m | <N>s，例如 Work=25m Rest=5m
 *
 * 运行时从标准输入读取命令：p 暂停，r 继续，s 停止。
 */

#include <buzz/core/clock.hpp>
#include <buzz/core/log.hpp>
#include <buzz/timer/engine.hpp>
#include <buzz/timer/interval.hpp>

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/read_until.hpp>
#include <asio/signal_set.hpp>
#include <asio/streambuf.hpp>
#include <asio/use_awaitable.hpp>

#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <istream>
#include <string>
#include <string_view>
#include <utility>

using namespace buzz;

namespace {

void print_usage(const char* argv0) {
    std::cerr << "用法: " << argv0
              << " [--circular] [--log-level <level>] <interval>...\n"
              << "区间格式: [name=]<N>m<N>s | <N>m | <N>s\n";
}

// 把引擎事件打印到终端；序列结束或被停止时退出事件循环。
class ConsoleObserver final : public timer::EngineObserver {
public:
    ConsoleObserver(asio::io_context& ioc, const timer::TimerEngine& engine)
        : ioc_(ioc), engine_(engine) {}

    void on_tick(std::int64_t remaining_ms) override {
        std::cout << "\r" << label_() << " " << timer::format_time(remaining_ms)
                  << "   " << std::flush;
    }
    void on_interval_complete(int index) override {
        std::cout << "\n[计时] 区间 " << index << " 结束\n";
    }
    void on_sequence_complete() override { std::cout << "[计时] 序列完成\n"; }
    void on_lap_count_changed(int lap_count) override {
        if (lap_count > 0) {
            std::cout << "[计时] 第 " << lap_count << " 圈完成\n";
        }
    }
    void on_current_interval_changed(int index) override {
        if (index >= 0) {
            std::cout << "[计时] 开始 " << label_() << "\n";
        }
    }
    void on_paused() override { std::cout << "\n[计时] 已暂停\n"; }
    void on_resumed() override { std::cout << "[计时] 已继续\n"; }
    void on_stopped() override {
        std::cout << "\n[计时] 已停止\n";
        ioc_.stop();
    }

private:
    [[nodiscard]] std::string label_() const {
        const auto* interval = engine_.current_interval();
        if (interval == nullptr) {
            return "-";
        }
        return "[" + timer::display_string(*interval) + "]";
    }

    asio::io_context& ioc_;
    const timer::TimerEngine& engine_;
};

// 终端响铃代替震动。
class BellHaptic final : public timer::HapticAction {
public:
    std::error_code pulse(core::duration) override {
        std::cout << '\a' << std::flush;
        return {};
    }
};

// 状态显示：只在状态迁移（forced）时打印一行标题。
class TitleStatus final : public timer::StatusDisplay {
public:
    std::error_code refresh(const timer::StatusSnapshot& snapshot,
                            timer::RefreshMode mode) override {
        if (mode == timer::RefreshMode::forced && !snapshot.stopped) {
            std::cout << "[状态] " << snapshot.title() << " - " << snapshot.text()
                      << "\n";
        }
        return {};
    }
};

asio::awaitable<void> read_commands(timer::TimerEngine& engine,
                                    asio::posix::stream_descriptor& input) {
    asio::streambuf buf;
    for (;;) {
        auto [ec, n] = co_await asio::async_read_until(
            input, buf, '\n', asio::as_tuple(asio::use_awaitable));
        if (ec) {
            co_return;
        }
        std::istream is(&buf);
        std::string line;
        std::getline(is, line);

        std::error_code cmd_ec;
        if (line == "p") {
            cmd_ec = engine.dispatch(timer::Command::pause);
        } else if (line == "r") {
            cmd_ec = engine.dispatch(timer::Command::resume);
        } else if (line == "s") {
            cmd_ec = engine.dispatch(timer::Command::stop);
        } else {
            std::cout << "[命令] 未知命令: " << line << " (p/r/s)\n";
            continue;
        }
        if (cmd_ec) {
            std::cout << "[命令] 忽略: " << cmd_ec.message() << "\n";
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    timer::IntervalSequence sequence;
    core::LogLevel level = core::LogLevel::warn;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--circular") {
            sequence.circular = true;
            continue;
        }
        if (arg == "--log-level") {
            if (i + 1 >= argc || !core::parse_log_level(argv[i + 1], level)) {
                print_usage(argv[0]);
                return 1;
            }
            ++i;
            continue;
        }
        timer::Interval interval;
        if (auto ec = timer::parse_interval(arg, interval)) {
            std::cerr << "无效区间 \"" << arg << "\": " << ec.message() << "\n";
            print_usage(argv[0]);
            return 1;
        }
        sequence.intervals.push_back(std::move(interval));
    }

    if (sequence.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    core::set_log_level(level);

    asio::io_context ioc;
    core::SteadyClock clock;
    timer::TimerEngine engine(ioc.get_executor(), clock);

    ConsoleObserver observer(ioc, engine);
    BellHaptic haptic;
    TitleStatus status;
    engine.set_observer(&observer);
    engine.set_collaborators({.haptic = &haptic, .status = &status});

    if (auto ec = engine.set_sequence(std::move(sequence))) {
        std::cerr << "设置序列失败: " << ec.message() << "\n";
        return 1;
    }

    // Ctrl+C / SIGTERM：停止计时并退出
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int) {
        if (ec) {
            return;
        }
        if (engine.stop()) {
            ioc.stop();
        }
    });

    // 标准输入已关闭时 dup 失败：不读命令，只靠信号停止
    asio::posix::stream_descriptor input(ioc);
    const int stdin_fd = ::dup(STDIN_FILENO);
    if (stdin_fd < 0) {
        std::cerr << "[命令] 标准输入不可用，忽略 p/r/s 命令\n";
    } else {
        std::error_code assign_ec;
        input.assign(stdin_fd, assign_ec);
        if (assign_ec) {
            std::cerr << "[命令] 无法读取标准输入: " << assign_ec.message() << "\n";
            ::close(stdin_fd);
        } else {
            asio::co_spawn(ioc, read_commands(engine, input), asio::detached);
        }
    }

    if (auto ec = engine.start()) {
        std::cerr << "启动失败: " << ec.message() << "\n";
        return 1;
    }

    ioc.run();
    return 0;
}
