#include "buzz/timer/engine.hpp"

#include "buzz/core/error.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace buzz::timer {
namespace {

using buzz::core::errc;
using buzz::core::make_error_code;

}  // namespace

std::string_view to_string(EngineStatus status) noexcept {
  switch (status) {
    case EngineStatus::idle:
      return "idle";
    case EngineStatus::running:
      return "running";
    case EngineStatus::paused:
      return "paused";
    case EngineStatus::completed:
      return "completed";
  }
  return "unknown";
}

/*
 * TimerEngine 的运行模型（便于理解 run_generation_ 与 scheduler_ 的关系）：
 *
 * 1) start()/resume() 启动 scheduler_ 的循环，循环每 tick_period 调用一次 tick()；
 *    pause()/stop()/序列完成 会 cancel() 循环，保证之后不会再有旧 tick 执行。
 *
 * 2) tick() 只根据 deadline_ 与 clock_.now() 计算剩余时间；区间到期后同步进入下一个
 *    区间（或回绕/完成），循环本身无需重新安排。
 *
 * 3) run_generation_：每次 start() 与 teardown_() 递增。observer 回调中重入
 *    stop()/reset()/start() 时，外层 tick()/start() 比较 generation 后立即返回，
 *    不会在新一轮（或已停止）的状态上继续推进。
 */
TimerEngine::TimerEngine(asio::any_io_executor ex, core::Clock& clock, EngineOptions options)
  : clock_(clock),
    options_(options),
    scheduler_(std::move(ex)),
    throttle_(options.notify_interval) {}

TimerEngine::~TimerEngine() {
  scheduler_.cancel();
  release_background_();
}

const Interval* TimerEngine::current_interval() const noexcept {
  if (current_index_ < 0 || static_cast<std::size_t>(current_index_) >= sequence_.size()) {
    return nullptr;
  }
  return &sequence_.intervals[static_cast<std::size_t>(current_index_)];
}

StatusSnapshot TimerEngine::status_snapshot() const {
  StatusSnapshot snapshot{};
  snapshot.stopped = status_ == EngineStatus::idle || status_ == EngineStatus::completed;
  snapshot.paused = status_ == EngineStatus::paused;
  if (const auto* interval = current_interval()) {
    snapshot.interval_name = interval->name;
  }
  snapshot.remaining_ms = remaining_ms_;
  return snapshot;
}

std::error_code TimerEngine::set_sequence(IntervalSequence sequence) {
  if (status_ == EngineStatus::running || status_ == EngineStatus::paused) {
    spdlog::debug("timer engine: set_sequence ignored while {}", to_string(status_));
    return make_error_code(errc::invalid_state);
  }
  sequence_ = std::move(sequence);
  spdlog::debug("timer engine: sequence set ({} intervals, circular={})", sequence_.size(), sequence_.circular);
  return {};
}

std::error_code TimerEngine::start() {
  if (status_ == EngineStatus::running || status_ == EngineStatus::paused) {
    return make_error_code(errc::invalid_state);
  }
  if (sequence_.empty()) {
    spdlog::debug("timer engine: start ignored, sequence is empty");
    return make_error_code(errc::empty_sequence);
  }

  spdlog::info("timer engine: start ({} intervals, circular={})", sequence_.size(), sequence_.circular);

  const auto run = ++run_generation_;
  status_ = EngineStatus::running;
  lap_count_ = 0;
  throttle_.reset();

  acquire_background_();
  scheduler_.start(options_.tick_period, [this]() { tick(); });

  notify_([&](EngineObserver& o) { o.on_lap_count_changed(lap_count_); });
  if (!still_current_(run)) {
    return {};
  }
  enter_interval_(0, clock_.now());
  return {};
}

std::error_code TimerEngine::pause() {
  if (status_ != EngineStatus::running) {
    return make_error_code(errc::invalid_state);
  }

  // deadline 已过但 tick 尚未执行（含 0 时长区间）：先把到期处理掉，
  // 否则会冻结一个 remaining = 0、无法 resume 的区间。
  // 最多推进 size() 次，避免全 0 时长的循环序列在这里空转。
  for (std::size_t i = 0; i < sequence_.size(); ++i) {
    if (status_ != EngineStatus::running || deadline_ > clock_.now()) {
      break;
    }
    tick();
  }
  if (status_ != EngineStatus::running) {
    return make_error_code(errc::invalid_state);
  }

  scheduler_.cancel();
  const auto now = clock_.now();
  remaining_ms_ = std::max<std::int64_t>(core::to_millis(deadline_ - now), 0);
  status_ = EngineStatus::paused;
  spdlog::debug("timer engine: paused at index {} ({} ms left)", current_index_, remaining_ms_);

  refresh_status_(RefreshMode::forced, now);
  notify_([](EngineObserver& o) { o.on_paused(); });
  return {};
}

std::error_code TimerEngine::resume() {
  if (status_ != EngineStatus::paused || remaining_ms_ <= 0) {
    return make_error_code(errc::invalid_state);
  }

  const auto now = clock_.now();
  deadline_ = now + core::millis{remaining_ms_};
  status_ = EngineStatus::running;
  scheduler_.start(options_.tick_period, [this]() { tick(); });
  spdlog::debug("timer engine: resumed at index {} ({} ms left)", current_index_, remaining_ms_);

  refresh_status_(RefreshMode::forced, now);
  notify_([](EngineObserver& o) { o.on_resumed(); });
  return {};
}

std::error_code TimerEngine::stop() {
  switch (status_) {
    case EngineStatus::idle:
      return make_error_code(errc::invalid_state);
    case EngineStatus::completed:
      // 完成时已经做过一次 stop 等价的收尾并上报了 on_stopped，这里只回到 idle。
      status_ = EngineStatus::idle;
      return {};
    case EngineStatus::running:
    case EngineStatus::paused:
      teardown_(EngineStatus::idle);
      return {};
  }
  return make_error_code(errc::invalid_state);
}

std::error_code TimerEngine::reset() {
  if (status_ == EngineStatus::idle && lap_count_ == 0 && current_index_ < 0) {
    return make_error_code(errc::invalid_state);
  }

  if (status_ == EngineStatus::running || status_ == EngineStatus::paused) {
    teardown_(EngineStatus::idle);
    if (status_ != EngineStatus::idle) {
      // on_stopped 回调里重新 start() 了：以新一轮为准。
      return {};
    }
  }

  status_ = EngineStatus::idle;
  current_index_ = -1;
  remaining_ms_ = 0;
  lap_count_ = 0;
  throttle_.reset();
  spdlog::debug("timer engine: reset");

  notify_([](EngineObserver& o) { o.on_lap_count_changed(0); });
  notify_([](EngineObserver& o) { o.on_current_interval_changed(-1); });
  return {};
}

std::error_code TimerEngine::dispatch(Command command) {
  switch (command) {
    case Command::pause:
      return pause();
    case Command::resume:
      return resume();
    case Command::stop:
      return reset();
  }
  return make_error_code(errc::invalid_argument);
}

void TimerEngine::tick() {
  if (status_ != EngineStatus::running) {
    return;
  }

  const auto run = run_generation_;
  const auto now = clock_.now();
  remaining_ms_ = core::to_millis(deadline_ - now);

  if (remaining_ms_ > 0) {
    notify_([&](EngineObserver& o) { o.on_tick(remaining_ms_); });
    if (!still_current_(run)) {
      return;
    }
    if (throttle_.should_refresh(now)) {
      refresh_status_(RefreshMode::throttled, now);
    }
    return;
  }

  remaining_ms_ = 0;
  const auto finished = current_index_;
  pulse_haptic_();
  notify_([&](EngineObserver& o) { o.on_interval_complete(finished); });
  if (!still_current_(run)) {
    return;
  }

  const auto next = static_cast<std::size_t>(finished) + 1U;
  if (next < sequence_.size()) {
    enter_interval_(next, now);
    return;
  }

  if (sequence_.circular) {
    ++lap_count_;
    spdlog::info("timer engine: lap {} complete", lap_count_);
    notify_([&](EngineObserver& o) { o.on_lap_count_changed(lap_count_); });
    if (!still_current_(run)) {
      return;
    }
    enter_interval_(0, now);
    return;
  }

  spdlog::info("timer engine: sequence complete");
  notify_([](EngineObserver& o) { o.on_sequence_complete(); });
  if (!still_current_(run)) {
    return;
  }
  teardown_(EngineStatus::completed);
}

void TimerEngine::enter_interval_(std::size_t index, core::time_point now) {
  const auto& interval = sequence_.intervals[index];
  const auto length = std::max<std::int64_t>(interval.duration_ms, 0);

  current_index_ = static_cast<int>(index);
  remaining_ms_ = length;
  deadline_ = now + core::millis{length};
  spdlog::debug("timer engine: interval {} ({} ms)", index, length);

  const auto run = run_generation_;
  notify_([&](EngineObserver& o) { o.on_current_interval_changed(current_index_); });
  if (!still_current_(run)) {
    return;
  }
  refresh_status_(RefreshMode::forced, now);
}

void TimerEngine::teardown_(EngineStatus final_status) {
  ++run_generation_;
  scheduler_.cancel();

  status_ = final_status;
  current_index_ = -1;
  remaining_ms_ = 0;
  deadline_ = core::time_point{};
  release_background_();
  spdlog::debug("timer engine: stopped ({})", to_string(final_status));

  refresh_status_(RefreshMode::forced, clock_.now());
  // 节流时间戳不跨轮保留：下一次 start 必然立即刷新。
  throttle_.reset();
  notify_([](EngineObserver& o) { o.on_stopped(); });
}

void TimerEngine::refresh_status_(RefreshMode mode, core::time_point now) {
  throttle_.mark(now);
  if (collaborators_.status == nullptr) {
    return;
  }
  if (auto ec = collaborators_.status->refresh(status_snapshot(), mode)) {
    spdlog::warn("timer engine: status refresh failed: {}", ec.message());
  }
}

void TimerEngine::pulse_haptic_() {
  if (collaborators_.haptic == nullptr) {
    return;
  }
  if (auto ec = collaborators_.haptic->pulse(options_.haptic_pulse)) {
    spdlog::warn("timer engine: haptic pulse failed: {}", ec.message());
  }
}

void TimerEngine::acquire_background_() {
  release_background_();
  if (collaborators_.background == nullptr) {
    return;
  }
  if (auto ec = collaborators_.background->acquire(options_.background_lease)) {
    // 尽力而为：拿不到后台保障也继续计时。
    spdlog::warn("timer engine: background guarantee unavailable: {}", ec.message());
    return;
  }
  background_held_ = true;
}

void TimerEngine::release_background_() noexcept {
  if (!background_held_ || collaborators_.background == nullptr) {
    background_held_ = false;
    return;
  }
  background_held_ = false;
  collaborators_.background->release();
}

}  // namespace buzz::timer
