#include "buzz/core/log.hpp"

#include <spdlog/spdlog.h>

#include <string_view>

namespace buzz::core {
namespace {

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::trace:
        return spdlog::level::trace;
    case LogLevel::debug:
        return spdlog::level::debug;
    case LogLevel::info:
        return spdlog::level::info;
    case LogLevel::warn:
        return spdlog::level::warn;
    case LogLevel::error:
        return spdlog::level::err;
    case LogLevel::critical:
        return spdlog::level::critical;
    case LogLevel::off:
        return spdlog::level::off;
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::trace;
    case spdlog::level::debug:
        return LogLevel::debug;
    case spdlog::level::info:
        return LogLevel::info;
    case spdlog::level::warn:
        return LogLevel::warn;
    case spdlog::level::err:
        return LogLevel::error;
    case spdlog::level::critical:
        return LogLevel::critical;
    case spdlog::level::off:
        return LogLevel::off;
    default:
        return LogLevel::off;
    }
}

} // namespace

void set_log_level(LogLevel level) noexcept {
    // spdlog 可能被业务侧额外配置；这里仅做最小的全局级别设置。
    spdlog::set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept { return from_spdlog_level(spdlog::get_level()); }

bool parse_log_level(const char* text, LogLevel& out) noexcept {
    if (text == nullptr) {
        return false;
    }
    const std::string_view name{text};
    // 与 spdlog 的级别名保持一致，额外接受 "error"（spdlog 内部叫 "err"）。
    if (name == "trace") {
        out = LogLevel::trace;
    } else if (name == "debug") {
        out = LogLevel::debug;
    } else if (name == "info") {
        out = LogLevel::info;
    } else if (name == "warn" || name == "warning") {
        out = LogLevel::warn;
    } else if (name == "error" || name == "err") {
        out = LogLevel::error;
    } else if (name == "critical") {
        out = LogLevel::critical;
    } else if (name == "off") {
        out = LogLevel::off;
    } else {
        return false;
    }
    return true;
}

} // namespace buzz::core
