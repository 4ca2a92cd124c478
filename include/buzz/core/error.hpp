#pragma once

#include <system_error>

namespace buzz::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有接口优先返回 std::error_code，避免异常路径。
 * - 引擎的状态迁移在前置条件不满足时是“静默 no-op”，返回值只说明原因：
 *   - invalid_state：当前状态不允许该操作
 *   - empty_sequence：序列为空，start() 不生效
 * - unavailable：协作方（震动/通知/后台保活）不可用，引擎只记录日志。
 */
enum class errc : int {
  ok = 0,
  cancelled = 1,
  invalid_argument = 2,
  empty_sequence = 3,
  invalid_state = 4,
  unavailable = 5,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace buzz::core

namespace std {
template <>
struct is_error_code_enum<buzz::core::errc> : true_type {};
}  // namespace std
