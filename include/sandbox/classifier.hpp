#pragma once

#include <cstddef>
#include <string>
#include "sandbox/executor.hpp"
#include "sandbox/submission.hpp"
#include "sandbox/validator.hpp"

namespace sandbox {

/**
 * @brief 输出被截断时追加在展示字符串末尾的标记
 */
extern const char *const TRUNCATION_MARKER;

/**
 * @brief 将静态检查的结论转换为结果
 * 只应在 verdict.allowed 为假时调用。
 * 检查器自身出错时返回 InternalError，否则返回第一个违规项的 ResourceDenied。
 */
result classify(const validation_verdict &verdict);

/**
 * @brief 将执行结果转换为返回给调用方的结果
 * 
 * 判定顺序：
 * 1. 无法启动子进程：InternalError
 * 2. 超过时钟时间限制或者收到 SIGXCPU：Timeout
 * 3. 不是执行器发送的 SIGKILL，或者以非 0 返回值退出且最后抛出 MemoryError：MemoryExceeded
 * 4. SIGXFSZ：OutputTruncated
 * 5. 非 0 返回值或者其他信号：RuntimeError
 * 6. 返回值为 0：Success
 * 
 * @param max_output_bytes 展示字符串（包括截断标记）的最大字节数
 */
result classify(const execution_outcome &outcome, std::size_t max_output_bytes);

/**
 * @brief 将原始输出转换为展示字符串
 * 无效的 UTF-8 字节被替换为 U+FFFD，
 * 超出 max_output_bytes 时截断在字符边界上并追加截断标记。
 * @param truncated 原始输出是否已经被丢弃过字节
 */
std::string make_display_string(const std::string &raw, std::size_t max_output_bytes, bool truncated);

/**
 * @brief stderr 的最后一行是否是 Python 的 MemoryError
 */
bool ends_with_memory_error(const std::string &stderr_output);

}  // namespace sandbox
