#pragma once

#include <string>
#include <variant>

namespace sandbox {

/**
 * 提交代码的执行结果状态。
 * 每一种状态都是一个独立的类型，status 是它们的闭合 variant，
 * 调用方需要通过 std::visit 处理每一种情况。
 */
namespace outcome {

/**
 * @brief 程序正常退出，返回值为 0，且没有超出任何限制
 */
struct success {};

/**
 * @brief 程序抛出了未捕获的异常或者以非 0 返回值退出
 * stderr 会原样保留给调用方用于展示
 */
struct runtime_error {};

/**
 * @brief 程序运行超过了时钟时间限制或者 CPU 时间限制
 */
struct timeout {};

/**
 * @brief 程序运行内存超限
 * 由于 RLIMIT_AS 限制内存时 Python 会抛出 MemoryError 而不是被信号杀死，
 * 因此还需要检查 stderr 的最后一行是否为 MemoryError。
 */
struct memory_exceeded {};

/**
 * @brief 代码在执行前被静态检查拒绝
 */
struct resource_denied {
    /**
     * @brief 第一个违规项的规则名，比如 "os"、"eval"、"syntax_error"
     */
    std::string rule_id;
};

/**
 * @brief 程序写文件内容超过了文件大小限制（SIGXFSZ）
 */
struct output_truncated {};

/**
 * @brief 沙箱自身出错，比如两次都无法启动子进程
 */
struct internal_error {};

inline bool operator==(const success &, const success &) { return true; }
inline bool operator==(const runtime_error &, const runtime_error &) { return true; }
inline bool operator==(const timeout &, const timeout &) { return true; }
inline bool operator==(const memory_exceeded &, const memory_exceeded &) { return true; }
inline bool operator==(const resource_denied &a, const resource_denied &b) { return a.rule_id == b.rule_id; }
inline bool operator==(const output_truncated &, const output_truncated &) { return true; }
inline bool operator==(const internal_error &, const internal_error &) { return true; }

}  // namespace outcome

using status = std::variant<outcome::success,
                            outcome::runtime_error,
                            outcome::timeout,
                            outcome::memory_exceeded,
                            outcome::resource_denied,
                            outcome::output_truncated,
                            outcome::internal_error>;

/**
 * @brief 状态的机器可读名称，比如 "Success"、"ResourceDenied"
 */
const char *get_status_name(const status &);

/**
 * @brief 状态的展示信息，ResourceDenied 会带上规则名
 */
std::string get_display_message(const status &);

}  // namespace sandbox
