#pragma once

#include <sys/types.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "config.hpp"
#include "sandbox/limits.hpp"

namespace sandbox {

enum class execution_state {
    /**
     * @brief 子进程在时限内自行退出（包括被非资源限制的信号杀死，比如 SIGSEGV）
     */
    COMPLETED,

    /**
     * @brief 超过时钟时间限制，被执行器杀死
     */
    TIMED_OUT,

    /**
     * @brief 子进程被资源限制的信号杀死（不是执行器发送的 SIGKILL、SIGXCPU、SIGXFSZ）
     */
    KILLED,

    /**
     * @brief 无法启动子进程
     */
    SPAWN_FAILED
};

const char *get_state_name(execution_state state);

/**
 * @brief 执行器内部的执行结果，由 classifier 转换为返回给调用方的 result
 */
struct execution_outcome {
    execution_state state = execution_state::SPAWN_FAILED;

    std::optional<int> exit_code;

    /**
     * @brief 杀死子进程的信号名，比如 "SIGKILL"
     */
    std::optional<std::string> terminating_signal;

    /**
     * @brief 原始输出字节，最多 max_output_bytes 字节
     */
    std::string stdout_output;
    std::string stderr_output;

    int64_t wall_time_ms = 0;

    bool timed_out = false;

    /**
     * @brief stdout 或 stderr 是否有超出上限被丢弃的字节
     */
    bool truncated_output = false;

    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief 启动子进程的尝试次数，每次尝试都使用新的临时目录
     */
    int spawn_attempts = 0;

    /**
     * @brief 子进程 pid，同时也是子进程所在进程组的 id
     */
    pid_t pid = -1;

    /**
     * @brief 执行器的诊断信息，只写入日志，不会返回给调用方
     */
    std::string diagnostic;
};

/**
 * @brief 在受限的子进程中运行 Python 代码
 * 
 * 每次执行：
 * 1. 创建新的临时目录，写入 main.py
 * 2. fork 子进程，子进程调用 setsid 成为新进程组的组长，设置资源限制和 seccomp 后 execve 解释器
 * 3. 父进程通过 poll 同时写 stdin、读 stdout 和 stderr、检查子进程是否退出，
 *    超过时钟时间限制后杀死整个进程组
 * 4. 无论结果如何，返回前杀死整个进程组并删除临时目录
 * 
 * 启动失败时会换一个新的临时目录重试一次。
 * execute 可以在多个线程中并发调用。
 */
class executor {
public:
    explicit executor(const sandbox_config &config);
    ~executor();

    /**
     * @brief 执行代码
     * 启动失败不会抛出异常，而是返回 SPAWN_FAILED。
     * @throw std::system_error 监控子进程的过程中发生系统调用错误，此时子进程已被杀死
     */
    execution_outcome execute(const std::string &source_code, const std::string &stdin_data, const limit_spec &limits) const;

private:
    sandbox_config config;
    std::unique_ptr<seccomp_filter> filter;

    execution_outcome run_once(const std::string &source_code, const std::string &stdin_data, const limit_spec &limits) const;
};

}  // namespace sandbox
