#pragma once

#include <linux/filter.h>
#include <cstddef>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "sandbox/submission.hpp"

namespace sandbox {

/**
 * @brief 施加在一次执行上的全部限制
 * 由 resource_limiter 根据请求和配置上限计算得到。
 */
struct limit_spec {
    /**
     * @brief 时钟时间限制（秒），由执行器自己计时，不依赖子进程配合
     */
    double wall_timeout_seconds = 5.0;

    /**
     * @brief RLIMIT_AS
     */
    int64_t address_space_bytes = 50LL << 20;

    /**
     * @brief RLIMIT_CPU 的软限制与硬限制（秒）
     * 硬限制比软限制多一秒：到达软限制时内核发送 SIGXCPU，到达硬限制时发送 SIGKILL，
     * 这样可以通过 SIGXCPU 可靠地判断是否是 CPU 时间超限。
     */
    int64_t cpu_soft_seconds = 5;
    int64_t cpu_hard_seconds = 6;

    /**
     * @brief RLIMIT_FSIZE，子进程能写入的最大文件大小
     */
    int64_t file_size_bytes = 64LL << 10;

    /**
     * @brief stdout、stderr 各自最多保留的字节数
     */
    int64_t max_output_bytes = 64LL << 10;

    /**
     * @brief RLIMIT_NPROC
     */
    int max_processes = 1;

    /**
     * @brief RLIMIT_NOFILE
     */
    int max_open_files = 64;

    bool no_core_dumps = true;

    bool use_seccomp = true;
};

void to_json(nlohmann::json &j, const limit_spec &spec);

/**
 * @brief 将调用方提供的限制转换为 limit_spec，并限制在配置的上限以内
 */
class resource_limiter {
public:
    explicit resource_limiter(const sandbox_config &config);

    /**
     * @param memory_limit_bytes 请求的内存限制，非正数表示使用上限
     * @param cpu_seconds 请求的时间限制，同时作为时钟时间与 CPU 时间的限制，
     *                    非正数或者非有限值表示使用上限
     */
    limit_spec build_limits(int64_t memory_limit_bytes, double cpu_seconds) const;

    limit_spec build_limits(const submission_request &request) const;

    double clamp_timeout(double timeout_seconds) const;

    int64_t clamp_memory(int64_t memory_limit_bytes) const;

private:
    sandbox_config config;
};

/**
 * @brief 在 fork 出的子进程中设置资源限制
 * 只调用 async-signal-safe 的函数，不会分配内存、不会抛出异常。
 * 不能提高当前进程已有的硬限制，因此会取二者的较小值。
 * @return 成功返回 0，否则返回 errno
 */
int apply_limits(const limit_spec &spec) noexcept;

/**
 * @brief 禁止子进程创建新进程和网络套接字的 seccomp 过滤器
 * 在父进程中构造规则并导出编译好的 BPF 程序，子进程在 execve 之前调用 load。
 */
class seccomp_filter {
public:
    seccomp_filter();
    seccomp_filter(const seccomp_filter &) = delete;

    seccomp_filter &operator=(const seccomp_filter &) = delete;

    /**
     * @brief 将过滤器安装到当前进程，在子进程中调用
     * 只调用 prctl，不分配内存。
     * @return 成功返回 0，否则返回 errno
     */
    int load() const noexcept;

    /**
     * @brief BPF 程序的指令数
     */
    std::size_t size() const;

private:
    std::vector<struct sock_filter> program;
};

}  // namespace sandbox
