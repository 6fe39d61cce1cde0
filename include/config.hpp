#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sandbox {

/**
 * @brief pysandbox 命令行程序的返回值
 * 与评测脚本的约定保持一致
 */
enum error_codes {
    E_SUCCESS = 0,
    E_INTERNAL_ERROR = 2,

    E_ACCEPTED = 42,
    E_WRONG_ANSWER = 43,
    E_RUNTIME_ERROR = 48,
    E_OUTPUT_LIMIT = 51,
    E_TIME_LIMIT = 52,
    E_MEM_LIMIT = 53,
    E_RESOURCE_DENIED = 55
};

/**
 * @brief 沙箱的部署配置
 * 构造后不再修改，按值或 const 引用传给 validator、executor 等组件，
 * 因此不同部署、不同测试可以使用不同的配置。
 */
struct sandbox_config {
    /**
     * @brief 时钟时间限制的上限（秒），也是请求未指定时的默认值
     * 请求中的 timeout_seconds 只是建议值，会被限制在这个值以内
     */
    double default_timeout_seconds = 5.0;

    /**
     * @brief 内存限制的上限（字节），也是请求未指定时的默认值
     */
    int64_t default_memory_limit_bytes = 50LL << 20;

    /**
     * @brief stdout、stderr 各自最多保留的字节数，超出部分被丢弃
     */
    int64_t max_output_bytes = 64LL << 10;

    /**
     * @brief 在内置规则之外额外禁止导入的模块
     */
    std::vector<std::string> denylisted_modules;

    /**
     * @brief 允许导入的模块，为空表示不启用白名单
     */
    std::vector<std::string> allowed_modules;

    /**
     * @brief 提交代码的最大字节数，超过直接拒绝
     */
    int64_t max_source_bytes = 50000;

    /**
     * @brief 运行提交代码的 Python 解释器
     */
    std::filesystem::path python_executable = "/usr/bin/python3";

    /**
     * @brief 存放每次执行的临时目录的根目录，为空时使用系统临时目录
     */
    std::filesystem::path scratch_root;

    /**
     * @brief 子进程的 RLIMIT_NPROC
     */
    int max_processes = 1;

    /**
     * @brief 子进程的 RLIMIT_NOFILE
     */
    int max_open_files = 64;

    /**
     * @brief 是否通过 seccomp 禁止创建进程和网络套接字
     */
    bool use_seccomp = true;

    /**
     * @brief 并发执行提交的 worker 数量，0 表示使用 CPU 核心数
     */
    unsigned workers = 0;
};

void from_json(const nlohmann::json &j, sandbox_config &config);

void to_json(nlohmann::json &j, const sandbox_config &config);

/**
 * @brief 从 JSON 文件读取配置，缺省的字段使用默认值
 * @throw std::invalid_argument 配置格式错误
 */
sandbox_config load_config(const std::filesystem::path &path);

/**
 * @brief 检查配置是否合法，并补全 scratch_root、workers 等需要运行时确定的值
 * @throw std::invalid_argument 配置项取值非法
 */
sandbox_config finalize_config(sandbox_config config);

}  // namespace sandbox
