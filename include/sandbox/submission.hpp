#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"

namespace sandbox {

/**
 * @brief 一次代码执行请求
 * timeout_seconds 与 memory_limit_bytes 只是调用方的建议值，
 * 最终会被限制在配置的上限以内。
 */
struct submission_request {
    std::string source_code;

    /**
     * @brief 传给程序的标准输入
     */
    std::string stdin_data;

    double timeout_seconds = 5.0;

    int64_t memory_limit_bytes = 50LL << 20;
};

/**
 * @brief 沙箱返回给调用方的唯一结果类型
 */
struct result {
    sandbox::status status = outcome::internal_error{};

    /**
     * @brief 程序的标准输出，合法的 UTF-8，超出上限时被截断并以截断标记结尾
     */
    std::string stdout_output;

    /**
     * @brief 程序的标准错误输出，不包含沙箱自身的诊断信息
     */
    std::string stderr_output;

    int64_t execution_time_ms = 0;

    /**
     * @brief stdout 或者 stderr 是否被截断
     * 截断只是附加信息，不影响 status
     */
    bool truncated = false;
};

void from_json(const nlohmann::json &j, submission_request &request);

void to_json(nlohmann::json &j, const result &res);

}  // namespace sandbox
