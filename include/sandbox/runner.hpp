#pragma once

#include <string>
#include "config.hpp"
#include "sandbox/executor.hpp"
#include "sandbox/limits.hpp"
#include "sandbox/submission.hpp"
#include "sandbox/validator.hpp"

namespace sandbox {

/**
 * @brief 静态检查、受限执行、结果判定的完整流水线
 * 
 * run 永远不会抛出异常，沙箱自身的错误会记录到日志并返回 InternalError。
 * 不同请求之间没有共享的可变状态，可以在多个线程中并发调用。
 */
class runner {
public:
    explicit runner(const sandbox_config &config);

    /**
     * @brief 检查并执行一次提交
     */
    result run(const submission_request &request) const;

    /**
     * @brief 执行已经通过检查的代码，不再重复检查
     * 评测多个测试点时代码只需要检查一次
     */
    result execute(const submission_request &request) const;

    /**
     * @brief 只做静态检查
     */
    validation_verdict check(const std::string &source_code) const;

    /**
     * @brief 请求实际使用的限制
     */
    limit_spec effective_limits(const submission_request &request) const;

    const sandbox_config &get_config() const;

private:
    sandbox_config config;
    validator code_validator;
    resource_limiter limiter;
    executor code_executor;
};

}  // namespace sandbox
