#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "sandbox/runner.hpp"

namespace sandbox {

/**
 * @brief 一个测试点：stdin 输入与期望的 stdout
 */
struct test_case {
    std::string name = "Test";
    std::string input;
    std::string expected_output;

    /**
     * @brief 隐藏测试点，报告中不包含输入、期望输出和实际输出
     */
    bool hidden = false;
};

struct test_case_result {
    std::string name;
    bool passed = false;
    bool hidden = false;
    std::string input;
    std::string expected_output;
    sandbox::result result;
};

struct grading_report {
    std::vector<test_case_result> results;
    std::size_t passed_count = 0;
    std::size_t total_count = 0;

    /**
     * @brief 通过测试点的百分比，0 到 100，没有测试点时为 0
     */
    double score = 0;

    /**
     * @brief 所有测试点的执行时间之和
     */
    int64_t execution_time_ms = 0;
};

void from_json(const nlohmann::json &j, test_case &tc);

void to_json(nlohmann::json &j, const test_case_result &res);

void to_json(nlohmann::json &j, const grading_report &report);

/**
 * @brief 规范化程序输出以便比较
 * 去掉每一行末尾的空白字符以及末尾的空行，统一换行符为 \n
 */
std::string normalize_output(const std::string &output);

/**
 * @brief 忽略行末空白与末尾空行后比较两个输出
 */
bool outputs_match(const std::string &expected, const std::string &actual);

/**
 * @brief 使用测试点评测提交
 * 代码只检查一次，被拒绝时每个测试点都返回同样的 ResourceDenied；
 * 否则每个测试点使用各自的输入执行一次。
 */
class grader {
public:
    explicit grader(const runner &pipeline);

    grading_report grade(const submission_request &request, const std::vector<test_case> &test_cases) const;

private:
    const runner &pipeline;
};

}  // namespace sandbox
