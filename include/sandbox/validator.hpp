#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "sandbox/rule_set.hpp"

namespace sandbox {

enum class violation_kind {
    SYNTAX,
    IMPORT,
    BUILTIN,
    ATTRIBUTE,
    SOURCE_SIZE,
    INTERNAL
};

/**
 * @brief 代码中的一处违规
 */
struct violation {
    /**
     * @brief 行号，从 1 开始
     */
    int line = 0;

    /**
     * @brief 列号，从 1 开始
     */
    int column = 0;

    /**
     * @brief 违反的规则，一般是被禁止的标识符本身，比如 "os"、"eval"
     */
    std::string rule_id;

    std::string message;

    violation_kind kind = violation_kind::INTERNAL;
};

/**
 * @brief 静态检查的结论
 * allowed 为真当且仅当 violations 为空，violations 按行列排序
 */
struct validation_verdict {
    bool allowed = true;
    std::vector<violation> violations;
};

void to_json(nlohmann::json &j, const violation &v);

void to_json(nlohmann::json &j, const validation_verdict &verdict);

/**
 * @brief 静态检查器
 * 通过内嵌的 Python 解释器的 ast 模块解析代码，在执行前拒绝违反规则的代码。
 * 
 * 检查的内容：
 * 1. import 和 from ... import 的模块，按照真实模块名而不是别名匹配
 * 2. 调用或者引用被禁止的内置函数（f = eval 也会被发现）
 * 3. 访问被禁止的魔法属性
 * 
 * validate 是纯函数，可以在多个线程中并发调用，任何情况下都不会抛出异常。
 */
class validator {
public:
    explicit validator(rule_set rules);

    /**
     * @brief 检查代码，一次返回所有违规项
     * @param source_code 提交的 Python 代码
     */
    validation_verdict validate(const std::string &source_code) const;

    const rule_set &rules() const;

private:
    rule_set ruleset;

    void walk(const std::string &source_code, std::vector<violation> &violations) const;
    void check_module(const std::string &module, int line, int column, std::vector<violation> &violations) const;
};

}  // namespace sandbox
