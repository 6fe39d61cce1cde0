#pragma once

#include <cstddef>
#include <set>
#include <string>
#include "config.hpp"

namespace sandbox {

/**
 * @brief 静态检查的规则集合
 * 纯数据，构造完成后按值交给 validator，不存在全局共享的规则。
 */
struct rule_set {
    /**
     * @brief 禁止导入的顶层模块
     * 进程、网络、文件系统、反射逃逸相关的模块
     */
    std::set<std::string> denied_modules;

    /**
     * @brief 禁止调用或引用的内置函数
     * 动态执行代码、打开文件、获取作用域等
     */
    std::set<std::string> denied_builtins;

    /**
     * @brief 禁止访问的属性，主要是用于逃逸到 object 和 builtins 的魔法属性
     */
    std::set<std::string> denied_attributes;

    /**
     * @brief 与内置函数同名、但作为属性访问时不拦截的名字
     * 其余禁止的内置函数名即使出现在 x.open 这样的属性访问里也会被拒绝
     */
    std::set<std::string> attribute_safe_builtins;

    /**
     * @brief 允许导入的顶层模块，为空表示不启用白名单
     */
    std::set<std::string> allowed_modules;

    /**
     * @brief 代码的最大字节数
     */
    std::size_t max_source_bytes = 50000;

    /**
     * @brief 内置的默认规则
     */
    static rule_set defaults();

    /**
     * @brief 默认规则加上配置中额外禁止的模块和白名单
     */
    static rule_set from_config(const sandbox_config &config);
};

/**
 * 违规项的特殊规则名
 */
namespace rules {
constexpr const char *SYNTAX_ERROR = "syntax_error";
constexpr const char *SOURCE_TOO_LARGE = "source_too_large";
constexpr const char *INTERNAL_ERROR = "internal_error";
}  // namespace rules

}  // namespace sandbox
