#pragma once

#include <filesystem>
#include <string>
#include "config.hpp"
#include "sandbox/submission.hpp"

/**
 * 测试用的沙箱配置
 * 解释器路径可以通过环境变量 SANDBOX_PYTHON 修改，
 * 临时目录放在系统临时目录下的 pysandbox-test 中，方便检查是否被清理。
 */
namespace sandbox {

sandbox_config test_config();

/**
 * @brief 测试使用的临时目录根目录
 */
std::filesystem::path test_scratch_root();

/**
 * @brief test_scratch_root 下残留的临时目录数量
 */
std::size_t count_scratch_directories();

/**
 * @brief 通过 /proc 统计进程组 pgid 中还活着（不是僵尸）的进程数量
 */
std::size_t count_live_processes(int pgid);

submission_request make_request(const std::string &source_code, const std::string &stdin_data = "", double timeout_seconds = 5.0);

}  // namespace sandbox
