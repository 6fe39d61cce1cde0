#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sandbox {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 解析带单位的字节数，比如 "65536"、"64K"、"50M"、"1G"
 * @throw std::invalid_argument 格式不正确或者溢出
 */
int64_t parse_size(const std::string &text);

/**
 * @brief 将信号编号转换为 "SIGKILL" 形式的名称，未知信号返回 "SIG" + 编号
 */
std::string signal_name(int signal);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace sandbox
