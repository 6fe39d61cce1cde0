#pragma once

#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，覆盖已有内容
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将字符串中无效的 UTF-8 字节替换为 U+FFFD
 * 子进程的输出可能被截断在多字节字符中间，或者本身就不是 UTF-8。
 */
std::string utf8_sanitize(const std::string &string);

/**
 * @brief 找到不超过 limit 的最大截断位置，且不会截断在多字节字符中间
 */
std::size_t utf8_truncate_position(const std::string &string, std::size_t limit);

/**
 * @brief 一次执行独占的临时目录
 * 构造时在 root 下通过 mkdtemp 创建新目录，析构时递归删除。
 * 
 * root
 * └── pysandbox-XXXXXX // 随机后缀
 *     └── main.py // 提交的代码
 */
struct scratch_directory {
    explicit scratch_directory(const std::filesystem::path &root);
    scratch_directory(scratch_directory &&);
    scratch_directory(const scratch_directory &) = delete;
    ~scratch_directory();

    scratch_directory &operator=(scratch_directory &&);
    scratch_directory &operator=(const scratch_directory &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 立即删除临时目录，失败时只记录日志
     */
    void release();

private:
    std::filesystem::path dir;
    bool valid;
};

}  // namespace sandbox
