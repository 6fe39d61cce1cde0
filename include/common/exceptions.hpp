#pragma once

#include <fmt/core.h>
#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace sandbox {

struct sandbox_exception : std::exception {
    sandbox_exception();
    explicit sandbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex);

    template <typename T>
    sandbox_exception operator<<(const T &t) const {
        return sandbox_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示沙箱自身的内部错误
 * 与提交的代码无关，比如管道读写失败、子进程状态无法识别
 */
struct internal_error : public sandbox_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示无法创建受控子进程
 * 包括创建临时目录、管道、fork 以及 execve 失败。
 * 执行器会换一个新的临时目录重试一次，再次失败才会返回 InternalError。
 */
struct spawn_error : public internal_error {
    spawn_error(int err, const std::string &message);

    /**
     * @brief 导致失败的 errno，未知时为 0
     */
    int error_code() const noexcept;

private:
    int err;
};

/**
 * @brief 根据 errno 抛出 std::system_error，消息通过 fmt 格式化
 */
template <typename... Args>
[[noreturn]] void throw_errno(int err, const char *format, Args &&...args) {
    throw std::system_error(err, std::system_category(), fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace sandbox
