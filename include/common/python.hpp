#pragma once

// Python.h 必须在所有标准库头文件之前引入
#include <Python.h>
#include <string>

namespace sandbox {

/**
 * @brief 初始化内嵌的 Python 解释器
 * 可以重复调用，只有第一次调用生效。初始化后释放 GIL，
 * 之后任何线程都需要通过 GIL_guard 获取 GIL 才能调用 Python C API。
 * 不会注册 Python 自己的信号处理函数。
 */
void python_initialize();

/**
 * @brief 获取并清除当前线程的 Python 异常，返回 "类型: 信息" 形式的描述
 */
std::string python_fetch_error();

}  // namespace sandbox

class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

private:
    PyGILState_STATE state;
};

/**
 * @brief 持有一个 Python 对象的强引用，析构时释放
 * 只能在持有 GIL 时构造、析构
 */
class py_ref {
public:
    py_ref() noexcept;
    explicit py_ref(PyObject *obj) noexcept;
    py_ref(py_ref &&other) noexcept;
    py_ref(const py_ref &) = delete;
    ~py_ref();

    py_ref &operator=(py_ref &&other) noexcept;
    py_ref &operator=(const py_ref &) = delete;

    PyObject *get() const noexcept;
    explicit operator bool() const noexcept;

private:
    PyObject *obj;
};
