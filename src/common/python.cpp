#include "common/python.hpp"
#include <glog/logging.h>
#include <mutex>

namespace sandbox {
using namespace std;

void python_initialize() {
    static once_flag flag;
    call_once(flag, [] {
        if (Py_IsInitialized()) return;
        // 0 表示不安装 SIGINT 等信号处理函数，避免干扰宿主进程
        Py_InitializeEx(0);
        // 释放主线程持有的 GIL，其他 worker 线程通过 GIL_guard 获取
        PyEval_SaveThread();
        LOG(INFO) << "embedded python " << Py_GetVersion() << " initialized";
    });
}

string python_fetch_error() {
    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type) return "unknown python error";
    PyErr_NormalizeException(&type, &value, &traceback);
    py_ref type_ref(type), value_ref(value), traceback_ref(traceback);

    string message = reinterpret_cast<PyTypeObject *>(type)->tp_name;
    if (value) {
        py_ref text(PyObject_Str(value));
        if (text) {
            const char *utf8 = PyUnicode_AsUTF8(text.get());
            if (utf8) message += string(": ") + utf8;
        }
        PyErr_Clear();
    }
    return message;
}

}  // namespace sandbox

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

py_ref::py_ref() noexcept : obj(nullptr) {}

py_ref::py_ref(PyObject *obj) noexcept : obj(obj) {}

py_ref::py_ref(py_ref &&other) noexcept : obj(other.obj) {
    other.obj = nullptr;
}

py_ref::~py_ref() {
    Py_XDECREF(obj);
}

py_ref &py_ref::operator=(py_ref &&other) noexcept {
    if (this != &other) {
        Py_XDECREF(obj);
        obj = other.obj;
        other.obj = nullptr;
    }
    return *this;
}

PyObject *py_ref::get() const noexcept {
    return obj;
}

py_ref::operator bool() const noexcept {
    return obj != nullptr;
}
