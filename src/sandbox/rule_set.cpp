#include "sandbox/rule_set.hpp"

namespace sandbox {
using namespace std;

rule_set rule_set::defaults() {
    rule_set rules;
    // clang-format off
    rules.denied_modules = {
        // 进程与系统
        "os", "subprocess", "sys", "multiprocessing", "threading", "signal",
        "resource", "pty", "tty", "termios", "fcntl", "pipes", "posix",
        "pwd", "grp", "crypt", "spwd", "syslog", "commands", "popen2",
        // 文件系统
        "shutil", "pathlib", "glob", "tempfile", "io", "shelve", "dbm", "sqlite3",
        // 网络
        "socket", "urllib", "http", "ftplib", "smtplib", "telnetlib", "ssl",
        "asyncio", "concurrent",
        // 反射与动态加载
        "ctypes", "importlib", "builtins", "__builtins__", "pickle", "marshal",
        "code", "codeop", "gc", "inspect"
    };
    rules.denied_builtins = {
        "eval", "exec", "compile", "open", "__import__", "globals", "locals",
        "vars", "dir", "getattr", "setattr", "delattr", "hasattr", "breakpoint",
        "memoryview"
    };
    rules.denied_attributes = {
        "__class__", "__bases__", "__subclasses__", "__mro__", "__globals__",
        "__code__", "__builtins__", "__import__", "__loader__", "__spec__",
        "__dict__", "__getattribute__",
        // 绑定方法、闭包和序列化协议可以拿到 builtins 模块或任意函数
        "__self__", "__func__", "__closure__", "__reduce__", "__reduce_ex__",
        // 生成器、协程、栈帧和 traceback 可以拿到 f_builtins、f_globals
        "gi_frame", "gi_code", "cr_frame", "ag_frame", "f_globals", "f_builtins",
        "f_locals", "f_back", "tb_frame"
    };
    // re.compile 等常见方法与内置函数同名，只拦截作为名字的 compile
    rules.attribute_safe_builtins = {"compile"};
    // clang-format on
    return rules;
}

rule_set rule_set::from_config(const sandbox_config &config) {
    rule_set rules = defaults();
    rules.denied_modules.insert(config.denylisted_modules.begin(), config.denylisted_modules.end());
    rules.allowed_modules.insert(config.allowed_modules.begin(), config.allowed_modules.end());
    rules.max_source_bytes = static_cast<size_t>(config.max_source_bytes);
    return rules;
}

}  // namespace sandbox
