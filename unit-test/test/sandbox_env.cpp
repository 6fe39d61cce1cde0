#include "test/sandbox_env.hpp"
#include <fstream>
#include <sstream>
#include "common/stl_utils.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

fs::path test_scratch_root() {
    fs::path root = fs::temp_directory_path() / "pysandbox-test";
    fs::create_directories(root);
    return root;
}

sandbox_config test_config() {
    sandbox_config config;
    config.python_executable = get_env("SANDBOX_PYTHON", "/usr/bin/python3");
    config.scratch_root = test_scratch_root();
    config.default_timeout_seconds = 5.0;
    config.workers = 4;
    return finalize_config(config);
}

size_t count_scratch_directories() {
    size_t count = 0;
    for (auto &entry : fs::directory_iterator(test_scratch_root()))
        if (entry.path().filename().string().rfind("pysandbox-", 0) == 0) ++count;
    return count;
}

size_t count_live_processes(int pgid) {
    size_t count = 0;
    for (auto &entry : fs::directory_iterator("/proc")) {
        string name = entry.path().filename().string();
        if (!is_integer(name)) continue;
        ifstream fin(entry.path() / "stat");
        string stat;
        if (!getline(fin, stat)) continue;  // 进程已经退出

        // pid (comm) state ppid pgrp ...，comm 中可能包含空格和括号
        size_t pos = stat.rfind(')');
        if (pos == string::npos) continue;
        stringstream ss(stat.substr(pos + 1));
        char state;
        int ppid, pgrp;
        if (!(ss >> state >> ppid >> pgrp)) continue;
        if (pgrp == pgid && state != 'Z' && state != 'X') ++count;
    }
    return count;
}

submission_request make_request(const string &source_code, const string &stdin_data, double timeout_seconds) {
    submission_request request;
    request.source_code = source_code;
    request.stdin_data = stdin_data;
    request.timeout_seconds = timeout_seconds;
    return request;
}

}  // namespace sandbox
