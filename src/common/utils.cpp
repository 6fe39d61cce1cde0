#include "common/utils.hpp"
#include <signal.h>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include "common/stl_utils.hpp"

namespace sandbox {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

int64_t parse_size(const string &text) {
    if (text.empty()) throw invalid_argument("empty size");

    int64_t multiplier = 1;
    string digits = text;
    switch (toupper((unsigned char)text.back())) {
        case 'K': multiplier = 1LL << 10; break;
        case 'M': multiplier = 1LL << 20; break;
        case 'G': multiplier = 1LL << 30; break;
        default: break;
    }
    if (multiplier != 1) digits.pop_back();
    if (!is_integer(digits)) throw invalid_argument("invalid size '" + text + "'");

    int64_t value;
    try {
        value = stoll(digits);
    } catch (const out_of_range &) {
        throw invalid_argument("size '" + text + "' is too large");
    }
    if (value > numeric_limits<int64_t>::max() / multiplier)
        throw invalid_argument("size '" + text + "' is too large");
    return value * multiplier;
}

string signal_name(int signal) {
    // clang-format off
    static const unordered_map<int, const char *> names = {
        {SIGHUP, "SIGHUP"}, {SIGINT, "SIGINT"}, {SIGQUIT, "SIGQUIT"},
        {SIGILL, "SIGILL"}, {SIGTRAP, "SIGTRAP"}, {SIGABRT, "SIGABRT"},
        {SIGBUS, "SIGBUS"}, {SIGFPE, "SIGFPE"}, {SIGKILL, "SIGKILL"},
        {SIGUSR1, "SIGUSR1"}, {SIGSEGV, "SIGSEGV"}, {SIGUSR2, "SIGUSR2"},
        {SIGPIPE, "SIGPIPE"}, {SIGALRM, "SIGALRM"}, {SIGTERM, "SIGTERM"},
        {SIGCHLD, "SIGCHLD"}, {SIGCONT, "SIGCONT"}, {SIGSTOP, "SIGSTOP"},
        {SIGTSTP, "SIGTSTP"}, {SIGXCPU, "SIGXCPU"}, {SIGXFSZ, "SIGXFSZ"},
        {SIGSYS, "SIGSYS"}
    };
    // clang-format on
    auto it = names.find(signal);
    return it == names.end() ? "SIG" + to_string(signal) : it->second;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace sandbox
