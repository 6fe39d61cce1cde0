#include "sandbox/classifier.hpp"
#include <glog/logging.h>
#include <cstring>
#include "common/io_utils.hpp"
#include "sandbox/rule_set.hpp"

namespace sandbox {
using namespace std;

const char *const TRUNCATION_MARKER = "\n... [output truncated]\n";

result classify(const validation_verdict &verdict) {
    result res;
    if (verdict.allowed || verdict.violations.empty()) {
        LOG(ERROR) << "classifying an allowed verdict as a rejection";
        res.status = outcome::internal_error{};
        return res;
    }

    for (auto &v : verdict.violations) {
        if (v.rule_id == rules::INTERNAL_ERROR) {
            LOG(ERROR) << "validator failed: " << v.message;
            res.status = outcome::internal_error{};
            return res;
        }
    }

    res.status = outcome::resource_denied{verdict.violations.front().rule_id};
    return res;
}

bool ends_with_memory_error(const string &stderr_output) {
    size_t end = stderr_output.find_last_not_of(" \t\r\n");
    if (end == string::npos) return false;
    size_t begin = stderr_output.rfind('\n', end);
    begin = begin == string::npos ? 0 : begin + 1;
    string last_line = stderr_output.substr(begin, end - begin + 1);
    return last_line == "MemoryError" || last_line.rfind("MemoryError:", 0) == 0;
}

string make_display_string(const string &raw, size_t max_output_bytes, bool truncated) {
    string sanitized = utf8_sanitize(raw);
    if (!truncated && sanitized.size() <= max_output_bytes) return sanitized;

    size_t marker_length = strlen(TRUNCATION_MARKER);
    if (max_output_bytes <= marker_length)
        return string(TRUNCATION_MARKER, max_output_bytes);

    size_t pos = utf8_truncate_position(sanitized, max_output_bytes - marker_length);
    return sanitized.substr(0, pos) + TRUNCATION_MARKER;
}

static status classify_status(const execution_outcome &outcome) {
    if (outcome.state == execution_state::SPAWN_FAILED) {
        LOG(ERROR) << "unable to spawn child: " << outcome.diagnostic;
        return outcome::internal_error{};
    }

    const string sig = outcome.terminating_signal.value_or("");
    if (outcome.timed_out || outcome.state == execution_state::TIMED_OUT || sig == "SIGXCPU")
        return outcome::timeout{};

    // 执行器只在超时后发送 SIGKILL，其余的 SIGKILL 来自内核（比如 OOM killer）
    if (sig == "SIGKILL")
        return outcome::memory_exceeded{};
    if (outcome.exit_code && *outcome.exit_code != 0 && ends_with_memory_error(outcome.stderr_output))
        return outcome::memory_exceeded{};

    if (sig == "SIGXFSZ")
        return outcome::output_truncated{};

    if (!sig.empty() || (outcome.exit_code && *outcome.exit_code != 0))
        return outcome::runtime_error{};

    if (outcome.exit_code)
        return outcome::success{};

    LOG(ERROR) << "child " << outcome.pid << " has neither exit code nor signal: " << outcome.diagnostic;
    return outcome::internal_error{};
}

result classify(const execution_outcome &outcome, size_t max_output_bytes) {
    result res;
    res.status = classify_status(outcome);
    res.execution_time_ms = outcome.wall_time_ms;
    res.truncated = outcome.truncated_output;
    if (outcome.state == execution_state::SPAWN_FAILED) return res;

    res.stdout_output = make_display_string(outcome.stdout_output, max_output_bytes, outcome.stdout_truncated);
    res.stderr_output = make_display_string(outcome.stderr_output, max_output_bytes, outcome.stderr_truncated);
    return res;
}

}  // namespace sandbox
