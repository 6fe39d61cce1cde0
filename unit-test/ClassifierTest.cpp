#include <cstring>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/classifier.hpp"

using namespace std;
using namespace sandbox;

static execution_outcome completed(int exit_code, const string &out = "", const string &err = "") {
    execution_outcome outcome;
    outcome.state = execution_state::COMPLETED;
    outcome.exit_code = exit_code;
    outcome.stdout_output = out;
    outcome.stderr_output = err;
    outcome.wall_time_ms = 12;
    return outcome;
}

static execution_outcome signaled(const string &signal, execution_state state = execution_state::KILLED) {
    execution_outcome outcome;
    outcome.state = state;
    outcome.terminating_signal = signal;
    return outcome;
}

TEST(ClassifierTest, ExitZeroIsSuccess) {
    result res = classify(completed(0, "hello\n"), 1024);
    EXPECT_EQ(res.status, status(outcome::success{}));
    EXPECT_EQ(res.stdout_output, "hello\n");
    EXPECT_EQ(res.execution_time_ms, 12);
    EXPECT_FALSE(res.truncated);
}

TEST(ClassifierTest, NonZeroExitIsRuntimeError) {
    string traceback = "Traceback (most recent call last):\n  File \"main.py\", line 1, in <module>\nZeroDivisionError: division by zero\n";
    result res = classify(completed(1, "", traceback), 1024);
    EXPECT_EQ(res.status, status(outcome::runtime_error{}));
    EXPECT_EQ(res.stderr_output, traceback);
}

TEST(ClassifierTest, MemoryErrorTracebackIsMemoryExceeded) {
    result res = classify(completed(1, "", "Traceback (most recent call last):\n  File \"main.py\", line 1\nMemoryError\n"), 1024);
    EXPECT_EQ(res.status, status(outcome::memory_exceeded{}));
}

TEST(ClassifierTest, UnexpectedSigkillIsMemoryExceeded) {
    EXPECT_EQ(classify(signaled("SIGKILL"), 1024).status, status(outcome::memory_exceeded{}));
}

TEST(ClassifierTest, TimeoutTakesPrecedence) {
    execution_outcome outcome = signaled("SIGKILL", execution_state::TIMED_OUT);
    outcome.timed_out = true;
    EXPECT_EQ(classify(outcome, 1024).status, status(outcome::timeout{}));
    EXPECT_EQ(classify(signaled("SIGXCPU"), 1024).status, status(outcome::timeout{}));
}

TEST(ClassifierTest, FileSizeSignalIsOutputTruncated) {
    EXPECT_EQ(classify(signaled("SIGXFSZ"), 1024).status, status(outcome::output_truncated{}));
}

TEST(ClassifierTest, OtherSignalsAreRuntimeErrors) {
    EXPECT_EQ(classify(signaled("SIGSEGV", execution_state::COMPLETED), 1024).status, status(outcome::runtime_error{}));
}

TEST(ClassifierTest, SpawnFailureIsInternalError) {
    execution_outcome outcome;
    outcome.state = execution_state::SPAWN_FAILED;
    outcome.diagnostic = "unable to start /nonexistent";
    result res = classify(outcome, 1024);
    EXPECT_EQ(res.status, status(outcome::internal_error{}));
    EXPECT_TRUE(res.stderr_output.empty());
}

TEST(ClassifierTest, MissingExitStatusIsInternalError) {
    execution_outcome outcome;
    outcome.state = execution_state::COMPLETED;
    EXPECT_EQ(classify(outcome, 1024).status, status(outcome::internal_error{}));
}

TEST(ClassifierTest, RejectedVerdictIsResourceDenied) {
    validation_verdict verdict;
    verdict.allowed = false;
    verdict.violations.push_back({1, 1, "os", "import of denylisted module 'os'", violation_kind::IMPORT});
    verdict.violations.push_back({2, 1, "eval", "call to denylisted builtin 'eval()'", violation_kind::BUILTIN});
    EXPECT_EQ(classify(verdict).status, status(outcome::resource_denied{"os"}));
}

TEST(ClassifierTest, ValidatorFailureIsInternalError) {
    validation_verdict verdict;
    verdict.allowed = false;
    verdict.violations.push_back({0, 0, rules::INTERNAL_ERROR, "unable to analyze source code", violation_kind::INTERNAL});
    EXPECT_EQ(classify(verdict).status, status(outcome::internal_error{}));
}

TEST(ClassifierTest, TruncatedOutputGetsMarker) {
    execution_outcome outcome = completed(0, string(100, 'a'));
    outcome.truncated_output = true;
    outcome.stdout_truncated = true;
    result res = classify(outcome, 100);
    EXPECT_EQ(res.status, status(outcome::success{}));
    EXPECT_TRUE(res.truncated);
    EXPECT_LE(res.stdout_output.size(), 100);
    EXPECT_EQ(res.stdout_output.substr(res.stdout_output.size() - strlen(TRUNCATION_MARKER)), TRUNCATION_MARKER);
}

TEST(ClassifierTest, MarkerOnlyOnTruncatedStream) {
    // stdout 恰好写满上限但没有丢弃字节，只有 stderr 被截断
    execution_outcome outcome = completed(0, string(100, 'a'));
    outcome.stderr_output = string(100, 'b');
    outcome.truncated_output = true;
    outcome.stderr_truncated = true;
    result res = classify(outcome, 100);
    EXPECT_TRUE(res.truncated);
    EXPECT_EQ(res.stdout_output, string(100, 'a'));
    EXPECT_LE(res.stderr_output.size(), 100);
    EXPECT_EQ(res.stderr_output.substr(res.stderr_output.size() - strlen(TRUNCATION_MARKER)), TRUNCATION_MARKER);
}

TEST(ClassifierTest, DisplayStringIsValidUtf8) {
    string display = make_display_string("ok \xff\xfe done", 1024, false);
    EXPECT_TRUE(utf8_check_is_valid(display));
    EXPECT_EQ(display, "ok \xef\xbf\xbd\xef\xbf\xbd done");

    // 截断不会落在多字节字符中间
    string chinese;
    for (int i = 0; i < 40; ++i) chinese += "\xe4\xb8\xad";
    display = make_display_string(chinese, 50, true);
    EXPECT_LE(display.size(), 50);
    EXPECT_TRUE(utf8_check_is_valid(display));
}

TEST(ClassifierTest, DetectsMemoryErrorLine) {
    EXPECT_TRUE(ends_with_memory_error("Traceback\nMemoryError\n"));
    EXPECT_TRUE(ends_with_memory_error("Traceback\nMemoryError: cannot allocate\n\n"));
    EXPECT_FALSE(ends_with_memory_error("MemoryError\nValueError: x\n"));
    EXPECT_FALSE(ends_with_memory_error(""));
}
