#include "sandbox/grader.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <sstream>
#include "sandbox/classifier.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, test_case &tc) {
    tc.name = j.value("name", "Test");
    tc.input = j.value("input", "");
    tc.expected_output = j.value("expected_output", "");
    tc.hidden = j.value("hidden", false);
}

void to_json(json &j, const test_case_result &res) {
    j = json{{"name", res.name},
             {"passed", res.passed},
             {"hidden", res.hidden},
             {"status", get_status_name(res.result.status)},
             {"execution_time_ms", res.result.execution_time_ms}};
    if (!res.hidden) {
        j["input"] = res.input;
        j["expected_output"] = res.expected_output;
        j["actual_output"] = res.result.stdout_output;
        if (!res.result.stderr_output.empty())
            j["error"] = res.result.stderr_output;
    }
    if (auto denied = get_if<outcome::resource_denied>(&res.result.status))
        j["rule_id"] = denied->rule_id;
}

void to_json(json &j, const grading_report &report) {
    j = json{{"results", report.results},
             {"passed_count", report.passed_count},
             {"total_count", report.total_count},
             {"score", report.score},
             {"execution_time_ms", report.execution_time_ms}};
}

string normalize_output(const string &output) {
    string text = boost::algorithm::replace_all_copy(output, "\r\n", "\n");
    stringstream ss(text);
    vector<string> lines;
    string line;
    while (getline(ss, line))
        lines.push_back(boost::algorithm::trim_right_copy(line));
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();

    string normalized;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) normalized += '\n';
        normalized += lines[i];
    }
    return normalized;
}

bool outputs_match(const string &expected, const string &actual) {
    return normalize_output(expected) == normalize_output(actual);
}

grader::grader(const runner &pipeline) : pipeline(pipeline) {}

grading_report grader::grade(const submission_request &request, const vector<test_case> &test_cases) const {
    grading_report report;
    report.total_count = test_cases.size();

    validation_verdict verdict = pipeline.check(request.source_code);
    result rejected;
    if (!verdict.allowed) {
        rejected = classify(verdict);
        LOG(INFO) << "submission rejected before grading: " << get_display_message(rejected.status);
    }

    for (auto &tc : test_cases) {
        test_case_result tcr;
        tcr.name = tc.name;
        tcr.hidden = tc.hidden;
        tcr.input = tc.input;
        tcr.expected_output = tc.expected_output;

        if (!verdict.allowed) {
            tcr.result = rejected;
        } else {
            submission_request single = request;
            single.stdin_data = tc.input;
            tcr.result = pipeline.execute(single);
            tcr.passed = holds_alternative<outcome::success>(tcr.result.status) &&
                         !tcr.result.truncated &&
                         outputs_match(tc.expected_output, tcr.result.stdout_output);
        }

        report.execution_time_ms += tcr.result.execution_time_ms;
        if (tcr.passed) ++report.passed_count;
        report.results.push_back(move(tcr));
    }

    report.score = report.total_count > 0 ? 100.0 * report.passed_count / report.total_count : 0;
    LOG(INFO) << "graded submission: " << report.passed_count << "/" << report.total_count << " passed";
    return report;
}

}  // namespace sandbox
