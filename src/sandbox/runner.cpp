#include "sandbox/runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "sandbox/classifier.hpp"

namespace sandbox {
using namespace std;

runner::runner(const sandbox_config &config)
    : config(config), code_validator(rule_set::from_config(config)), limiter(config), code_executor(config) {}

validation_verdict runner::check(const string &source_code) const {
    return code_validator.validate(source_code);
}

limit_spec runner::effective_limits(const submission_request &request) const {
    return limiter.build_limits(request);
}

const sandbox_config &runner::get_config() const {
    return config;
}

result runner::run(const submission_request &request) const {
    validation_verdict verdict = check(request.source_code);
    if (!verdict.allowed) {
        const violation &first = verdict.violations.front();
        LOG(INFO) << fmt::format("submission rejected: {} at {}:{} ({} violations)",
                                 first.rule_id, first.line, first.column, verdict.violations.size());
        return classify(verdict);
    }
    return execute(request);
}

result runner::execute(const submission_request &request) const {
    try {
        limit_spec limits = limiter.build_limits(request);
        execution_outcome outcome = code_executor.execute(request.source_code, request.stdin_data, limits);
        result res = classify(outcome, limits.max_output_bytes);
        LOG(INFO) << fmt::format("submission finished: {} in {}ms (pid {}, {})",
                                 get_status_name(res.status), res.execution_time_ms, outcome.pid, get_state_name(outcome.state));
        return res;
    } catch (const sandbox_exception &ex) {
        LOG(ERROR) << "sandbox error while executing submission: " << ex;
    } catch (const std::exception &ex) {
        LOG(ERROR) << "error while executing submission: " << boost::diagnostic_information(ex);
    }

    result res;
    res.status = outcome::internal_error{};
    return res;
}

}  // namespace sandbox
