#include "sandbox/submission.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, submission_request &request) {
    j.at("source_code").get_to(request.source_code);
    if (j.count("stdin"))
        j.at("stdin").get_to(request.stdin_data);
    if (j.count("timeout_seconds"))
        j.at("timeout_seconds").get_to(request.timeout_seconds);
    if (j.count("memory_limit_bytes"))
        j.at("memory_limit_bytes").get_to(request.memory_limit_bytes);
}

void to_json(json &j, const result &res) {
    j = json{{"status", get_status_name(res.status)},
             {"message", get_display_message(res.status)},
             {"stdout", res.stdout_output},
             {"stderr", res.stderr_output},
             {"execution_time_ms", res.execution_time_ms},
             {"truncated", res.truncated}};
    if (auto denied = get_if<outcome::resource_denied>(&res.status))
        j["rule_id"] = denied->rule_id;
}

}  // namespace sandbox
