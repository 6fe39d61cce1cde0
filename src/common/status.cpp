#include "common/status.hpp"
#include "common/stl_utils.hpp"

namespace sandbox {
using namespace std;

const char *get_status_name(const status &stat) {
    return visit(overloaded{
                     [](const outcome::success &) { return "Success"; },
                     [](const outcome::runtime_error &) { return "RuntimeError"; },
                     [](const outcome::timeout &) { return "Timeout"; },
                     [](const outcome::memory_exceeded &) { return "MemoryExceeded"; },
                     [](const outcome::resource_denied &) { return "ResourceDenied"; },
                     [](const outcome::output_truncated &) { return "OutputTruncated"; },
                     [](const outcome::internal_error &) { return "InternalError"; },
                 },
                 stat);
}

string get_display_message(const status &stat) {
    return visit(overloaded{
                     [](const outcome::success &) -> string { return "Success"; },
                     [](const outcome::runtime_error &) -> string { return "Runtime Error"; },
                     [](const outcome::timeout &) -> string { return "Time Limit Exceeded"; },
                     [](const outcome::memory_exceeded &) -> string { return "Memory Limit Exceeded"; },
                     [](const outcome::resource_denied &denied) -> string { return "Resource Denied (" + denied.rule_id + ")"; },
                     [](const outcome::output_truncated &) -> string { return "Output Limit Exceeded"; },
                     [](const outcome::internal_error &) -> string { return "Internal Error"; },
                 },
                 stat);
}

}  // namespace sandbox
