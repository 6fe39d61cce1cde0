#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <cstring>

namespace sandbox {
using namespace std;

sandbox_exception::sandbox_exception()
    : sandbox_exception("") {}

sandbox_exception::sandbox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *sandbox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : sandbox_exception() {}

internal_error::internal_error(const string &message)
    : sandbox_exception(message) {}

spawn_error::spawn_error(int err, const string &message)
    : internal_error(err ? message + ": " + strerror(err) : message), err(err) {}

int spawn_error::error_code() const noexcept {
    return err;
}

}  // namespace sandbox
