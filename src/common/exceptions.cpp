#include "verifier/common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace verifier {
using namespace std;

verifier_exception::verifier_exception()
    : verifier_exception("") {}

verifier_exception::verifier_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *verifier_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const verifier_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

package_error::package_error()
    : verifier_exception() {}

package_error::package_error(const string &message)
    : verifier_exception(message) {}

internal_error::internal_error()
    : verifier_exception() {}

internal_error::internal_error(const string &message)
    : verifier_exception(message) {}

checker_error::checker_error()
    : internal_error() {}

checker_error::checker_error(const string &message)
    : internal_error(message) {}

compilation_error::compilation_error(const string &what, const string &error_log)
    : runtime_error(what), error_log(error_log) {}

}  // namespace verifier
