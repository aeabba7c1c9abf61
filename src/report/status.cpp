#include "verifier/report/status.hpp"
#include <fmt/color.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>

namespace verifier {
using namespace std;

static const char *TICK = "✔";
static const char *CROSS = "✘";

verification_reporter::verification_reporter(FILE *out)
    : out(out), colored(isatty(fileno(out))) {}

void verification_reporter::status(const string &message, bool success) {
    const char *sign = success ? TICK : CROSS;
    if (colored)
        fmt::print(out, "[{}] {}\n", fmt::format(fg(success ? fmt::color::green : fmt::color::red), "{}", sign), message);
    else
        fmt::print(out, "[{}] {}\n", sign, message);
    fflush(out);

    if (success) {
        ++counts.passed;
        LOG(INFO) << "[" << sign << "] " << message;
    } else {
        ++counts.failed;
        LOG(WARNING) << "[" << sign << "] " << message;
    }
}

void verification_reporter::success(const string &message) {
    status(message, true);
}

void verification_reporter::failed(const string &message) {
    status(message, false);
}

void verification_reporter::message(const string &message) {
    fmt::print(out, "{}\n", message);
    fflush(out);
}

}  // namespace verifier
