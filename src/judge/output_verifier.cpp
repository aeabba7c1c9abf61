#include "verifier/judge/output_verifier.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <vector>
#include "verifier/common/exceptions.hpp"
#include "verifier/common/io_utils.hpp"
#include "verifier/common/utils.hpp"

namespace verifier {
using namespace std;
namespace fs = std::filesystem;

// 预处理文本，去掉每一行中的空白字符以及文末的空行
static vector<string> text_preprocess(const string &s) {
    vector<string> lines;
    boost::split(lines, s, boost::is_any_of("\n"));
    for (auto &line : lines) {
        string stripped;
        remove_copy_if(line.begin(), line.end(), back_inserter(stripped), boost::is_space());
        line = move(stripped);
    }
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
    return lines;
}

bool equal_ignoring_whitespace(const string &expected, const string &actual) {
    return text_preprocess(expected) == text_preprocess(actual);
}

bool whitespace_verifier::verify(const test_case &test, const fs::path &produced_output) const {
    return equal_ignoring_whitespace(read_file_content(test.output_path),
                                     read_file_content(produced_output, ""));
}

checker_verifier::checker_verifier(const fs::path &checker, double time_limit)
    : checker(fs::absolute(checker)), time_limit(time_limit) {}

bool checker_verifier::verify(const test_case &test, const fs::path &produced_output) const {
    if (!is_executable(checker))
        throw checker_error("checker is not executable: " + checker.string());

    process_options opt;
    opt.stdout_file = "/dev/null";
    opt.stderr_file = "/dev/null";
    opt.time_limit = time_limit;

    process_status status;
    try {
        status = call_process_opt(opt, checker,
                                  fs::absolute(test.input_path),
                                  fs::absolute(produced_output),
                                  fs::absolute(test.output_path));
    } catch (internal_error &e) {
        throw checker_error(string("unable to run checker: ") + e.what());
    }

    if (status.timed_out)
        throw checker_error(fmt::format("checker exceeded time limit {}s on test {}", time_limit, test.name));
    if (status.signal >= 0)
        throw checker_error(fmt::format("checker killed by signal {} on test {}", status.signal, test.name));

    DLOG(INFO) << "Checker returned " << status.exitcode << " on test " << test.name;
    return status.exitcode == 0;
}

}  // namespace verifier
