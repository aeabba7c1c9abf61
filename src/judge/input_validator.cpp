#include "verifier/judge/input_validator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "verifier/common/exceptions.hpp"
#include "verifier/common/io_utils.hpp"
#include "verifier/common/utils.hpp"

namespace verifier {
using namespace std;
namespace fs = std::filesystem;

/**
 * @brief 在一个测试点上运行输入校验器
 * @param message 校验失败时保存失败原因
 * @return 输入数据是否通过校验
 */
static bool run_validator(const fs::path &validator, const test_case &test, const fs::path &output, double time_limit, string &message) {
    process_options opt;
    opt.stdin_file = test.input_path;
    opt.stdout_file = output;
    opt.stderr_file = "/dev/null";
    opt.time_limit = time_limit;

    process_status status = call_process_opt(opt, validator, test.subtask_id, fs::absolute(test.input_path));
    if (status.timed_out) {
        message = fmt::format("input validator exceeded time limit {}s", time_limit);
        return false;
    }
    if (status.signal >= 0) {
        message = fmt::format("input validator killed by signal {}", status.signal);
        return false;
    }
    if (status.exitcode != 0) {
        message = fmt::format("input validator returned {}", status.exitcode);
        string stdout_content = read_file_content(output, "");
        if (!stdout_content.empty()) message += "\n" + stdout_content;
        return false;
    }
    return true;
}

subtask_validation validate_subtask(const fs::path &validator,
                                    const subtask &sub,
                                    const fs::path &work_dir,
                                    double time_limit) {
    subtask_validation result;
    result.subtask_id = sub.id;

    // 不对样例数据做输入校验
    if (sub.is_sample()) return result;

    fs::create_directories(work_dir);
    fs::path validator_path = fs::absolute(validator);
    fs::path output = work_dir / "validator.out";

    for (auto &test : sub.tests) {
        if (normalize_line_endings(test.input_path))
            LOG(INFO) << "Converted CRLF line endings of " << test.input_path;

        ++result.checked_tests;
        try {
            string message;
            if (!run_validator(validator_path, test, output, time_limit, message)) {
                LOG(WARNING) << "Test " << test.input_path << " failed input validator: " << message;
                result.failures.push_back({sub.id, test.input_path, message});
            }
        } catch (internal_error &e) {
            LOG(ERROR) << "Unable to run input validator on " << test.input_path << ": " << e.what();
            result.failures.push_back({sub.id, test.input_path, e.what()});
        }
    }
    return result;
}

}  // namespace verifier
