#include "verifier/judge/process_runner.hpp"
#include <glog/logging.h>
#include "verifier/common/exceptions.hpp"
#include "verifier/common/utils.hpp"
#include "verifier/judge/verdict.hpp"

namespace verifier {
using namespace std;
namespace fs = std::filesystem;

run_result run_program(const fs::path &executable,
                       const fs::path &input_file,
                       const fs::path &output_file,
                       double time_limit) {
    if (!fs::is_regular_file(input_file))
        throw internal_error("input file not found: " + input_file.string());

    process_options opt;
    opt.stdin_file = input_file;
    opt.stdout_file = output_file;
    opt.stderr_file = "/dev/null";
    opt.time_limit = time_limit;

    // execvp 只在路径不含 '/' 时查找 PATH，这里总是运行指定路径的程序
    fs::path run_path = executable.has_parent_path() ? executable : fs::path(".") / executable;
    process_status status = call_process_opt(opt, run_path);

    run_result result;
    result.wall_time = status.wall_time;
    result.exitcode = status.exitcode;
    result.signal = status.signal;

    if (status.timed_out) {
        result.outcome = run_outcome::TIMED_OUT;
        result.cpu_time = TIME_NOT_MEASURED;
    } else if (!status.succeeded()) {
        result.outcome = run_outcome::RUNTIME_FAILURE;
        result.cpu_time = status.cpu_time;
    } else {
        result.outcome = run_outcome::COMPLETED;
        result.cpu_time = status.cpu_time;
    }

    DLOG(INFO) << "Ran " << executable << " on " << input_file.filename()
               << ": exitcode " << result.exitcode << ", signal " << result.signal
               << ", cpu " << result.cpu_time << "s, wall " << result.wall_time << "s";
    return result;
}

}  // namespace verifier
