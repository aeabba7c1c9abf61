#include "verifier/judge/judger.hpp"
#include <glog/logging.h>
#include <stdexcept>

namespace verifier {
using namespace std;
namespace fs = std::filesystem;

verdict decide_verdict(const run_result &result, const function<bool()> &check) {
    switch (result.outcome) {
        case run_outcome::TIMED_OUT:
            return verdict::TIME_LIMIT_EXCEEDED;
        case run_outcome::RUNTIME_FAILURE:
            return verdict::RUNTIME_ERROR;
        case run_outcome::COMPLETED:
            // AC 还是 WA？
            return check() ? verdict::ACCEPTED : verdict::WRONG_ANSWER;
    }
    throw logic_error("unknown run outcome");
}

static fs::path output_path_of(const judge_options &options, const test_case &test) {
    if (!options.keep_outputs)
        return options.work_dir / "out";

    // 不同文件夹下可能有同名的测试点
    fs::path dir = options.work_dir / "outputs" / options.label / to_string(test.subtask_id);
    if (!test.relative_dir.empty()) dir /= test.relative_dir;
    fs::create_directories(dir);
    return dir / (test.name + ".out");
}

static test_verdict judge_test(const fs::path &executable,
                               const test_case &test,
                               const judge_options &options,
                               const output_verifier &verifier) {
    fs::path output_path = output_path_of(options, test);
    run_result result = run_program(executable, test.input_path, output_path, options.time_limit);

    test_verdict verdict_of_test;
    verdict_of_test.status = decide_verdict(result, [&] { return verifier.verify(test, output_path); });
    verdict_of_test.cpu_time = result.cpu_time;
    verdict_of_test.wall_time = result.wall_time;
    verdict_of_test.input_name = test.input_path.filename().string();
    return verdict_of_test;
}

problem_verdict judge_executable(const fs::path &executable,
                                 const vector<subtask> &subtasks,
                                 const judge_options &options,
                                 const output_verifier &verifier) {
    fs::create_directories(options.work_dir);

    problem_verdict result;
    for (auto &sub : subtasks) {
        // 没有测试点的子任务已经在检查题目包时报告，这里直接跳过
        if (sub.tests.empty()) continue;

        LOG(INFO) << "Running " << options.label << " on subtask " << sub.id << " (" << sub.tests.size() << " tests)";

        subtask_verdict sub_verdict(sub.id, sub.score);
        for (auto &test : sub.tests) {
            test_verdict t = judge_test(executable, test, options, verifier);
            DLOG(INFO) << "Test [" << options.label << "-" << sub.id << "-" << test.name
                       << "], verdict: " << get_display_message(t.status)
                       << ", cpu time: " << t.cpu_time << ", wall time: " << t.wall_time;
            sub_verdict.add_test_verdict(t);
        }
        sub_verdict.compute_score();

        if (options.on_subtask_finished) options.on_subtask_finished(sub_verdict);
        result.add_subtask_verdict(sub_verdict);
    }
    return result;
}

}  // namespace verifier
