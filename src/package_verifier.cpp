#include "verifier/package_verifier.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <ctime>
#include <memory>
#include <set>
#include "verifier/common/exceptions.hpp"
#include "verifier/compiler.hpp"
#include "verifier/config.hpp"
#include "verifier/judge/input_validator.hpp"
#include "verifier/judge/judger.hpp"
#include "verifier/report/report.hpp"

namespace verifier {
using namespace std;
namespace fs = std::filesystem;

package_verifier::package_verifier(const problem_package &package, verification_reporter &reporter)
    : package(package), reporter(reporter) {}

void package_verifier::verify_package() {
    reporter.success(fmt::format("Problem dir found at {}", fs::absolute(package.root).string()));

    vector<int> scores;
    for (auto &sub : package.subtasks) scores.push_back(sub.score);
    reporter.success(fmt::format("{} subtasks, scores = [{}]", package.subtasks.size(), fmt::join(scores, ", ")));
    reporter.success("Submission dir found.");

    for (auto &warning : package.warnings)
        reporter.failed(warning.message);
}

optional<fs::path> package_verifier::compile_script(const fs::path &source, const char *name) {
    fs::path exec = TMP_DIR / name;
    try {
        compile_source(source, exec);
        return exec;
    } catch (compilation_error &e) {
        reporter.failed(fmt::format("ERROR: Compile error for {}", fs::absolute(source).string()));
        reporter.message("------");
        reporter.message("Compile output:");
        reporter.message(e.error_log);
        return nullopt;
    }
}

void package_verifier::verify_subtasks() {
    int sum = package.subtask_score_sum();
    if (sum != package.total_score)
        reporter.failed(fmt::format("Total score of all subtask = {}, NOT matching problem config's total score = {}",
                                    sum, package.total_score));
    else
        reporter.success(fmt::format("Total score of all subtasks = {}", sum));

    optional<fs::path> validator;
    if (package.validator_source.empty()) {
        reporter.success("No input validator configured. Skipping input validation");
    } else if ((validator = compile_script(package.validator_source, "input_validator"))) {
        reporter.success(fmt::format("Input validator found at {}", fs::absolute(package.validator_source).string()));
    }

    for (auto &sub : package.subtasks) {
        if (sub.tests.empty())
            reporter.failed(fmt::format("Subtask {} has 0 tests", sub.id));
        else
            reporter.success(fmt::format("Subtask {} has {} tests", sub.id, sub.tests.size()));

        // 不对样例数据做输入校验
        if (sub.is_sample() || !validator || sub.tests.empty()) continue;

        subtask_validation result = validate_subtask(*validator, sub, TMP_DIR, SCRIPT_TIME_LIMIT);
        for (auto &failure : result.failures) {
            reporter.failed(fmt::format("Test {} failed input_validator", fs::absolute(failure.input_path).string()));
            reporter.message(failure.message);
        }
        if (result.passed())
            reporter.success(fmt::format("Subtask {} passed input validator.", sub.id));
    }
}

void package_verifier::report_extra_submissions() {
    set<string> configured;
    for (auto &solution : package.solutions) configured.insert(solution.name);

    set<string> extra;
    for (auto &entry : fs::directory_iterator(package.submissions_dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".cpp") continue;
        string name = entry.path().filename().string();
        if (!configured.count(name)) extra.insert(name);
    }

    if (!extra.empty())
        reporter.failed(fmt::format("Found extra submissions (NOT in config.yaml): {{{}}}", boost::algorithm::join(extra, ", ")));
}

static judge_options make_judge_options(const problem_package &package, const string &label, verification_reporter &reporter) {
    judge_options options;
    options.time_limit = package.time_limit;
    options.work_dir = TMP_DIR;
    options.keep_outputs = KEEP_OUTPUTS || DEBUG;
    options.label = label;
    options.on_subtask_finished = [&reporter](const subtask_verdict &result) {
        reporter.message(fmt::format("- Subtask {}, verdict = {}", result.subtask_id, format_subtask_summary(result)));
    };
    return options;
}

void package_verifier::verify_submissions() {
    report_extra_submissions();

    if (package.solutions.empty()) {
        reporter.failed("No solutions found");
        return;
    }

    unique_ptr<output_verifier> comparer;
    if (!package.checker_source.empty()) {
        optional<fs::path> checker = compile_script(package.checker_source, "checker");
        if (!checker) {
            reporter.failed("Output checker could not be compiled. Skipping submissions");
            return;
        }
        comparer = make_unique<checker_verifier>(*checker, SCRIPT_TIME_LIMIT);
        reporter.success(fmt::format("Found and compiled checker {}", package.checker_source.filename().string()));
    } else {
        comparer = make_unique<whitespace_verifier>();
        reporter.success("No checker required. Using default whitespace-insensitive comparison");
    }

    judge_log log(LOG_DIR, time(nullptr));
    last_log = log.text_path();

    for (auto &solution : package.solutions) {
        reporter.message(fmt::format("Running {}", solution.name));
        fs::path source = package.submissions_dir / solution.name;
        string label = fs::path(solution.name).stem().string();
        fs::path exec = TMP_DIR / "bin" / label;

        try {
            compile_source(source, exec);
        } catch (compilation_error &e) {
            reporter.failed(fmt::format("ERROR: Compile error for {}", fs::absolute(source).string()));
            reporter.message("------");
            reporter.message("Compile output:");
            reporter.message(e.error_log);
            log.record_compilation_error(solution, e.error_log);
            continue;
        }

        problem_verdict result;
        try {
            result = judge_executable(exec, package.subtasks, make_judge_options(package, label, reporter), *comparer);
        } catch (checker_error &e) {
            // checker 本身有问题时，其余提交的评测结果也没有意义
            LOG(ERROR) << "Checker failed while judging " << solution.name << ": " << e;
            reporter.failed(fmt::format("Checker failed while judging {}: {}. Skipping remaining submissions", solution.name, e.what()));
            log.record_error(solution, e.what());
            break;
        } catch (internal_error &e) {
            LOG(ERROR) << "Unable to judge " << solution.name << ": " << e;
            reporter.failed(fmt::format("Unable to judge {}: {}", solution.name, e.what()));
            log.record_error(solution, e.what());
            continue;
        }

        double score = result.total_score;
        bool in_range = score_in_range(score, solution.min_score, solution.max_score);
        if (score < solution.min_score - EPS)
            reporter.failed(fmt::format("{} received {:.1f}, min_score = {:.1f}", solution.name, score, solution.min_score));
        else if (score > solution.max_score + EPS)
            reporter.failed(fmt::format("{} received {:.1f}, max_score = {:.1f}", solution.name, score, solution.max_score));
        else
            reporter.success(fmt::format("{} received {:.1f}, in range [{:.1f}, {:.1f}]", solution.name, score, solution.min_score, solution.max_score));

        log.record(solution, result, in_range);
    }

    auto full_score_solutions = count_if(package.solutions.begin(), package.solutions.end(),
                                         [this](const solution_config &s) { return package.is_full_score(s); });
    if (full_score_solutions <= 1)
        reporter.failed("Only 0 or 1 AC solution");

    log.save();
    reporter.success(fmt::format("Printed judge log to {}", log.text_path().string()));
}

}  // namespace verifier
