#include "verifier/report/report.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <boost/algorithm/string/join.hpp>
#include "verifier/common/exceptions.hpp"
#include "verifier/common/io_utils.hpp"

namespace verifier {
using namespace std;
namespace fs = std::filesystem;

string format_test_verdict(const test_verdict &result) {
    if (!result.has_cpu_time())
        return fmt::format("{} -----", get_short_name(result.status));
    return fmt::format("{} {:.2f}s", get_short_name(result.status), result.cpu_time);
}

string format_subtask_summary(const subtask_verdict &result) {
    set<verdict> rejected = result.rejected_verdicts();
    string combined;
    if (rejected.empty()) {
        combined = "AC";
    } else {
        vector<string> names;
        for (verdict v : rejected) names.push_back(get_short_name(v));
        combined = "{" + boost::algorithm::join(names, ", ") + "}";
    }
    return fmt::format("{}, score = {:.2f}", combined, result.score);
}

void to_json(nlohmann::json &j, verdict status) {
    j = get_short_name(status);
}

void to_json(nlohmann::json &j, const test_verdict &result) {
    j = {{"input", result.input_name},
         {"verdict", result.status},
         {"message", get_display_message(result.status)},
         {"wall_time", result.wall_time}};
    if (result.has_cpu_time())
        j["cpu_time"] = result.cpu_time;
    else
        j["cpu_time"] = nullptr;
}

void to_json(nlohmann::json &j, const subtask_verdict &result) {
    j = {{"subtask_id", result.subtask_id},
         {"full_score", result.full_score},
         {"score", result.score},
         {"accepted", result.accepted_count()},
         {"total", result.test_verdicts.size()},
         {"tests", result.test_verdicts}};
}

void to_json(nlohmann::json &j, const problem_verdict &result) {
    j = {{"total_score", result.total_score},
         {"subtasks", result.verdicts}};
}

string make_log_name(time_t now) {
    return fmt::format("{:%Y%m%d_%H%M%S}", fmt::localtime(now));
}

judge_log::judge_log(const fs::path &log_dir, time_t now) {
    fs::create_directories(log_dir);
    string time_name = make_log_name(now);
    string name = time_name;
    // 同一秒内多次运行时不覆盖已有的日志
    for (int i = 1; fs::exists(log_dir / (name + ".log")) || fs::exists(log_dir / (name + ".json")); ++i)
        name = fmt::format("{}_{}", time_name, i);
    text_file = log_dir / (name + ".log");
    json_file = log_dir / (name + ".json");

    text.open(text_file);
    if (!text)
        throw internal_error(fmt::format("unable to create judge log {}", text_file.string()));

    report = {{"time", time_name}, {"submissions", nlohmann::json::array()}};
}

static nlohmann::json solution_entry(const solution_config &solution) {
    return {{"name", solution.name},
            {"min_score", solution.min_score},
            {"max_score", solution.max_score}};
}

void judge_log::record(const solution_config &solution, const problem_verdict &result, bool in_range) {
    text << "Judge verdict for " << solution.name << "\n";
    for (auto &sub : result.verdicts) {
        text << "- Subtask " << sub.subtask_id << "\n";
        for (auto &t : sub.test_verdicts)
            text << "    " << format_test_verdict(t) << " " << t.input_name << "\n";
    }
    text.flush();

    nlohmann::json entry = solution_entry(solution);
    entry["score"] = result.total_score;
    entry["in_range"] = in_range;
    entry["verdict"] = result;
    report["submissions"].push_back(entry);
}

void judge_log::record_compilation_error(const solution_config &solution, const string &error_log) {
    text << "Judge verdict for " << solution.name << "\n"
         << "- Compile error\n"
         << error_log << "\n";
    text.flush();

    nlohmann::json entry = solution_entry(solution);
    entry["compile_error"] = error_log;
    report["submissions"].push_back(entry);
}

void judge_log::record_error(const solution_config &solution, const string &message) {
    text << "Judge verdict for " << solution.name << "\n"
         << "- Error: " << message << "\n";
    text.flush();

    nlohmann::json entry = solution_entry(solution);
    entry["error"] = message;
    report["submissions"].push_back(entry);
}

void judge_log::save() const {
    write_file_content(json_file, report.dump(4));
}

}  // namespace verifier
