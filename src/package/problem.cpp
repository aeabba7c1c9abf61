#include "verifier/package/problem.hpp"
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>
#include <numeric>
#include <regex>
#include "verifier/common/exceptions.hpp"
#include "verifier/common/io_utils.hpp"
#include "verifier/config.hpp"

namespace verifier {
using namespace std;
namespace fs = std::filesystem;

template <typename T>
static T get_value(const YAML::Node &node, const string &section, const string &key) {
    try {
        const YAML::Node &value = node[key];
        if (!value)
            throw package_error("config.yaml: missing " + section + "." + key);
        return value.as<T>();
    } catch (YAML::Exception &e) {
        throw package_error("config.yaml: unexpected value type of " + section + "." + key + ": " + e.what());
    }
}

template <typename T>
static T get_value_def(const YAML::Node &node, const T &def_value, const string &section, const string &key) {
    if (!node.IsMap() || !node[key]) return def_value;
    return get_value<T>(node, section, key);
}

static fs::path resolve_source(const fs::path &root, const string &folder, const string &name) {
    fs::path path;
    try {
        path = root / folder / assert_safe_path(name);
    } catch (invalid_argument &e) {
        throw package_error(e.what());
    }
    if (!fs::is_regular_file(path))
        throw package_error("File not found: " + fs::absolute(path).string());
    return path;
}

problem_package problem_package::load(const fs::path &dir) {
    problem_package pkg;

    if (!fs::is_directory(dir))
        throw package_error("Problem dir does not exist: '" + dir.string() + "'");
    pkg.root = dir;

    pkg.config_path = dir / "config.yaml";
    if (!fs::is_regular_file(pkg.config_path))
        throw package_error("Config file not found: " + fs::absolute(pkg.config_path).string());

    YAML::Node config;
    try {
        config = YAML::LoadFile(pkg.config_path.string());
    } catch (YAML::Exception &e) {
        throw package_error(string("Could not load config file ") + e.what());
    }

    pkg.tests_dir = dir / "tests";
    if (!fs::is_directory(pkg.tests_dir))
        throw package_error("Test directory not found. Please rename test dir to 'tests'");

    pkg.submissions_dir = dir / "submissions";
    if (!fs::is_directory(pkg.submissions_dir))
        throw package_error("Submission dir not found. Please name it 'submissions'");

    YAML::Node problem = config["problem"];
    if (!problem || !problem.IsMap())
        throw package_error("config.yaml: missing problem section");

    pkg.total_score = get_value<int>(problem, "problem", "score");
    pkg.input_suffix = get_value_def<string>(problem, DEFAULT_INPUT_SUFFIX, "problem", "input_suffix");
    pkg.output_suffix = get_value_def<string>(problem, DEFAULT_OUTPUT_SUFFIX, "problem", "output_suffix");

    if (problem["checker"])
        pkg.checker_source = resolve_source(dir, "output_checker", get_value<string>(problem, "problem", "checker"));
    if (problem["input_validator"])
        pkg.validator_source = resolve_source(dir, "input_validator", get_value<string>(problem, "problem", "input_validator"));

    YAML::Node limits = config["limits"];
    if (!limits || !limits.IsMap())
        throw package_error("config.yaml: missing limits section");
    pkg.time_limit = get_value<double>(limits, "limits", "time_secs");
    if (pkg.time_limit <= 0)
        throw package_error("config.yaml: limits.time_secs must be positive");

    YAML::Node subtasks = config["subtasks"];
    if (!subtasks || !subtasks.IsSequence())
        throw package_error("config.yaml: missing subtasks");
    for (const auto &node : subtasks) {
        int id = get_value<int>(node, "subtasks[]", "id");
        string regex = get_value<string>(node, "subtasks[]", "regex");
        int score = get_value<int>(node, "subtasks[]", "score");
        if (score < 0)
            throw package_error("config.yaml: subtask " + to_string(id) + " has negative score");
        try {
            pkg.subtasks.push_back(discover_subtask(pkg.tests_dir, id, regex, score,
                                                    pkg.input_suffix, pkg.output_suffix, pkg.warnings));
        } catch (regex_error &e) {
            throw package_error("config.yaml: invalid regex '" + regex + "' of subtask " + to_string(id) + ": " + e.what());
        }
    }

    if (YAML::Node solutions = config["solutions"]; solutions && solutions.IsSequence()) {
        for (const auto &node : solutions) {
            solution_config solution;
            solution.name = get_value<string>(node, "solutions[]", "name");
            try {
                assert_safe_path(solution.name);
            } catch (invalid_argument &e) {
                throw package_error(e.what());
            }
            if (fs::path(solution.name).stem().empty())
                throw package_error("config.yaml: invalid solution name '" + solution.name + "'");
            solution.min_score = get_value<double>(node, "solutions[]", "min_score");
            solution.max_score = get_value<double>(node, "solutions[]", "max_score");
            pkg.solutions.push_back(solution);
        }
    }

    LOG(INFO) << "Loaded problem package " << fs::absolute(dir) << " with " << pkg.subtasks.size()
              << " subtasks and " << pkg.solutions.size() << " solutions";
    return pkg;
}

int problem_package::subtask_score_sum() const {
    return accumulate(subtasks.begin(), subtasks.end(), 0,
                      [](int sum, const subtask &s) { return sum + s.score; });
}

bool problem_package::is_full_score(const solution_config &solution) const {
    return solution.min_score > total_score - EPS;
}

}  // namespace verifier
