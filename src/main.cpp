#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fmt/core.h>
#include <filesystem>
#include <iostream>
#include "verifier/common/exceptions.hpp"
#include "verifier/common/utils.hpp"
#include "verifier/config.hpp"
#include "verifier/package/problem.hpp"
#include "verifier/package_verifier.hpp"
#include "verifier/report/status.hpp"
using namespace std;

// 所有检查都通过时返回 0，有检查失败时返回 1
static const int EXIT_CHECK_FAILED = 1;
// 题目包无法加载或者命令行参数错误
static const int EXIT_FATAL = 2;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("problem-verifier options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("dir", po::value<string>(), "the problem package directory to verify")
        ("tmp-dir", po::value<string>(), "set the directory to store compiled programs and outputs, default to ./tmp. You can either pass it from environ VERIFIER_TMPDIR")
        ("log-dir", po::value<string>(), "set the directory to store judge logs, default to ./logs. You can either pass it from environ VERIFIER_LOGDIR")
        ("compile-command", po::value<string>(), "set the compile command, {source} and {exec} will be replaced with the source file and the executable. You can either pass it from environ VERIFIER_COMPILE")
        ("script-time-limit", po::value<double>(), "set time limit in seconds for checkers and input validators, 0 for unlimited, default to 10(10 second). You can either pass it from environ SCRIPTTIMELIMIT")
        ("keep-outputs", "keep the output of every test in <tmp-dir>/outputs")
        ("skip-subtasks", "do not verify subtasks and input data")
        ("skip-submissions", "do not judge submissions")
        ("debug", "turn on the debug mode to print the commands executed and keep outputs of every test.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("dir", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FATAL;
    }

    if (vm.count("help")) {
        cout << "problem-verifier: Verify a problem package before publishing" << endl
             << "Compiles the solutions listed in config.yaml, judges them on all tests and" << endl
             << "checks that every solution receives a score in its declared range." << endl
             << "Usage: " << argv[0] << " [options] <dir>" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "problem-verifier 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("dir")) {
        cerr << "Problem directory is required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FATAL;
    }

    if (vm.count("debug")) {
        verifier::DEBUG = true;
    } else if (getenv("DEBUG")) {
        verifier::DEBUG = true;
    }

    if (vm.count("tmp-dir")) {
        verifier::TMP_DIR = filesystem::path(vm.at("tmp-dir").as<string>());
    } else if (getenv("VERIFIER_TMPDIR")) {
        verifier::TMP_DIR = filesystem::path(getenv("VERIFIER_TMPDIR"));
    }

    if (vm.count("log-dir")) {
        verifier::LOG_DIR = filesystem::path(vm.at("log-dir").as<string>());
    } else if (getenv("VERIFIER_LOGDIR")) {
        verifier::LOG_DIR = filesystem::path(getenv("VERIFIER_LOGDIR"));
    }

    if (vm.count("compile-command")) {
        verifier::COMPILE_COMMAND = vm.at("compile-command").as<string>();
    } else if (getenv("VERIFIER_COMPILE")) {
        verifier::COMPILE_COMMAND = getenv("VERIFIER_COMPILE");
    }

    try {
        if (vm.count("script-time-limit")) {
            verifier::SCRIPT_TIME_LIMIT = vm["script-time-limit"].as<double>();
        } else if (getenv("SCRIPTTIMELIMIT")) {
            verifier::SCRIPT_TIME_LIMIT = boost::lexical_cast<double>(getenv("SCRIPTTIMELIMIT"));
        }
    } catch (boost::bad_lexical_cast&) {
        cerr << "Invalid SCRIPTTIMELIMIT: " << verifier::get_env("SCRIPTTIMELIMIT", "") << endl;
        return EXIT_FATAL;
    }
    if (verifier::SCRIPT_TIME_LIMIT < 0) {
        cerr << "Script time limit should not be negative" << endl;
        return EXIT_FATAL;
    }

    if (vm.count("keep-outputs"))
        verifier::KEEP_OUTPUTS = true;

    LOG(INFO) << "Temporary directory: " << verifier::TMP_DIR << ", log directory: " << verifier::LOG_DIR;

    verifier::verification_reporter reporter;
    try {
        verifier::problem_package package = verifier::problem_package::load(vm.at("dir").as<string>());
        verifier::package_verifier checker(package, reporter);

        checker.verify_package();
        if (!vm.count("skip-subtasks"))
            checker.verify_subtasks();
        if (!vm.count("skip-submissions"))
            checker.verify_submissions();
    } catch (verifier::package_error& e) {
        LOG(ERROR) << "Unable to load problem package: " << e;
        reporter.failed(fmt::format("ERROR: {}", e.what()));
        return EXIT_FATAL;
    } catch (std::exception& e) {
        LOG(ERROR) << "Verification aborted: " << boost::diagnostic_information(e);
        reporter.failed(fmt::format("ERROR: {}", e.what()));
        return EXIT_FATAL;
    }

    const verifier::verification_summary& summary = reporter.summary();
    LOG(INFO) << summary.passed << " checks passed, " << summary.failed << " checks failed";
    return summary.ok() ? EXIT_SUCCESS : EXIT_CHECK_FAILED;
}
