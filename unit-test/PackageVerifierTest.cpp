#include <stdio.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/package_fixture.hpp"
#include "verifier/common/io_utils.hpp"
#include "verifier/config.hpp"
#include "verifier/package/problem.hpp"
#include "verifier/package_verifier.hpp"

using namespace std;
using namespace std::filesystem;
using namespace verifier;
using ::testing::HasSubstr;
using ::testing::Not;

static const char *CONFIG = R"(problem:
  score: 100
  input_validator: validator.cpp
limits:
  time_secs: 1
subtasks:
  - {id: 0, regex: sample, score: 0}
  - {id: 1, regex: sub1_, score: 30}
  - {id: 2, regex: sub2_, score: 70}
solutions:
  - {name: main.cpp, min_score: 100, max_score: 100}
  - {name: alt.cpp, min_score: 100, max_score: 100}
  - {name: partial.cpp, min_score: 30, max_score: 30}
)";

static const char *CORRECT_SOLUTION = "read n\necho $((n * 2))\n";

// 只能通过子任务 1
static const char *PARTIAL_SOLUTION = "read n\nif [ \"$n\" -ge 10 ]; then echo 0; else echo $((n * 2)); fi\n";

static const char *VALIDATOR = "read n\nif [ \"$n\" -gt 100 ]; then echo \"n is too large\"; exit 1; fi\n";

class PackageVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        setup_test_environment(dir.path());
        root = dir.path() / "problem";
        write_package(root, CONFIG);

        add_test("sample", 1);
        add_test("sub1_1", 2);
        add_test("sub1_2", 3);
        add_test("sub2_1", 10);
        add_test("sub2_2", 20);

        write_script(root / "input_validator" / "validator.cpp", VALIDATOR);
        write_script(root / "submissions" / "main.cpp", CORRECT_SOLUTION);
        write_script(root / "submissions" / "alt.cpp", CORRECT_SOLUTION);
        write_script(root / "submissions" / "partial.cpp", PARTIAL_SOLUTION);

        out = tmpfile();
        ASSERT_NE(out, nullptr);
    }

    void TearDown() override {
        if (out) fclose(out);
    }

    void add_test(const string &name, int n) {
        write_text(root / "tests" / (name + ".inp"), to_string(n) + "\n");
        write_text(root / "tests" / (name + ".out"), to_string(n * 2) + "\n");
    }

    /**
     * 检查整个题目包，返回终端输出
     */
    string verify_all() {
        problem_package pkg = problem_package::load(root);
        verification_reporter reporter(out);
        package_verifier checker(pkg, reporter);
        checker.verify_package();
        checker.verify_subtasks();
        checker.verify_submissions();
        summary = reporter.summary();
        log_path = checker.log_path();
        return read_output();
    }

    string read_output() {
        fflush(out);
        rewind(out);
        string content;
        char buf[512];
        while (fgets(buf, sizeof(buf), out)) content += buf;
        return content;
    }

    temp_dir dir;
    path root;
    FILE *out = nullptr;
    verification_summary summary;
    optional<path> log_path;
};

TEST_F(PackageVerifierTest, ConsistentPackageTest) {
    string output = verify_all();

    EXPECT_TRUE(summary.ok()) << output;
    EXPECT_THAT(output, HasSubstr("[✔] 3 subtasks, scores = [0, 30, 70]\n"));
    EXPECT_THAT(output, HasSubstr("[✔] Total score of all subtasks = 100\n"));
    EXPECT_THAT(output, HasSubstr("[✔] Subtask 1 has 2 tests\n"));
    EXPECT_THAT(output, HasSubstr("[✔] Subtask 1 passed input validator.\n"));
    EXPECT_THAT(output, HasSubstr("[✔] Subtask 2 passed input validator.\n"));
    EXPECT_THAT(output, Not(HasSubstr("Subtask 0 passed input validator")));
    EXPECT_THAT(output, HasSubstr("Running main.cpp\n"));
    EXPECT_THAT(output, HasSubstr("- Subtask 2, verdict = AC, score = 70.00\n"));
    EXPECT_THAT(output, HasSubstr("[✔] main.cpp received 100.0, in range [100.0, 100.0]\n"));
    EXPECT_THAT(output, HasSubstr("- Subtask 2, verdict = {WA}, score = 0.00\n"));
    EXPECT_THAT(output, HasSubstr("[✔] partial.cpp received 30.0, in range [30.0, 30.0]\n"));
    EXPECT_THAT(output, Not(HasSubstr("Only 0 or 1 AC solution")));

    ASSERT_TRUE(log_path.has_value());
    string log = read_file_content(*log_path);
    EXPECT_THAT(log, HasSubstr("Judge verdict for partial.cpp\n- Subtask 0\n"));
    EXPECT_THAT(log, HasSubstr("- Subtask 2\n    WA "));
    path json = *log_path;
    json.replace_extension(".json");
    EXPECT_TRUE(exists(json));
}

TEST_F(PackageVerifierTest, ExtraSubmissionTest) {
    write_script(root / "submissions" / "extra.cpp", CORRECT_SOLUTION);
    write_text(root / "submissions" / "notes.txt", "not a submission\n");

    string output = verify_all();
    EXPECT_EQ(summary.failed, 1u) << output;
    EXPECT_THAT(output, HasSubstr("[✘] Found extra submissions (NOT in config.yaml): {extra.cpp}\n"));
}

TEST_F(PackageVerifierTest, ScoreOutOfRangeTest) {
    write_script(root / "submissions" / "alt.cpp", PARTIAL_SOLUTION);

    string output = verify_all();
    EXPECT_EQ(summary.failed, 1u) << output;
    EXPECT_THAT(output, HasSubstr("[✘] alt.cpp received 30.0, min_score = 100.0\n"));
}

TEST_F(PackageVerifierTest, ScoreAboveRangeTest) {
    write_script(root / "submissions" / "partial.cpp", CORRECT_SOLUTION);

    string output = verify_all();
    EXPECT_THAT(output, HasSubstr("[✘] partial.cpp received 100.0, max_score = 30.0\n"));
}

TEST_F(PackageVerifierTest, SubtaskProblemsTest) {
    write_text(root / "config.yaml", R"(problem:
  score: 100
  input_validator: validator.cpp
limits:
  time_secs: 1
subtasks:
  - {id: 0, regex: sample, score: 0}
  - {id: 1, regex: sub1_, score: 30}
  - {id: 2, regex: sub2_, score: 70}
  - {id: 3, regex: sub3_, score: 10}
solutions:
  - {name: main.cpp, min_score: 100, max_score: 100}
  - {name: alt.cpp, min_score: 100, max_score: 100}
)");
    write_text(root / "tests" / "sub2_3.inp", "1000\n");
    write_text(root / "tests" / "sub2_3.out", "2000\n");
    write_text(root / "tests" / "sub1_9.inp", "5\n");

    string output = verify_all();
    EXPECT_THAT(output, HasSubstr("[✘] Output not found for input sub1_9\n"));
    EXPECT_THAT(output, HasSubstr("[✘] Total score of all subtask = 110, NOT matching problem config's total score = 100\n"));
    EXPECT_THAT(output, HasSubstr("[✘] Subtask 3 has 0 tests\n"));
    EXPECT_THAT(output, HasSubstr("failed input_validator\ninput validator returned 1\nn is too large\n"));
    EXPECT_THAT(output, HasSubstr("[✔] Subtask 1 passed input validator.\n"));
    EXPECT_THAT(output, Not(HasSubstr("Subtask 2 passed input validator")));
    EXPECT_EQ(summary.failed, 4u) << output;
}

TEST_F(PackageVerifierTest, CompilationErrorTest) {
    std::filesystem::remove(root / "submissions" / "alt.cpp");

    string output = verify_all();
    EXPECT_THAT(output, HasSubstr("[✘] ERROR: Compile error for "));
    EXPECT_THAT(output, HasSubstr("[✔] partial.cpp received 30.0"));
    EXPECT_EQ(summary.failed, 1u) << output;
}

TEST_F(PackageVerifierTest, SingleFullScoreSolutionTest) {
    write_text(root / "config.yaml", R"(problem:
  score: 100
limits:
  time_secs: 1
subtasks:
  - {id: 1, regex: sub1_, score: 30}
  - {id: 2, regex: sub2_, score: 70}
solutions:
  - {name: main.cpp, min_score: 100, max_score: 100}
  - {name: partial.cpp, min_score: 30, max_score: 30}
  - {name: alt.cpp, min_score: 0, max_score: 100}
)");

    string output = verify_all();
    EXPECT_THAT(output, HasSubstr("[✔] No input validator configured. Skipping input validation\n"));
    EXPECT_THAT(output, HasSubstr("[✘] Only 0 or 1 AC solution\n"));
    EXPECT_EQ(summary.failed, 1u) << output;
}

TEST_F(PackageVerifierTest, NoSolutionsTest) {
    write_text(root / "config.yaml", R"(problem:
  score: 100
limits:
  time_secs: 1
subtasks:
  - {id: 1, regex: sub1_, score: 100}
)");
    std::filesystem::remove(root / "submissions" / "main.cpp");
    std::filesystem::remove(root / "submissions" / "alt.cpp");
    std::filesystem::remove(root / "submissions" / "partial.cpp");

    string output = verify_all();
    EXPECT_THAT(output, HasSubstr("[✘] No solutions found\n"));
    EXPECT_FALSE(log_path.has_value());
}

TEST_F(PackageVerifierTest, CheckerTest) {
    write_text(root / "config.yaml", R"(problem:
  score: 100
  checker: checker.cpp
limits:
  time_secs: 1
subtasks:
  - {id: 1, regex: sub1_, score: 30}
  - {id: 2, regex: sub2_, score: 70}
solutions:
  - {name: main.cpp, min_score: 100, max_score: 100}
  - {name: alt.cpp, min_score: 100, max_score: 100}
)");
    // 只要输出是偶数就接受
    write_script(root / "output_checker" / "checker.cpp", "read x < \"$2\"\n[ $((x % 2)) -eq 0 ]\n");
    write_script(root / "submissions" / "alt.cpp", "echo 4\n");

    string output = verify_all();
    EXPECT_THAT(output, HasSubstr("[✔] Found and compiled checker checker.cpp\n"));
    EXPECT_THAT(output, HasSubstr("[✔] alt.cpp received 100.0, in range [100.0, 100.0]\n"));
    EXPECT_TRUE(summary.ok()) << output;
}

TEST_F(PackageVerifierTest, CheckerErrorAbortsSubmissionsTest) {
    write_text(root / "config.yaml", R"(problem:
  score: 100
  checker: checker.cpp
limits:
  time_secs: 1
subtasks:
  - {id: 1, regex: sub1_, score: 30}
  - {id: 2, regex: sub2_, score: 70}
solutions:
  - {name: main.cpp, min_score: 100, max_score: 100}
  - {name: alt.cpp, min_score: 100, max_score: 100}
)");
    write_script(root / "output_checker" / "checker.cpp", "kill -9 $$\n");

    string output = verify_all();
    EXPECT_THAT(output, HasSubstr("[✘] Checker failed while judging main.cpp"));
    EXPECT_THAT(output, Not(HasSubstr("Running alt.cpp")));
    EXPECT_FALSE(summary.ok());
}

TEST_F(PackageVerifierTest, DottedSolutionNameTest) {
    write_text(root / "config.yaml", R"(problem:
  score: 100
limits:
  time_secs: 1
subtasks:
  - {id: 1, regex: sub1_, score: 30}
  - {id: 2, regex: sub2_, score: 70}
solutions:
  - {name: .main.cpp, min_score: 100, max_score: 100}
  - {name: out.cpp, min_score: 100, max_score: 100}
  - {name: partial.cpp, min_score: 30, max_score: 30}
)");
    std::filesystem::rename(root / "submissions" / "main.cpp", root / "submissions" / ".main.cpp");
    std::filesystem::rename(root / "submissions" / "alt.cpp", root / "submissions" / "out.cpp");

    string output = verify_all();
    EXPECT_THAT(output, HasSubstr("[✔] .main.cpp received 100.0, in range [100.0, 100.0]\n"));
    EXPECT_THAT(output, HasSubstr("[✔] out.cpp received 100.0, in range [100.0, 100.0]\n"));
    EXPECT_TRUE(summary.ok()) << output;
    EXPECT_TRUE(is_regular_file(TMP_DIR / "bin" / ".main"));
}

TEST_F(PackageVerifierTest, KeepOutputsTest) {
    KEEP_OUTPUTS = true;
    verify_all();
    EXPECT_TRUE(exists(TMP_DIR / "outputs" / "partial" / "2" / "sub2_1.out"));
    EXPECT_EQ(read_file_content(TMP_DIR / "outputs" / "partial" / "2" / "sub2_1.out"), "0\n");
}
