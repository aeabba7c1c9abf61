#include "gtest/gtest.h"
#include "verifier/judge/judger.hpp"
#include "verifier/judge/verdict.hpp"

using namespace std;
using namespace verifier;

static test_verdict make_test(verdict status, double cpu_time = 0.1) {
    test_verdict t;
    t.status = status;
    t.cpu_time = cpu_time;
    t.wall_time = cpu_time;
    t.input_name = "test.inp";
    return t;
}

TEST(VerdictTest, PartialScoreTest) {
    subtask_verdict sub(1, 20);
    sub.add_test_verdict(make_test(verdict::ACCEPTED));
    sub.add_test_verdict(make_test(verdict::ACCEPTED));
    sub.add_test_verdict(make_test(verdict::WRONG_ANSWER));
    sub.add_test_verdict(make_test(verdict::ACCEPTED));

    EXPECT_EQ(sub.accepted_count(), 3u);
    EXPECT_DOUBLE_EQ(sub.compute_score(), 15.0);
    EXPECT_DOUBLE_EQ(sub.score, 15.0);
}

TEST(VerdictTest, FullScoreTest) {
    subtask_verdict sub(2, 30);
    for (int i = 0; i < 5; ++i)
        sub.add_test_verdict(make_test(verdict::ACCEPTED));

    EXPECT_DOUBLE_EQ(sub.compute_score(), 30.0);
    EXPECT_TRUE(sub.rejected_verdicts().empty());
}

TEST(VerdictTest, EmptySubtaskScoresZeroTest) {
    subtask_verdict sub(3, 50);
    EXPECT_DOUBLE_EQ(sub.compute_score(), 0.0);
}

TEST(VerdictTest, ScoreBoundsTest) {
    vector<verdict> statuses = {verdict::ACCEPTED, verdict::WRONG_ANSWER, verdict::TIME_LIMIT_EXCEEDED, verdict::RUNTIME_ERROR};
    for (size_t mask = 0; mask < 16; ++mask) {
        subtask_verdict sub(1, 7);
        for (size_t i = 0; i < statuses.size(); ++i)
            sub.add_test_verdict(make_test((mask >> i) & 1 ? statuses[i] : verdict::ACCEPTED));
        double score = sub.compute_score();
        EXPECT_LE(sub.accepted_count(), sub.test_verdicts.size());
        EXPECT_GE(score, 0.0);
        EXPECT_LE(score, 7.0);
    }
}

TEST(VerdictTest, RejectedVerdictsTest) {
    subtask_verdict sub(1, 10);
    sub.add_test_verdict(make_test(verdict::TIME_LIMIT_EXCEEDED, TIME_NOT_MEASURED));
    sub.add_test_verdict(make_test(verdict::ACCEPTED));
    sub.add_test_verdict(make_test(verdict::WRONG_ANSWER));
    sub.add_test_verdict(make_test(verdict::WRONG_ANSWER));

    set<verdict> expected = {verdict::WRONG_ANSWER, verdict::TIME_LIMIT_EXCEEDED};
    EXPECT_EQ(sub.rejected_verdicts(), expected);
}

TEST(VerdictTest, TotalScoreIsSumOfSubtasksTest) {
    problem_verdict forward, backward;
    vector<subtask_verdict> subs;
    int points[] = {10, 20, 70};
    for (int i = 0; i < 3; ++i) {
        subtask_verdict sub(i + 1, points[i]);
        sub.add_test_verdict(make_test(verdict::ACCEPTED));
        sub.add_test_verdict(make_test(i == 1 ? verdict::RUNTIME_ERROR : verdict::ACCEPTED));
        sub.add_test_verdict(make_test(verdict::ACCEPTED));
        sub.compute_score();
        subs.push_back(sub);
    }

    for (auto &sub : subs) forward.add_subtask_verdict(sub);
    for (auto it = subs.rbegin(); it != subs.rend(); ++it) backward.add_subtask_verdict(*it);

    double expected = 10 + 20.0 * 2 / 3 + 70;
    EXPECT_NEAR(forward.total_score, expected, 1e-6);
    EXPECT_NEAR(backward.total_score, forward.total_score, 1e-6);
    EXPECT_EQ(forward.verdicts.size(), 3u);
}

TEST(VerdictTest, ScoreInRangeTest) {
    EXPECT_TRUE(score_in_range(100, 100, 100));
    EXPECT_TRUE(score_in_range(100 - 1e-9, 100, 100));
    EXPECT_TRUE(score_in_range(50, 0, 100));
    EXPECT_FALSE(score_in_range(99.9, 100, 100));
    EXPECT_FALSE(score_in_range(30.5, 0, 30));
}

TEST(VerdictTest, DecideVerdictTest) {
    run_result result;
    bool checked = false;
    auto check = [&] { checked = true; return true; };

    result.outcome = run_outcome::TIMED_OUT;
    EXPECT_EQ(decide_verdict(result, check), verdict::TIME_LIMIT_EXCEEDED);
    result.outcome = run_outcome::RUNTIME_FAILURE;
    EXPECT_EQ(decide_verdict(result, check), verdict::RUNTIME_ERROR);
    EXPECT_FALSE(checked) << "output should only be compared after a clean exit";

    result.outcome = run_outcome::COMPLETED;
    EXPECT_EQ(decide_verdict(result, check), verdict::ACCEPTED);
    EXPECT_TRUE(checked);
    EXPECT_EQ(decide_verdict(result, [] { return false; }), verdict::WRONG_ANSWER);
}

TEST(VerdictTest, VerdictNamesTest) {
    EXPECT_STREQ(get_short_name(verdict::ACCEPTED), "AC");
    EXPECT_STREQ(get_short_name(verdict::WRONG_ANSWER), "WA");
    EXPECT_STREQ(get_short_name(verdict::TIME_LIMIT_EXCEEDED), "TL");
    EXPECT_STREQ(get_short_name(verdict::RUNTIME_ERROR), "RE");
    EXPECT_STREQ(get_display_message(verdict::WRONG_ANSWER), "Wrong Answer");
}
