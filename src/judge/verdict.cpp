#include "verifier/judge/verdict.hpp"
#include <boost/assign.hpp>
#include <algorithm>
#include <unordered_map>
#include "verifier/config.hpp"

namespace verifier {
using namespace std;

// clang-format off
static const unordered_map<verdict, const char *> verdict_string = boost::assign::map_list_of
    (verdict::ACCEPTED, "Accepted")
    (verdict::WRONG_ANSWER, "Wrong Answer")
    (verdict::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (verdict::RUNTIME_ERROR, "Runtime Error");

static const unordered_map<verdict, const char *> verdict_short_name = boost::assign::map_list_of
    (verdict::ACCEPTED, "AC")
    (verdict::WRONG_ANSWER, "WA")
    (verdict::TIME_LIMIT_EXCEEDED, "TL")
    (verdict::RUNTIME_ERROR, "RE");
// clang-format on

const char *get_display_message(verdict stat) {
    return verdict_string.at(stat);
}

const char *get_short_name(verdict stat) {
    return verdict_short_name.at(stat);
}

subtask_verdict::subtask_verdict(int subtask_id, int full_score)
    : subtask_id(subtask_id), full_score(full_score), score(0) {}

void subtask_verdict::add_test_verdict(const test_verdict &result) {
    test_verdicts.push_back(result);
}

size_t subtask_verdict::accepted_count() const {
    return count_if(test_verdicts.begin(), test_verdicts.end(),
                    [](const test_verdict &t) { return t.accepted(); });
}

double subtask_verdict::compute_score() {
    if (test_verdicts.empty())
        score = 0;
    else
        score = accepted_count() * 1.0 / test_verdicts.size() * full_score;
    return score;
}

set<verdict> subtask_verdict::rejected_verdicts() const {
    set<verdict> rejected;
    for (auto &t : test_verdicts)
        if (!t.accepted()) rejected.insert(t.status);
    return rejected;
}

void problem_verdict::add_subtask_verdict(const subtask_verdict &result) {
    verdicts.push_back(result);
    total_score += result.score;
}

bool score_in_range(double score, double min_score, double max_score) {
    return score >= min_score - EPS && score <= max_score + EPS;
}

}  // namespace verifier
