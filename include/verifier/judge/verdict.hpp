#pragma once

#include <set>
#include <string>
#include <vector>

namespace verifier {

/**
 * @brief 表示一个测试点的评测结果
 * 只包含终态。程序正常退出但还未比较输出的状态由 run_outcome::COMPLETED 表示，
 * 不会出现在 verdict 中。
 */
enum class verdict {
    /**
     * @brief 程序正常退出且输出正确
     */
    ACCEPTED = 1,

    /**
     * @brief 程序正常退出但输出错误（checker 返回非 0 或者比较不一致）
     */
    WRONG_ANSWER = 2,

    /**
     * @brief 程序运行时钟时间超出限制，被评测系统杀死
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief 程序返回值非 0 或者被信号杀死
     */
    RUNTIME_ERROR = 4
};

/**
 * @brief 评测结果的完整名称，比如 "Wrong Answer"
 */
const char *get_display_message(verdict);

/**
 * @brief 评测结果的缩写，比如 "WA"
 */
const char *get_short_name(verdict);

/**
 * @brief 表示超时的测试点的 CPU 时间
 * 被杀死的程序的 CPU 时间没有比较意义，因此用一个负数标记
 */
constexpr double TIME_NOT_MEASURED = -1;

/**
 * @brief 一个测试点的评测结果
 */
struct test_verdict {
    verdict status;

    /**
     * @brief 程序运行消耗的 CPU 时间
     * 单位为秒，超时的测试点为 TIME_NOT_MEASURED
     */
    double cpu_time = TIME_NOT_MEASURED;

    /**
     * @brief 程序运行的时钟时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 测试点输入文件名
     */
    std::string input_name;

    bool accepted() const { return status == verdict::ACCEPTED; }

    bool has_cpu_time() const { return cpu_time >= 0; }
};

/**
 * @brief 一个子任务的评测结果
 * 每个被评测的程序对每个有测试点的子任务恰好生成一个 subtask_verdict
 */
struct subtask_verdict {
    subtask_verdict(int subtask_id, int full_score);

    int subtask_id;

    /**
     * @brief 子任务满分
     */
    int full_score;

    /**
     * @brief 按测试点顺序排列的评测结果
     */
    std::vector<test_verdict> test_verdicts;

    /**
     * @brief 子任务得分，由 compute_score 计算
     */
    double score;

    void add_test_verdict(const test_verdict &result);

    /**
     * @brief 通过的测试点数
     */
    std::size_t accepted_count() const;

    /**
     * @brief 按部分分计算子任务得分：通过的测试点比例乘以子任务满分
     * 没有测试点时得分为 0
     * @return 计算得到的分数，同时保存到 score
     */
    double compute_score();

    /**
     * @brief 未通过的测试点的评测结果集合
     */
    std::set<verdict> rejected_verdicts() const;
};

/**
 * @brief 一个程序对整道题的评测结果
 */
struct problem_verdict {
    /**
     * @brief 按子任务顺序排列的评测结果
     */
    std::vector<subtask_verdict> verdicts;

    /**
     * @brief 所有子任务得分之和
     */
    double total_score = 0;

    void add_subtask_verdict(const subtask_verdict &result);
};

/**
 * @brief 判断分数是否在 [min_score, max_score] 内，允许 EPS 的误差
 */
bool score_in_range(double score, double min_score, double max_score);

}  // namespace verifier
