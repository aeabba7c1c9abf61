#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "verifier/judge/output_verifier.hpp"
#include "verifier/judge/process_runner.hpp"
#include "verifier/judge/verdict.hpp"
#include "verifier/package/subtask.hpp"

namespace verifier {

/**
 * @brief 评测一个程序时使用的参数
 */
struct judge_options {
    /**
     * @brief 每个测试点的时钟时间限制，单位为秒
     */
    double time_limit = 1;

    /**
     * @brief 存放选手输出的文件夹
     */
    std::filesystem::path work_dir;

    /**
     * @brief 是否为每个测试点保留单独的输出文件
     * 为假时所有测试点共用 work_dir/out，每个测试点都会覆盖上一个测试点的输出。
     * 为真时输出保存在 work_dir/outputs/<label>/<subtask id>/<relative dir>/<test name>.out
     */
    bool keep_outputs = false;

    /**
     * @brief 被评测程序的名称，用于日志和保留输出时的文件夹名
     */
    std::string label;

    /**
     * @brief 每个子任务评测完成后的回调，用于打印进度
     */
    std::function<void(const subtask_verdict &)> on_subtask_finished;
};

/**
 * @brief 根据运行结果和比较结果确定测试点的评测结果
 * @param result 选手程序的运行结果
 * @param check 仅在程序正常退出时调用，返回输出是否正确
 */
verdict decide_verdict(const run_result &result, const std::function<bool()> &check);

/**
 * @brief 评测一个编译好的程序
 * 依次运行每个子任务的每个测试点，得到每个测试点的评测结果，并按通过测试点的
 * 比例计算子任务得分。没有测试点的子任务会被跳过（题目包检查时已经报告）。
 * 本函数不保存任何状态，同一个程序评测多次得到的结果相同。
 * @param executable 编译好的可执行文件
 * @param subtasks 题目的子任务
 * @param options 评测参数
 * @param verifier 输出比较方式
 * @return 整道题的评测结果
 * @throw checker_error 若无法调用 checker
 * @throw internal_error 若无法运行程序
 */
problem_verdict judge_executable(const std::filesystem::path &executable,
                                 const std::vector<subtask> &subtasks,
                                 const judge_options &options,
                                 const output_verifier &verifier);

}  // namespace verifier
