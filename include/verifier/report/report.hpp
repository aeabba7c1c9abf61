#pragma once

#include <ctime>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "verifier/judge/verdict.hpp"
#include "verifier/package/problem.hpp"

namespace verifier {

/**
 * @brief 测试点评测结果的文字表示
 * 比如 "AC 0.12s"，超时的测试点没有 CPU 时间，表示为 "TL -----"
 */
std::string format_test_verdict(const test_verdict &result);

/**
 * @brief 子任务评测结果的摘要
 * 全部通过时为 "AC, score = 20.00"，否则列出所有未通过的评测结果，比如
 * "{WA, TL}, score = 15.00"
 */
std::string format_subtask_summary(const subtask_verdict &result);

void to_json(nlohmann::json &j, verdict status);
void to_json(nlohmann::json &j, const test_verdict &result);
void to_json(nlohmann::json &j, const subtask_verdict &result);
void to_json(nlohmann::json &j, const problem_verdict &result);

/**
 * @brief 一次运行的评测日志
 * 文字日志 <log dir>/<yyyymmdd_HHMMSS>.log 在每个提交评测完成后立即写入，
 * JSON 报告 <log dir>/<yyyymmdd_HHMMSS>.json 在 save() 时写入。
 *
 * 文字日志的格式：
 * Judge verdict for main.cpp
 * - Subtask 1
 *     AC 0.12s sub1_1.inp
 *     TL ----- sub1_2.inp
 */
struct judge_log {
    /**
     * @param log_dir 日志文件夹，不存在时会被创建
     * @param now 日志文件名使用的时间，同名日志已存在时文件名加上 _1、_2 等后缀
     * @throw internal_error 若无法创建日志文件
     */
    judge_log(const std::filesystem::path &log_dir, std::time_t now);

    const std::filesystem::path &text_path() const { return text_file; }
    const std::filesystem::path &json_path() const { return json_file; }

    /**
     * @brief 记录一个提交的评测结果
     * @param in_range 得分是否在 [min_score, max_score] 内
     */
    void record(const solution_config &solution, const problem_verdict &result, bool in_range);

    /**
     * @brief 记录一个编译失败的提交
     */
    void record_compilation_error(const solution_config &solution, const std::string &error_log);

    /**
     * @brief 记录一个因为 checker 或者系统错误而无法完成评测的提交
     */
    void record_error(const solution_config &solution, const std::string &message);

    /**
     * @brief 将 JSON 报告写入 json_path()
     */
    void save() const;

private:
    std::filesystem::path text_file;
    std::filesystem::path json_file;
    std::ofstream text;
    nlohmann::json report;
};

/**
 * @brief 日志文件名，格式为 yyyymmdd_HHMMSS
 */
std::string make_log_name(std::time_t now);

}  // namespace verifier
