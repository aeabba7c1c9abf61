#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "verifier/package/subtask.hpp"

namespace verifier {

/**
 * @brief 题目包中声明的一个参考或者候选解法
 */
struct solution_config {
    /**
     * @brief submissions 文件夹下的源文件名，比如 main.cpp
     */
    std::string name;

    /**
     * @brief 该解法应当获得的最低分
     */
    double min_score = 0;

    /**
     * @brief 该解法应当获得的最高分
     */
    double max_score = 0;
};

/**
 * @brief 表示一个题目包
 *
 * PACKAGE
 * ├── config.yaml // 题目配置
 * ├── tests // 测试数据，*.inp 和 *.out，可以有子文件夹
 * ├── submissions // 解法源代码
 * ├── input_validator // 输入校验器源代码（可选）
 * └── output_checker // 输出校验器源代码（可选）
 */
struct problem_package {
    std::filesystem::path root;
    std::filesystem::path config_path;
    std::filesystem::path tests_dir;
    std::filesystem::path submissions_dir;

    std::string input_suffix;
    std::string output_suffix;

    /**
     * @brief 题目声明的总分，必须等于所有子任务分数之和
     */
    int total_score = 0;

    /**
     * @brief 每个测试点的时钟时间限制，单位为秒
     */
    double time_limit = 0;

    /**
     * @brief checker 源文件路径，为空表示使用默认的忽略空白字符比较
     */
    std::filesystem::path checker_source;

    /**
     * @brief 输入校验器源文件路径，为空表示不校验输入数据
     */
    std::filesystem::path validator_source;

    std::vector<subtask> subtasks;

    /**
     * @brief config.yaml 中 solutions 一项，可能为空
     */
    std::vector<solution_config> solutions;

    /**
     * @brief 发现测试点时遇到的问题
     */
    std::vector<discovery_warning> warnings;

    /**
     * @brief 从题目包文件夹加载题目配置并发现所有子任务的测试点
     * @param dir 题目包根目录
     * @throw package_error 若题目包文件夹、config.yaml、tests、submissions 不存在，
     * 或者 config.yaml 格式错误，或者配置的 checker、输入校验器不存在
     */
    static problem_package load(const std::filesystem::path &dir);

    /**
     * @brief 所有子任务分数之和
     */
    int subtask_score_sum() const;

    /**
     * @brief 解法声明的最低分达到满分，即该解法是一个 AC 解法
     */
    bool is_full_score(const solution_config &solution) const;
};

}  // namespace verifier
