#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "verifier/package/subtask.hpp"

namespace verifier {

/**
 * @brief 一个没有通过输入校验的测试点
 */
struct validation_failure {
    int subtask_id;
    std::filesystem::path input_path;

    /**
     * @brief 失败原因，比如校验器的标准输出或无法运行校验器的原因
     */
    std::string message;
};

/**
 * @brief 一个子任务的输入校验结果
 */
struct subtask_validation {
    int subtask_id;
    std::size_t checked_tests = 0;
    std::vector<validation_failure> failures;

    bool passed() const { return failures.empty(); }
};

/**
 * @brief 用输入校验器检查一个子任务的所有输入数据
 * 每个输入文件会先将 \r\n 替换为 \n 并写回原文件，然后以
 * validator <subtask id> <input> 的方式调用校验器，并将输入数据作为标准输入。
 * 校验器返回非 0 表示输入数据不满足该子任务的约束。
 * 样例子任务（id 为 0）不做校验。
 * @param validator 编译好的输入校验器
 * @param sub 要检查的子任务
 * @param work_dir 存放校验器输出的文件夹
 * @param time_limit 校验器的时钟时间限制，单位为秒，0 表示不限制
 * @return 校验结果，无法运行校验器也会记录为失败
 */
subtask_validation validate_subtask(const std::filesystem::path &validator,
                                    const subtask &sub,
                                    const std::filesystem::path &work_dir,
                                    double time_limit);

}  // namespace verifier
