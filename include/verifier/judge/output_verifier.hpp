#pragma once

#include <filesystem>
#include <memory>
#include "verifier/package/subtask.hpp"

namespace verifier {

/**
 * @brief 判断选手程序的输出是否正确
 */
struct output_verifier {
    virtual ~output_verifier() = default;

    /**
     * @brief 比较选手输出与测试点的标准输出
     * @param test 当前测试点
     * @param produced_output 选手程序的输出文件
     * @return true 若输出正确
     * @throw checker_error 若无法调用 checker，此时不能认为输出错误
     */
    virtual bool verify(const test_case &test, const std::filesystem::path &produced_output) const = 0;
};

/**
 * @brief 默认的比较方式，相当于 diff -w
 * 逐行比较，忽略行内所有的空白字符，并忽略文末的空行。
 * 其他任何字节不一致都视为输出错误。
 */
struct whitespace_verifier : public output_verifier {
    bool verify(const test_case &test, const std::filesystem::path &produced_output) const override;
};

/**
 * @brief 使用题目提供的 checker 比较输出
 * 调用方式为 checker <input> <produced_output> <expected_output>，
 * 返回 0 表示正确，其他返回值表示错误。checker 的标准输出和标准错误都被丢弃。
 */
struct checker_verifier : public output_verifier {
    /**
     * @param checker 编译好的 checker 可执行文件
     * @param time_limit checker 的时钟时间限制，单位为秒，0 表示不限制
     */
    checker_verifier(const std::filesystem::path &checker, double time_limit);

    bool verify(const test_case &test, const std::filesystem::path &produced_output) const override;

private:
    std::filesystem::path checker;
    double time_limit;
};

/**
 * @brief 比较两段文本，忽略所有空白字符以及文末空行
 */
bool equal_ignoring_whitespace(const std::string &expected, const std::string &actual);

}  // namespace verifier
