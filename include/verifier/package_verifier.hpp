#pragma once

#include <filesystem>
#include <optional>
#include "verifier/package/problem.hpp"
#include "verifier/report/status.hpp"

namespace verifier {

/**
 * @brief 检查一个题目包
 * 检查分为三步：
 * 1. verify_package: 报告题目包的基本信息以及扫描测试数据时发现的问题
 * 2. verify_subtasks: 检查子任务分数之和、每个子任务的测试点数，并用输入校验器检查输入数据
 * 3. verify_submissions: 编译并评测 solutions 中的每个提交，检查得分是否在声明的范围内
 *
 * 编译产物和选手输出保存在 TMP_DIR，评测日志保存在 LOG_DIR。
 * 每一项检查的结果都通过 verification_reporter 输出。
 */
struct package_verifier {
    package_verifier(const problem_package &package, verification_reporter &reporter);

    void verify_package();

    void verify_subtasks();

    void verify_submissions();

    /**
     * @brief 最后一次 verify_submissions 写入的文字日志
     */
    const std::optional<std::filesystem::path> &log_path() const { return last_log; }

private:
    /**
     * @brief 编译 checker 或者输入校验器
     * @return 可执行文件路径，编译失败时返回空并报告错误
     */
    std::optional<std::filesystem::path> compile_script(const std::filesystem::path &source, const char *name);

    void report_extra_submissions();

    const problem_package &package;
    verification_reporter &reporter;
    std::optional<std::filesystem::path> last_log;
};

}  // namespace verifier
