#pragma once

#include <filesystem>
#include <string>
#include <vector>

/**
 * 这个头文件包含测试数据的组织方式
 * 包含：
 * 1. test_case 类（表示一个测试点，即一对输入输出文件）
 * 2. subtask 类（表示一个子任务，即一组有分值的测试点）
 */
namespace verifier {

/**
 * @brief 表示一个测试点
 * 测试点在发现后不再修改，输入文件和输出文件必须同时存在
 */
struct test_case {
    /**
     * @brief 测试点名，为输入文件名去掉输入扩展名
     */
    std::string name;

    /**
     * @brief 测试点所在文件夹相对于 tests 文件夹的路径，直接放在 tests 下时为空
     */
    std::filesystem::path relative_dir;

    /**
     * @brief 输入数据路径，会作为选手程序的标准输入
     */
    std::filesystem::path input_path;

    /**
     * @brief 标准输出数据路径
     */
    std::filesystem::path output_path;

    /**
     * @brief 测试点所属的子任务
     */
    int subtask_id = 0;
};

/**
 * @brief 表示发现测试点时遇到的题目包问题
 * 比如输入文件没有对应的输出文件，该测试点不会被加入子任务
 */
struct discovery_warning {
    int subtask_id;
    std::filesystem::path input_path;
    std::string message;
};

/**
 * @brief 表示一个有分值的子任务
 * 子任务通过对测试数据文件名的正则匹配来选出测试点。
 * id 为 0 的子任务约定为样例数据，不参与输入校验。
 */
struct subtask {
    int id = 0;

    /**
     * @brief 匹配输入文件名（不含路径）的正则表达式，从文件名开头匹配
     */
    std::string regex;

    /**
     * @brief 子任务满分，非负整数
     */
    int score = 0;

    /**
     * @brief 按文件名字典序排列的测试点
     */
    std::vector<test_case> tests;

    /**
     * @brief 是否为样例数据
     */
    bool is_sample() const { return id == 0; }
};

/**
 * @brief 在测试数据文件夹中查找属于子任务的测试点
 * 递归遍历 tests_dir，文件名从开头匹配 regex 且扩展名为 input_suffix 的文件
 * 视为输入数据，同一文件夹下同名、扩展名为 output_suffix 的文件视为输出数据。
 * 遍历顺序按文件名字典序，保证多次运行的结果一致。
 * @param tests_dir 测试数据文件夹
 * @param id 子任务 id
 * @param regex 匹配文件名的正则表达式
 * @param score 子任务满分
 * @param input_suffix 输入数据扩展名（不含 "."）
 * @param output_suffix 输出数据扩展名（不含 "."）
 * @param warnings 缺少输出数据的输入文件会记录到这里
 * @throw std::regex_error 若 regex 不合法
 */
subtask discover_subtask(const std::filesystem::path &tests_dir,
                         int id,
                         const std::string &regex,
                         int score,
                         const std::string &input_suffix,
                         const std::string &output_suffix,
                         std::vector<discovery_warning> &warnings);

}  // namespace verifier
