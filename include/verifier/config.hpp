#pragma once

#include <filesystem>
#include <string>

namespace verifier {

/**
 * @brief 比较分数时使用的误差
 */
constexpr double EPS = 1e-6;

/**
 * @brief 默认的输入数据文件扩展名
 */
extern const char *DEFAULT_INPUT_SUFFIX;

/**
 * @brief 默认的输出数据文件扩展名
 */
extern const char *DEFAULT_OUTPUT_SUFFIX;

/**
 * @brief 存放编译产物及选手程序输出的临时文件夹
 *
 * TMP_DIR
 * ├── checker // 编译好的 checker
 * ├── input_validator // 编译好的输入校验器
 * ├── main // 编译好的提交程序（以源文件名去掉扩展名命名）
 * ├── main.compile.out // 编译器的输出
 * ├── out // 选手程序的 stdout 输出，每个测试点都会覆盖
 * └── outputs // 开启 KEEP_OUTPUTS 后每个测试点的输出
 *     └── main
 *         └── 1 // subtask id
 *             └── test1.out
 */
extern std::filesystem::path TMP_DIR;

/**
 * @brief 存放评测日志的文件夹
 * 每次运行会生成 yyyymmdd_HHMMSS.log 以及同名的 .json 报告
 */
extern std::filesystem::path LOG_DIR;

/**
 * @brief 编译命令模板
 * 以空白字符分隔参数，{source} 替换为源文件路径，{exec} 替换为可执行文件路径。
 * 命令不经过 shell 执行。
 */
extern std::string COMPILE_COMMAND;

/**
 * @brief checker 及输入校验器的时钟时间限制
 * @note 单位为秒，0 表示不限制
 */
extern double SCRIPT_TIME_LIMIT;

/**
 * @brief 是否为每个测试点保留单独的输出文件
 * 默认所有测试点共用 TMP_DIR/out
 */
extern bool KEEP_OUTPUTS;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，将打印执行的外部命令，并保留每个测试点的输出。
 */
extern bool DEBUG;

}  // namespace verifier
