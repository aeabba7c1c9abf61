#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace verifier {

/**
 * @brief 根据编译命令模板生成编译命令的参数列表
 * 模板以空白字符分隔参数，{source} 替换为源文件的绝对路径，{exec} 替换为可执行文件的绝对路径
 * @param command_template 编译命令模板，比如 COMPILE_COMMAND
 * @param source 源文件路径
 * @param exec 可执行文件路径
 * @throw package_error 若模板为空
 */
std::vector<std::string> make_compile_command(const std::string &command_template,
                                              const std::filesystem::path &source,
                                              const std::filesystem::path &exec);

/**
 * @brief 编译出错时的编译器输出
 * 编译器的 stdout 和 stderr 都写入 <exec>.compile.out
 */
std::filesystem::path get_compilation_log_path(const std::filesystem::path &exec);

/**
 * @brief 使用 COMPILE_COMMAND 将源文件编译为可执行文件
 * 命令不经过 shell 执行，编译器的输出保存在 get_compilation_log_path(exec)
 * @param source 源文件路径
 * @param exec 可执行文件的保存路径，所在的文件夹会被自动创建
 * @throw compilation_error 若编译器返回非 0 或者无法启动编译器
 */
void compile_source(const std::filesystem::path &source, const std::filesystem::path &exec);

}  // namespace verifier
