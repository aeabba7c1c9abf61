#pragma once

#include <filesystem>
#include <string>

namespace verifier {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 覆盖写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 将文件中所有的 \r\n 和单独的 \r 替换为 \n，并写回原文件
 * 这个操作会直接修改题目包中的数据
 * @param path 要处理的文件
 * @return 文件是否被修改
 */
bool normalize_line_endings(const std::filesystem::path &path);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 题目包配置中的文件名会被拼接到题目包路径下，如果文件名包含 "../"，
 * 最后有可能覆盖或者执行题目包以外的文件。空文件名和绝对路径同样不安全。
 * @param subpath 被检查的文件名
 * @return subpath 本身
 * @throw invalid_argument 若 subpath 不安全
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 检查文件是否存在且当前用户可以执行
 */
bool is_executable(const std::filesystem::path &path);

}  // namespace verifier
