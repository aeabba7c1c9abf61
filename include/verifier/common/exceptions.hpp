#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace verifier {

struct verifier_exception : std::exception {
    verifier_exception();
    explicit verifier_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const verifier_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示题目包本身的问题
 * 比如 config.yaml 格式错误、缺少 tests 文件夹、缺少配置的 checker 源文件等。
 * 题目包错误不会被当成某个测试点的评测结果。
 */
struct package_error : public verifier_exception {
    package_error();
    explicit package_error(const std::string &message);
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是无法启动外部程序，或者系统调用失败
 */
struct internal_error : public verifier_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示无法调用 checker
 * checker 不存在、无法执行、被信号杀死或者超时。这是配置错误而不是 Wrong Answer，
 * 遇到该错误时整个题目包的提交评测需要中止。
 */
struct checker_error : public internal_error {
    checker_error();
    explicit checker_error(const std::string &message);
};

/**
 * @brief 表示程序编译错误
 */
struct compilation_error : public std::runtime_error {
    const std::string error_log;

    explicit compilation_error(const std::string &what, const std::string &error_log);
};

}  // namespace verifier
