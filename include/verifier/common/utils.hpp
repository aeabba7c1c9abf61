#pragma once

#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace verifier {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 外部程序的输入输出重定向及时间限制
 */
struct process_options {
    /**
     * @brief 重定向到标准输入的文件，为空表示继承父进程的标准输入
     */
    std::filesystem::path stdin_file;

    /**
     * @brief 标准输出写入的文件，会在子进程启动前创建（或清空）
     * 为空表示继承父进程的标准输出
     */
    std::filesystem::path stdout_file;

    /**
     * @brief 标准错误写入的文件，为空表示继承父进程的标准错误
     * 与 stdout_file 相同时两者写入同一个文件
     */
    std::filesystem::path stderr_file;

    /**
     * @brief 时钟时间限制
     * @note 单位为秒，小于等于 0 表示不限制
     */
    double time_limit = 0;
};

/**
 * @brief 外部程序的运行结果
 */
struct process_status {
    /**
     * @brief 是否因为超出时钟时间限制而被杀死
     */
    bool timed_out = false;

    /**
     * @brief 程序正常退出时的返回值，否则为 -1
     */
    int exitcode = -1;

    /**
     * @brief 杀死程序的信号，程序正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief 子进程（及其已被回收的子孙进程）消耗的 CPU 时间
     * 单位为秒，取自 wait4 返回的 rusage，不依赖进程全局的 RUSAGE_CHILDREN 计数
     */
    double cpu_time = 0;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;

    bool exited() const { return !timed_out && signal < 0; }

    bool succeeded() const { return exited() && exitcode == 0; }
};

/**
 * @brief 执行外部命令
 * 子进程会被放在一个独立的进程组中，超时或结束后整个进程组都会被 SIGKILL 清理，
 * 以确保子进程 fork 出来的进程不会留驻系统。
 * @param options 输入输出重定向及时间限制
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @return 外部命令的运行结果
 * @throw internal_error 若无法打开重定向文件、无法 fork 或者 exec 失败
 */
process_status exec_program(const process_options &options, const char **argv);

/**
 * @brief 调用外部程序
 * @note 与 exec_program(argv) 的区别是，这个函数是类型安全的，而且会自动执行类型转换
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param options 输入输出重定向及时间限制
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径
 * @code{.cpp}
 *     process_options opt;
 *     opt.stdout_file = "/dev/null";
 *     process_status st = call_process_opt(opt, checker, input, output, answer);
 * @endcode
 */
template <typename... Args>
process_status call_process_opt(const process_options &options, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    std::vector<const char *> argv;
    for (auto &arg : list)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

#ifndef NDEBUG
    std::stringstream ss;
    for (auto &arg : list)
        ss << arg << ' ';
    DLOG(INFO) << ss.str();
#endif

    return exec_program(options, argv.data());
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace verifier
