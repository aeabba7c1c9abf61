#pragma once

#include <filesystem>

namespace verifier {

/**
 * @brief 选手程序运行一次后的原始结果，还没有比较输出
 */
enum class run_outcome {
    /**
     * @brief 程序返回 0，输出是否正确还未知
     */
    COMPLETED,

    /**
     * @brief 程序返回非 0 或者被信号杀死
     */
    RUNTIME_FAILURE,

    /**
     * @brief 程序超出时钟时间限制，被杀死
     */
    TIMED_OUT
};

struct run_result {
    run_outcome outcome;

    /**
     * @brief 程序消耗的 CPU 时间（用户态 + 内核态）
     * 单位为秒，超时时为 TIME_NOT_MEASURED
     */
    double cpu_time;

    /**
     * @brief 程序运行的时钟时间，单位为秒
     */
    double wall_time;

    /**
     * @brief 程序的返回值，被信号杀死或超时时为 -1
     */
    int exitcode = -1;

    /**
     * @brief 杀死程序的信号，不是被信号杀死时为 -1
     */
    int signal = -1;
};

/**
 * @brief 运行选手程序
 * 输入文件作为标准输入，标准输出写入 output_file（程序启动前创建，因此即使程序
 * 运行错误也会保留已经输出的内容；超时时输出文件内容不确定），标准错误被丢弃。
 * CPU 时间取自该子进程结束时 wait4 返回的资源使用情况，与其他程序的运行无关，
 * 本函数不保存任何状态。
 * @param executable 可执行文件路径
 * @param input_file 标准输入数据
 * @param output_file 标准输出写入的文件
 * @param time_limit 时钟时间限制，单位为秒
 * @return 运行结果
 * @throw internal_error 若无法启动程序
 */
run_result run_program(const std::filesystem::path &executable,
                       const std::filesystem::path &input_file,
                       const std::filesystem::path &output_file,
                       double time_limit);

}  // namespace verifier
