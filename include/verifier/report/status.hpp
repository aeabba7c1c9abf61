#pragma once

#include <cstdio>
#include <string>

namespace verifier {

/**
 * @brief 一次检查的统计结果
 */
struct verification_summary {
    std::size_t passed = 0;
    std::size_t failed = 0;

    bool ok() const { return failed == 0; }
};

/**
 * @brief 向终端输出检查结果
 * 通过的检查输出为 "[✔] message"，失败的检查输出为 "[✘] message"，
 * 输出到终端时 ✔ 为绿色，✘ 为红色。每条结果同时写入 glog。
 */
struct verification_reporter {
    /**
     * @param out 输出的文件，默认为 stdout
     */
    explicit verification_reporter(std::FILE *out = stdout);

    void status(const std::string &message, bool success);

    void success(const std::string &message);

    void failed(const std::string &message);

    /**
     * @brief 输出不属于检查结果的信息，比如编译器的输出或者评测进度
     */
    void message(const std::string &message);

    const verification_summary &summary() const { return counts; }

private:
    std::FILE *out;
    bool colored;
    verification_summary counts;
};

}  // namespace verifier
