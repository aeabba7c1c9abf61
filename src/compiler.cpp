#include "verifier/compiler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "verifier/common/exceptions.hpp"
#include "verifier/common/io_utils.hpp"
#include "verifier/common/utils.hpp"
#include "verifier/config.hpp"

namespace verifier {
using namespace std;
namespace fs = std::filesystem;

vector<string> make_compile_command(const string &command_template, const fs::path &source, const fs::path &exec) {
    string trimmed = boost::trim_copy(command_template);
    if (trimmed.empty())
        throw package_error("compile command is empty");

    vector<string> args;
    boost::split(args, trimmed, boost::is_space(), boost::token_compress_on);
    for (auto &arg : args) {
        boost::replace_all(arg, "{source}", fs::absolute(source).string());
        boost::replace_all(arg, "{exec}", fs::absolute(exec).string());
    }
    return args;
}

fs::path get_compilation_log_path(const fs::path &exec) {
    fs::path log = exec;
    log += ".compile.out";
    return log;
}

void compile_source(const fs::path &source, const fs::path &exec) {
    if (!fs::is_regular_file(source))
        throw compilation_error(fmt::format("source file {} not found", source.string()), "Source file not found");

    if (exec.has_parent_path()) fs::create_directories(exec.parent_path());
    fs::path log = get_compilation_log_path(exec);

    process_options opt;
    opt.stdout_file = log;
    opt.stderr_file = log;

    vector<string> command = make_compile_command(COMPILE_COMMAND, source, exec);
    LOG(INFO) << "Compiling " << source << " to " << exec;

    process_status status;
    try {
        status = call_process_opt(opt, command);
    } catch (internal_error &e) {
        throw compilation_error("Compilation failed because of internal errors", e.what());
    }

    if (status.signal >= 0)
        throw compilation_error(fmt::format("Compiler killed by signal {}", status.signal),
                                read_file_content(log, "No compilation information"));
    if (status.exitcode != 0)
        throw compilation_error(fmt::format("Compilation failed with exitcode {}", status.exitcode),
                                read_file_content(log, "No compilation information"));
}

}  // namespace verifier
