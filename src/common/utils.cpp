#include "verifier/common/utils.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include "verifier/common/exceptions.hpp"

namespace verifier {
using namespace std;

// 轮询子进程状态的间隔
static const struct timespec poll_delay = {0, 2000000L};  // 2ms

static int open_redirect(const filesystem::path &path, int flags) {
    if (path.empty()) return -1;
    int fd = open(path.c_str(), flags | O_CLOEXEC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (fd < 0)
        throw internal_error(fmt::format("unable to open file '{}': {}", path.string(), strerror(errno)));
    return fd;
}

static void close_fd(int fd) {
    if (fd >= 0) close(fd);
}

static double to_seconds(const struct timeval &tv) {
    return tv.tv_sec + tv.tv_usec * 1E-6;
}

/**
 * @brief 杀死整个进程组，已经结束的进程组不视为错误
 */
static void kill_group(pid_t pid) {
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
}

static pid_t wait_child(pid_t pid, int &status, int options, struct rusage &usage) {
    pid_t ret;
    do {
        ret = wait4(pid, &status, options, &usage);
    } while (ret < 0 && errno == EINTR);
    if (ret < 0)
        throw internal_error(fmt::format("waiting on child {}: {}", pid, strerror(errno)));
    return ret;
}

process_status exec_program(const process_options &options, const char **argv) {
    int fds[3] = {-1, -1, -1};
    int errpipe[2] = {-1, -1};

    try {
        fds[STDIN_FILENO] = open_redirect(options.stdin_file, O_RDONLY);
        fds[STDOUT_FILENO] = open_redirect(options.stdout_file, O_WRONLY | O_CREAT | O_TRUNC);
        if (!options.stderr_file.empty() && options.stderr_file == options.stdout_file) {
            fds[STDERR_FILENO] = fcntl(fds[STDOUT_FILENO], F_DUPFD_CLOEXEC, 0);
            if (fds[STDERR_FILENO] < 0)
                throw internal_error(fmt::format("redirecting stderr: {}", strerror(errno)));
        } else {
            fds[STDERR_FILENO] = open_redirect(options.stderr_file, O_WRONLY | O_CREAT | O_TRUNC);
        }
    } catch (...) {
        for (int fd : fds) close_fd(fd);
        throw;
    }

    // exec 失败时子进程通过该管道将 errno 传回父进程，exec 成功时管道随 O_CLOEXEC 关闭
    if (pipe2(errpipe, O_CLOEXEC) != 0) {
        for (int fd : fds) close_fd(fd);
        throw internal_error(fmt::format("creating pipe: {}", strerror(errno)));
    }

    elapsed_time timer;
    pid_t pid = fork();
    switch (pid) {
        case -1: {  // fork 失败
            int err = errno;
            for (int fd : fds) close_fd(fd);
            close_fd(errpipe[0]);
            close_fd(errpipe[1]);
            throw internal_error(fmt::format("unable to fork: {}", strerror(err)));
        }
        case 0: {  // 子进程
            // 独立的进程组，以便超时时杀死子进程创建的所有进程
            setpgid(0, 0);
            for (int i = 0; i < 3; ++i)
                if (fds[i] >= 0 && dup2(fds[i], i) < 0) {
                    int err = errno;
                    (void)!write(errpipe[1], &err, sizeof(err));
                    _exit(127);
                }
            execvp(argv[0], (char **)argv);
            int err = errno;
            (void)!write(errpipe[1], &err, sizeof(err));
            _exit(127);
        }
        default:
            break;
    }

    // 父进程
    setpgid(pid, pid);
    for (int fd : fds) close_fd(fd);
    close_fd(errpipe[1]);

    int exec_errno = 0;
    ssize_t nread;
    do {
        nread = read(errpipe[0], &exec_errno, sizeof(exec_errno));
    } while (nread < 0 && errno == EINTR);
    close_fd(errpipe[0]);

    int status = 0;
    struct rusage usage {};

    if (nread == sizeof(exec_errno)) {
        wait_child(pid, status, 0, usage);
        throw internal_error(fmt::format("unable to start command {}: {}", argv[0], strerror(exec_errno)));
    }

    process_status result;
    if (options.time_limit > 0) {
        while (true) {
            if (wait_child(pid, status, WNOHANG, usage) == pid) break;
            if (timer.seconds() > options.time_limit) {
                LOG(INFO) << "time limit exceeded (hard wall time): killing " << argv[0];
                kill_group(pid);
                wait_child(pid, status, 0, usage);
                result.timed_out = true;
                break;
            }
            nanosleep(&poll_delay, nullptr);
        }
    } else {
        wait_child(pid, status, 0, usage);
    }
    result.wall_time = timer.seconds();

    // 进程组中残留的进程（比如选手程序 fork 出来的进程）也需要杀死
    kill_group(pid);

    if (result.timed_out) {
        result.cpu_time = -1;
        return result;
    }

    result.cpu_time = to_seconds(usage.ru_utime) + to_seconds(usage.ru_stime);
    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        LOG(INFO) << "command " << argv[0] << " terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    } else {
        throw internal_error(fmt::format("unknown status: {:x}", status));
    }
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::microseconds>().count() * 1E-6;
}

}  // namespace verifier
