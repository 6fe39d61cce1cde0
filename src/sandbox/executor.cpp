#include "sandbox/executor.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <ctime>
#include <vector>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;
using namespace std::chrono;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

const int BUF_SIZE = 4096;

// pipe2 返回的数组中，下标 0 为读端，下标 1 为写端
const int PIPE_IN = 1;
const int PIPE_OUT = 0;

/**
 * @brief poll 每次最多等待的毫秒数，保证能及时发现子进程退出
 */
const int POLL_SLICE_MS = 20;

/**
 * @brief 每次最多连续读取的块数，避免输出很多的程序让执行器错过时限
 */
const int MAX_READS_PER_ROUND = 16;

const int MAX_SPAWN_ATTEMPTS = 2;

const char *get_state_name(execution_state state) {
    switch (state) {
        case execution_state::COMPLETED: return "completed";
        case execution_state::TIMED_OUT: return "timed_out";
        case execution_state::KILLED: return "killed";
        case execution_state::SPAWN_FAILED: return "spawn_failed";
    }
    return "unknown";
}

/**
 * @brief fork 之前准备好的子进程参数
 * 子进程中只能调用 async-signal-safe 的函数，不能分配内存，
 * 因此 argv、envp 等都必须在 fork 之前构造好。
 */
struct child_context {
    char *const *argv;
    char *const *envp;
    const char *workdir;
    int stdio[3];
    int status_fd;
    const limit_spec *limits;
    const seccomp_filter *filter;
    int max_fd;
};

[[noreturn]] static void child_fail(int status_fd, int err) noexcept {
    ssize_t ret;
    do {
        ret = write(status_fd, &err, sizeof(err));
    } while (ret < 0 && errno == EINTR);
    _exit(127);
}

[[noreturn]] static void exec_child(const child_context &ctx) noexcept {
    // 独立的进程组，这样可以通过 kill(-pid) 杀死子进程创建的所有进程
    if (setsid() == -1) child_fail(ctx.status_fd, errno);

    // 监控线程屏蔽了 SIGPIPE，子进程要恢复默认
    sigset_t emptymask;
    sigemptyset(&emptymask);
    if (sigprocmask(SIG_SETMASK, &emptymask, nullptr) != 0) child_fail(ctx.status_fd, errno);
    struct sigaction sigact;
    memset(&sigact, 0, sizeof(sigact));
    sigact.sa_handler = SIG_DFL;
    if (sigaction(SIGPIPE, &sigact, nullptr) != 0) child_fail(ctx.status_fd, errno);

    // 将管道连接到 stdin/stdout/stderr
    for (int i = 0; i <= 2; ++i) {
        if (ctx.stdio[i] == i) {
            if (fcntl(i, F_SETFD, 0) != 0) child_fail(ctx.status_fd, errno);
        } else if (dup2(ctx.stdio[i], i) < 0) {
            child_fail(ctx.status_fd, errno);
        }
    }

    // 其余从父进程继承的文件描述符都不能留给提交的代码
    if (close_range(3, ~0U, CLOSE_RANGE_CLOEXEC) != 0) {
        for (int fd = 3; fd < ctx.max_fd; ++fd)
            fcntl(fd, F_SETFD, FD_CLOEXEC);
    }

    if (chdir(ctx.workdir) != 0) child_fail(ctx.status_fd, errno);

    int err = apply_limits(*ctx.limits);
    if (err) child_fail(ctx.status_fd, err);

    if (ctx.filter) {
        err = ctx.filter->load();
        if (err) child_fail(ctx.status_fd, err);
    }

    execve(ctx.argv[0], ctx.argv, ctx.envp);
    child_fail(ctx.status_fd, errno);
}

static void close_fd(int &fd) {
    if (fd < 0) return;
    if (close(fd) != 0) PLOG(WARNING) << "unable to close fd " << fd;
    fd = -1;
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) throw_errno(errno, "fcntl, getting flags of fd {}", fd);
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) throw_errno(errno, "fcntl, setting flags of fd {}", fd);
}

/**
 * @brief 将管道中可读的数据读入 buffer，超过 limit 的部分读出后丢弃
 * 读到 EOF 时关闭管道并将 fd 置为 -1
 */
static void pump_pipe(int &fd, string &buffer, size_t limit, bool &truncated) {
    char buf[BUF_SIZE];
    for (int round = 0; round < MAX_READS_PER_ROUND && fd >= 0; ++round) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            throw_errno(errno, "reading child output from fd {}", fd);
        }
        if (nread == 0) {
            // EOF detected
            close_fd(fd);
            return;
        }

        size_t room = buffer.size() < limit ? limit - buffer.size() : 0;
        if ((size_t)nread > room) {
            if (!truncated) LOG(INFO) << "child output limit " << limit << " reached";
            truncated = true;
        }
        buffer.append(buf, min(room, (size_t)nread));
    }
}

/**
 * @brief 向子进程的 stdin 写入尽可能多的数据，全部写完或者子进程关闭 stdin 后关闭管道
 */
static void feed_stdin(int &fd, const string &data, size_t &written) {
    while (written < data.size()) {
        size_t to_write = min(data.size() - written, (size_t)BUF_SIZE * 16);
        ssize_t nwritten = write(fd, data.data() + written, to_write);
        if (nwritten >= 0) {
            written += nwritten;
            continue;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        if (errno == EPIPE) {
            LOG(INFO) << "child closed stdin after " << written << " of " << data.size() << " bytes";
            break;
        }
        throw_errno(errno, "writing child stdin");
    }
    close_fd(fd);
}

/**
 * @brief 杀死整个进程组，进程组已经不存在时忽略
 */
static void kill_process_group(pid_t pgid) {
    if (pgid <= 0) return;
    if (kill(-pgid, SIGKILL) != 0 && errno != ESRCH)
        PLOG(ERROR) << "unable to send SIGKILL to process group " << pgid;
}

/**
 * @brief 检查子进程是否已经退出，但不回收，保证 pid 在杀死进程组之前不会被复用
 */
static bool child_exited(pid_t pid) {
    while (true) {
        siginfo_t info;
        info.si_pid = 0;
        if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0)
            return info.si_pid == pid;
        if (errno != EINTR) throw_errno(errno, "waiting on child {}", pid);
    }
}

static int reap_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw_errno(errno, "reaping child {}", pid);
    }
    return status;
}

/**
 * @brief 在监控线程中屏蔽 SIGPIPE，离开作用域时清除写 stdin 时产生的 SIGPIPE 并恢复信号掩码
 */
struct sigpipe_guard {
    sigpipe_guard() {
        sigset_t sigpipe_mask;
        sigemptyset(&sigpipe_mask);
        sigaddset(&sigpipe_mask, SIGPIPE);
        if (int err = pthread_sigmask(SIG_BLOCK, &sigpipe_mask, &old_mask))
            throw_errno(err, "blocking SIGPIPE");
        already_blocked = sigismember(&old_mask, SIGPIPE) == 1;
    }

    ~sigpipe_guard() {
        if (!already_blocked) {
            sigset_t sigpipe_mask;
            sigemptyset(&sigpipe_mask);
            sigaddset(&sigpipe_mask, SIGPIPE);
            struct timespec zero = {0, 0};
            while (sigtimedwait(&sigpipe_mask, nullptr, &zero) == SIGPIPE)
                ;
        }
        pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
    }

private:
    sigset_t old_mask;
    bool already_blocked;
};

executor::executor(const sandbox_config &config) : config(config) {
    if (config.use_seccomp) filter = make_unique<seccomp_filter>();
}

executor::~executor() = default;

execution_outcome executor::execute(const string &source_code, const string &stdin_data, const limit_spec &limits) const {
    for (int attempt = 1;; ++attempt) {
        try {
            execution_outcome outcome = run_once(source_code, stdin_data, limits);
            outcome.spawn_attempts = attempt;
            return outcome;
        } catch (const spawn_error &e) {
            LOG(WARNING) << "spawn attempt " << attempt << " failed: " << e.what();
            if (attempt >= MAX_SPAWN_ATTEMPTS) {
                execution_outcome outcome;
                outcome.state = execution_state::SPAWN_FAILED;
                outcome.spawn_attempts = attempt;
                outcome.diagnostic = e.what();
                return outcome;
            }
        }
    }
}

execution_outcome executor::run_once(const string &source_code, const string &stdin_data, const limit_spec &limits) const {
    scratch_directory scratch(config.scratch_root);
    try {
        write_file_content(scratch.path() / "main.py", source_code);
    } catch (const system_error &e) {
        throw spawn_error(e.code().value(), "unable to write main.py into " + scratch.path().string());
    }

    vector<string> args = {config.python_executable.string(), "-I", "-S", "-B", "-u", "-X", "utf8", "main.py"};
    vector<string> env = {"PATH=/usr/bin:/bin", "LANG=C.UTF-8", "HOME=" + scratch.path().string()};
    vector<char *> argv, envp;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);
    for (auto &entry : env) envp.push_back(entry.data());
    envp.push_back(nullptr);
    string workdir = scratch.path().string();

    struct rlimit nofile;
    int max_fd = 1024;
    if (getrlimit(RLIMIT_NOFILE, &nofile) == 0 && nofile.rlim_cur != RLIM_INFINITY)
        max_fd = (int)min<rlim_t>(nofile.rlim_cur, 1 << 20);

    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int status_pipefd[2] = {-1, -1};
    defer {
        for (int i = 0; i <= 2; ++i) {
            close_fd(child_pipefd[i][PIPE_OUT]);
            close_fd(child_pipefd[i][PIPE_IN]);
        }
        close_fd(status_pipefd[PIPE_OUT]);
        close_fd(status_pipefd[PIPE_IN]);
    };

    for (int i = 0; i <= 2; ++i) {
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0)
            throw spawn_error(errno, fmt::format("creating pipe for fd {}", i));
    }
    if (pipe2(status_pipefd, O_CLOEXEC) != 0)
        throw spawn_error(errno, "creating exec status pipe");

    child_context ctx;
    ctx.argv = argv.data();
    ctx.envp = envp.data();
    ctx.workdir = workdir.c_str();
    ctx.stdio[STDIN_FILENO] = child_pipefd[STDIN_FILENO][PIPE_OUT];
    ctx.stdio[STDOUT_FILENO] = child_pipefd[STDOUT_FILENO][PIPE_IN];
    ctx.stdio[STDERR_FILENO] = child_pipefd[STDERR_FILENO][PIPE_IN];
    ctx.status_fd = status_pipefd[PIPE_IN];
    ctx.limits = &limits;
    ctx.filter = limits.use_seccomp ? filter.get() : nullptr;
    ctx.max_fd = max_fd;

    sigpipe_guard sigpipe;

    pid_t pid = fork();
    if (pid < 0) throw spawn_error(errno, "unable to fork");
    if (pid == 0) exec_child(ctx);

    bool reaped = false;
    defer {
        if (!reaped) {
            kill_process_group(pid);
            int ignored;
            while (waitpid(pid, &ignored, 0) < 0 && errno == EINTR)
                ;
        }
    };

    elapsed_time timer;
    auto deadline = steady_clock::now() + duration_cast<steady_clock::duration>(duration<double>(limits.wall_timeout_seconds));

    // Close unused file descriptors
    close_fd(child_pipefd[STDIN_FILENO][PIPE_OUT]);
    close_fd(child_pipefd[STDOUT_FILENO][PIPE_IN]);
    close_fd(child_pipefd[STDERR_FILENO][PIPE_IN]);
    close_fd(status_pipefd[PIPE_IN]);

    // execve 成功后状态管道因 O_CLOEXEC 被关闭，读到 EOF；失败时子进程写入 errno
    int exec_errno = 0;
    ssize_t nread;
    do {
        nread = read(status_pipefd[PIPE_OUT], &exec_errno, sizeof(exec_errno));
    } while (nread < 0 && errno == EINTR);
    if (nread < 0) throw spawn_error(errno, "reading exec status pipe");
    if (nread > 0) {
        kill_process_group(pid);
        reap_child(pid);
        reaped = true;
        throw spawn_error(exec_errno, fmt::format("unable to start {}", args[0]));
    }
    close_fd(status_pipefd[PIPE_OUT]);

    int &stdin_fd = child_pipefd[STDIN_FILENO][PIPE_IN];
    int &stdout_fd = child_pipefd[STDOUT_FILENO][PIPE_OUT];
    int &stderr_fd = child_pipefd[STDERR_FILENO][PIPE_OUT];
    set_nonblocking(stdin_fd);
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);
    if (stdin_data.empty()) close_fd(stdin_fd);

    execution_outcome outcome;
    outcome.pid = pid;
    size_t limit = limits.max_output_bytes > 0 ? (size_t)limits.max_output_bytes : 0;
    size_t written = 0;
    bool timed_out = false;

    auto poll_once = [&](int timeout_ms, bool write_stdin) {
        struct pollfd fds[3];
        int nfds = 0;
        int stdin_idx = -1, stdout_idx = -1, stderr_idx = -1;
        if (write_stdin && stdin_fd >= 0) {
            stdin_idx = nfds;
            fds[nfds++] = {stdin_fd, POLLOUT, 0};
        }
        if (stdout_fd >= 0) {
            stdout_idx = nfds;
            fds[nfds++] = {stdout_fd, POLLIN, 0};
        }
        if (stderr_fd >= 0) {
            stderr_idx = nfds;
            fds[nfds++] = {stderr_fd, POLLIN, 0};
        }

        int r = poll(fds, nfds, timeout_ms);
        if (r == -1) {
            if (errno == EINTR) return;
            throw_errno(errno, "waiting for child data");
        }
        if (r == 0) return;

        if (stdin_idx >= 0 && fds[stdin_idx].revents)
            feed_stdin(stdin_fd, stdin_data, written);
        if (stdout_idx >= 0 && fds[stdout_idx].revents)
            pump_pipe(stdout_fd, outcome.stdout_output, limit, outcome.stdout_truncated);
        if (stderr_idx >= 0 && fds[stderr_idx].revents)
            pump_pipe(stderr_fd, outcome.stderr_output, limit, outcome.stderr_truncated);
    };

    while (true) {
        if (child_exited(pid)) break;

        auto now = steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            LOG(INFO) << fmt::format("child {} exceeded wall time limit {:.3f}s", pid, limits.wall_timeout_seconds);
            break;
        }

        auto remaining = duration_cast<milliseconds>(deadline - now).count() + 1;
        poll_once((int)min<int64_t>(POLL_SLICE_MS, remaining), true);
    }

    // 子进程已经退出或者超时，杀死整个进程组后再回收，保证没有后代进程存活
    kill_process_group(pid);
    int status = reap_child(pid);
    reaped = true;
    outcome.wall_time_ms = timer.duration<milliseconds>().count();
    close_fd(stdin_fd);

    // 读取管道中剩余的输出，写端已经全部关闭，最多等待 killdelay
    auto drain_deadline = steady_clock::now() + seconds(killdelay.tv_sec) + nanoseconds(killdelay.tv_nsec);
    while ((stdout_fd >= 0 || stderr_fd >= 0) && steady_clock::now() < drain_deadline) {
        poll_once(POLL_SLICE_MS, false);
    }
    if (stdout_fd >= 0 || stderr_fd >= 0)
        LOG(WARNING) << "child " << pid << " output not closed after kill delay";

    outcome.timed_out = timed_out;
    outcome.truncated_output = outcome.stdout_truncated || outcome.stderr_truncated;
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        outcome.terminating_signal = signal_name(sig);
        if (!timed_out) LOG(WARNING) << "child " << pid << " terminated with signal (" << sig << ", " << strsignal(sig) << ")";
    } else {
        outcome.diagnostic = fmt::format("unknown status: {:x}", status);
        LOG(ERROR) << "child " << pid << " " << outcome.diagnostic;
    }

    if (timed_out) {
        outcome.state = execution_state::TIMED_OUT;
    } else if (WIFSIGNALED(status) && (WTERMSIG(status) == SIGKILL || WTERMSIG(status) == SIGXCPU || WTERMSIG(status) == SIGXFSZ)) {
        outcome.state = execution_state::KILLED;
    } else {
        outcome.state = execution_state::COMPLETED;
    }

    VLOG(1) << fmt::format("child {} {} in {}ms, stdout {} bytes, stderr {} bytes",
                           pid, get_state_name(outcome.state), outcome.wall_time_ms,
                           outcome.stdout_output.size(), outcome.stderr_output.size());
    return outcome;
}

}  // namespace sandbox
