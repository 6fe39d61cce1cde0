#include "sandbox/limits.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <sched.h>
#include <linux/seccomp.h>
#include <seccomp.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const limit_spec &spec) {
    j = json{{"wall_timeout_seconds", spec.wall_timeout_seconds},
             {"address_space_bytes", spec.address_space_bytes},
             {"cpu_soft_seconds", spec.cpu_soft_seconds},
             {"cpu_hard_seconds", spec.cpu_hard_seconds},
             {"file_size_bytes", spec.file_size_bytes},
             {"max_output_bytes", spec.max_output_bytes},
             {"max_processes", spec.max_processes},
             {"max_open_files", spec.max_open_files},
             {"no_core_dumps", spec.no_core_dumps},
             {"network_access", spec.use_seccomp ? "disabled" : "unrestricted"}};
}

resource_limiter::resource_limiter(const sandbox_config &config) : config(config) {}

double resource_limiter::clamp_timeout(double timeout_seconds) const {
    if (!isfinite(timeout_seconds) || timeout_seconds <= 0)
        return config.default_timeout_seconds;
    return min(timeout_seconds, config.default_timeout_seconds);
}

int64_t resource_limiter::clamp_memory(int64_t memory_limit_bytes) const {
    if (memory_limit_bytes <= 0)
        return config.default_memory_limit_bytes;
    return min(memory_limit_bytes, config.default_memory_limit_bytes);
}

limit_spec resource_limiter::build_limits(int64_t memory_limit_bytes, double cpu_seconds) const {
    limit_spec spec;
    spec.wall_timeout_seconds = clamp_timeout(cpu_seconds);
    spec.address_space_bytes = clamp_memory(memory_limit_bytes);
    spec.cpu_soft_seconds = max<int64_t>(1, (int64_t)ceil(spec.wall_timeout_seconds));
    spec.cpu_hard_seconds = spec.cpu_soft_seconds + 1;
    spec.file_size_bytes = config.max_output_bytes;
    spec.max_output_bytes = config.max_output_bytes;
    spec.max_processes = config.max_processes;
    spec.max_open_files = config.max_open_files;
    spec.no_core_dumps = true;
    spec.use_seccomp = config.use_seccomp;
    return spec;
}

limit_spec resource_limiter::build_limits(const submission_request &request) const {
    return build_limits(request.memory_limit_bytes, request.timeout_seconds);
}

static int set_rlimit(int resource, rlim_t cur, rlim_t max) noexcept {
    struct rlimit lim;
    if (getrlimit(resource, &lim) != 0) return errno;
    // 非特权进程不能提高硬限制
    if (lim.rlim_max != RLIM_INFINITY) {
        max = std::min(max, lim.rlim_max);
        cur = std::min(cur, max);
    }
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0) return errno;
    return 0;
}

int apply_limits(const limit_spec &spec) noexcept {
    int err;
    if (spec.address_space_bytes > 0 &&
        (err = set_rlimit(RLIMIT_AS, spec.address_space_bytes, spec.address_space_bytes)))
        return err;
    if (spec.cpu_soft_seconds > 0 &&
        (err = set_rlimit(RLIMIT_CPU, spec.cpu_soft_seconds, spec.cpu_hard_seconds)))
        return err;
    if (spec.file_size_bytes >= 0 &&
        (err = set_rlimit(RLIMIT_FSIZE, spec.file_size_bytes, spec.file_size_bytes)))
        return err;
    if (spec.no_core_dumps && (err = set_rlimit(RLIMIT_CORE, 0, 0)))
        return err;
    if (spec.max_processes > 0 &&
        (err = set_rlimit(RLIMIT_NPROC, spec.max_processes, spec.max_processes)))
        return err;
    if (spec.max_open_files > 0 &&
        (err = set_rlimit(RLIMIT_NOFILE, spec.max_open_files, spec.max_open_files)))
        return err;
    return 0;
}

static void add_rule(scmp_filter_ctx ctx, uint32_t action, int syscall, const char *name) {
    int ret = seccomp_rule_add(ctx, action, syscall, 0);
    if (ret < 0) LOG(WARNING) << "unable to add seccomp rule for " << name << ": " << strerror(-ret);
}

seccomp_filter::seccomp_filter() {
    scmp_filter_ctx filter = seccomp_init(SCMP_ACT_ALLOW);
    if (!filter) throw internal_error("seccomp_init failed");
    defer { seccomp_release(filter); };

    // 禁止创建新进程，但是允许创建线程（CLONE_THREAD）
    add_rule(filter, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(fork), "fork");
    add_rule(filter, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(vfork), "vfork");
    int ret = seccomp_rule_add(filter, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(clone), 1,
                               SCMP_A0(SCMP_CMP_MASKED_EQ, CLONE_THREAD, 0));
    if (ret < 0) LOG(WARNING) << "unable to add seccomp rule for clone: " << strerror(-ret);
    // clone3 的参数在用户态内存中无法过滤，返回 ENOSYS 让 libc 回退到 clone
    add_rule(filter, SCMP_ACT_ERRNO(ENOSYS), SCMP_SYS(clone3), "clone3");

    // 禁止网络，Unix 域套接字不受影响
    ret = seccomp_rule_add(filter, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                           SCMP_A0(SCMP_CMP_NE, AF_UNIX));
    if (ret < 0) LOG(WARNING) << "unable to add seccomp rule for socket: " << strerror(-ret);
    ret = seccomp_rule_add(filter, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socketpair), 1,
                           SCMP_A0(SCMP_CMP_NE, AF_UNIX));
    if (ret < 0) LOG(WARNING) << "unable to add seccomp rule for socketpair: " << strerror(-ret);

    // seccomp_load 会编译规则并分配内存，不能在 fork 出的子进程中调用，
    // 因此在这里导出编译好的 BPF 程序，子进程只需要 prctl
    int fd = memfd_create("pysandbox-seccomp", MFD_CLOEXEC);
    if (fd < 0) throw_errno(errno, "memfd_create for seccomp program");
    defer { close(fd); };
    ret = seccomp_export_bpf(filter, fd);
    if (ret < 0) throw_errno(-ret, "exporting seccomp program");

    off_t size = lseek(fd, 0, SEEK_END);
    if (size < 0) throw_errno(errno, "measuring seccomp program");
    if (size == 0 || size % sizeof(struct sock_filter) != 0)
        throw internal_error(fmt::format("malformed seccomp program of {} bytes", size));
    program.resize(size / sizeof(struct sock_filter));
    char *data = reinterpret_cast<char *>(program.data());
    for (off_t offset = 0; offset < size;) {
        ssize_t nread = pread(fd, data + offset, size - offset, offset);
        if (nread < 0 && errno == EINTR) continue;
        if (nread <= 0) throw_errno(nread < 0 ? errno : EIO, "reading seccomp program");
        offset += nread;
    }
    VLOG(1) << "seccomp program has " << program.size() << " instructions";
}

size_t seccomp_filter::size() const {
    return program.size();
}

int seccomp_filter::load() const noexcept {
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) return errno;
    struct sock_fprog prog;
    prog.len = (unsigned short)program.size();
    prog.filter = const_cast<struct sock_filter *>(program.data());
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) != 0) return errno;
    return 0;
}

}  // namespace sandbox
