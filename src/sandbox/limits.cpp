#include "sandbox/limits.hpp"
#include <errno.h>
#include <math.h>
#include <sched.h>
#include <sys/resource.h>
#include <unistd.h>

namespace codebench {

static int set_rlimit(int resource, rlim_t cur, rlim_t max) noexcept {
    struct rlimit lim;
    if (getrlimit(resource, &lim) != 0) return errno;
    // 非特权进程不能提高硬限制，已有的限制更严格时保持不变
    if (lim.rlim_max != RLIM_INFINITY && max > lim.rlim_max) max = lim.rlim_max;
    if (cur > max) cur = max;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    return setrlimit(resource, &lim) != 0 ? errno : 0;
}

bool isolate_network() noexcept {
    if (unshare(CLONE_NEWNET) == 0) return true;
    // 非 root 用户只能在新的用户命名空间中创建网络命名空间
    return unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0;
}

int set_restrictions(const sandbox_options &opt, child_stage &failed_stage) noexcept {
    // run the command in a separate session and process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1) {
        failed_stage = child_stage::SETSID;
        return errno;
    }

    failed_stage = child_stage::RLIMIT;
    int err = 0;

    if (opt.cpu_limit > 0) {
        /* Setting the real hard limit one second
           higher: at the soft limit the kernel will send SIGXCPU at
           the hard limit a SIGKILL. The SIGXCPU can be caught, but is
           not by default and gives us a reliable way to detect if the
           CPU-time limit was reached. */
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit);
        if ((err = set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1))) return err;
    }

    if (opt.memory_limit > 0 && (err = set_rlimit(RLIMIT_AS, opt.memory_limit, opt.memory_limit))) return err;
    if (opt.file_limit > 0 && (err = set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit))) return err;
    if (opt.nproc > 0 && (err = set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc))) return err;
    if (opt.no_core_dumps && (err = set_rlimit(RLIMIT_CORE, 0, 0))) return err;

    return 0;
}

}  // namespace codebench
