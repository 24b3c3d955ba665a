#include "sandbox/sandbox.hpp"
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <glog/logging.h>
#include <atomic>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/limits.hpp"

namespace codebench {
using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s
const struct timespec polldelay = {0, 50000000L};   // 0.05s

const int BUF_SIZE = 4096;
const int POLL_INTERVAL = 50;  // ms
// 每次最多读取的块数，防止子进程持续输出时阻塞超时检查
const int MAX_CHUNKS_PER_PUMP = 64;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

static atomic<bool> stopped{false};

void stop_sandboxes() {
    stopped = true;
}

void resume_sandboxes() {
    stopped = false;
}

[[noreturn]] static void error(int err, const string &what) {
    throw sandbox_error(what + ": " + strerror(err));
}

filesystem::path find_executable(const string &name) {
    if (name.find('/') != string::npos)
        return access(name.c_str(), X_OK) == 0 ? filesystem::path(name) : filesystem::path();

    vector<string> dirs;
    boost::split(dirs, get_env("PATH", "/usr/local/bin:/usr/bin:/bin"), boost::is_any_of(":"));
    for (const string &dir : dirs) {
        if (dir.empty()) continue;
        filesystem::path candidate = filesystem::path(dir) / name;
        error_code ec;
        if (filesystem::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    return {};
}

static void close_fd(int &fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

static void pump_pipe(int &fd, string &buffer, bool &truncated, size_t limit) {
    char buf[BUF_SIZE];
    for (int chunk = 0; fd >= 0 && chunk < MAX_CHUNKS_PER_PUMP; ++chunk) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            /* Throw away data if we're at the output limit, but
               still consume it so that the child does not block */
            size_t room = limit > buffer.size() ? limit - buffer.size() : 0;
            size_t keep = min((size_t)nread, room);
            buffer.append(buf, keep);
            if (keep < (size_t)nread) truncated = true;
        } else if (nread == 0) {
            /* EOF detected: close fd and indicate this with -1 */
            close_fd(fd);
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        } else {
            error(errno, "reading output of command");
        }
    }
}

/**
 * @brief 先尝试 SIGTERM，再 SIGKILL 整个进程组
 * 子进程可能还没来得及 setsid，因此也直接向子进程发送信号
 */
static void terminate_group(pid_t child_pid) {
    DLOG(INFO) << "sending SIGTERM to process group " << child_pid;
    if (kill(-child_pid, SIGTERM) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGTERM to process group " << child_pid << ": " << strerror(errno);
    kill(child_pid, SIGTERM);

    /* Prefer nanosleep over sleep because of higher resolution and
       it does not interfere with signals. */
    nanosleep(&killdelay, nullptr);

    DLOG(INFO) << "sending SIGKILL to process group " << child_pid;
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to process group " << child_pid << ": " << strerror(errno);
    kill(child_pid, SIGKILL);
}

static string stage_name(child_stage stage) {
    switch (stage) {
        case child_stage::SETSID: return "setsid";
        case child_stage::RLIMIT: return "setrlimit";
        case child_stage::CHDIR: return "chdir";
        case child_stage::REDIRECT: return "redirect";
        case child_stage::EXEC: return "exec";
        default: return "unshare";
    }
}

static void write_report(int fd, child_stage stage, int value) noexcept {
    child_report report{stage, value};
    ssize_t ret;
    do {
        ret = write(fd, &report, sizeof(report));
    } while (ret < 0 && errno == EINTR);
}

sandbox_result run_sandboxed(const sandbox_options &opt) {
    if (opt.command.empty()) throw sandbox_error("empty command");
    filesystem::path executable = find_executable(opt.command[0]);
    if (executable.empty()) throw sandbox_error("command not found: " + opt.command[0]);

    sandbox_result result;
    if (stopped) {
        result.interrupted = true;
        return result;
    }

    // fork 之后子进程中不能分配内存，因此提前准备好所有参数
    string exec_path = executable.string();
    string work_dir = opt.work_dir.string();
    vector<string> env_storage = {"PATH=" + get_env("PATH", "/usr/local/bin:/usr/bin:/bin")};
    env_storage.insert(env_storage.end(), opt.env.begin(), opt.env.end());

    vector<char *> argv, envp;
    for (const string &arg : opt.command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    for (const string &env : env_storage) envp.push_back(const_cast<char *>(env.c_str()));
    envp.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, report_pipe[2] = {-1, -1};
    int devnull = -1;
    defer {
        for (int *fds : {stdout_pipe, stderr_pipe, report_pipe}) {
            close_fd(fds[PIPE_IN]);
            close_fd(fds[PIPE_OUT]);
        }
        close_fd(devnull);
    };

    // 所有描述符都设置 CLOEXEC，避免泄漏给其他 worker 并发启动的子进程
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for stdout");
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for stderr");
    if (pipe2(report_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for child report");
    if ((devnull = open("/dev/null", O_RDONLY | O_CLOEXEC)) < 0) error(errno, "opening /dev/null");

    elapsed_time timer;
    pid_t child_pid = fork();
    if (child_pid < 0) error(errno, "unable to fork");

    if (child_pid == 0) {
        // 子进程中只能调用异步信号安全的函数
        sigset_t emptymask;
        sigemptyset(&emptymask);
        sigprocmask(SIG_SETMASK, &emptymask, nullptr);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);

        if (opt.isolate_network)
            write_report(report_pipe[PIPE_IN], child_stage::NETWORK, isolate_network() ? 1 : 0);

        child_stage stage = child_stage::EXEC;
        int err = set_restrictions(opt, stage);
        if (err == 0 && !work_dir.empty() && chdir(work_dir.c_str()) != 0) {
            err = errno;
            stage = child_stage::CHDIR;
        }
        if (err == 0 && (dup2(devnull, STDIN_FILENO) < 0 ||
                         dup2(stdout_pipe[PIPE_IN], STDOUT_FILENO) < 0 ||
                         dup2(stderr_pipe[PIPE_IN], STDERR_FILENO) < 0)) {
            err = errno;
            stage = child_stage::REDIRECT;
        }
        if (err == 0) {
            execve(exec_path.c_str(), argv.data(), envp.data());
            err = errno;
            stage = child_stage::EXEC;
        }
        write_report(report_pipe[PIPE_IN], stage, err);
        _exit(127);
    }

    bool reaped = false;
    defer {
        // 评测系统内部出错时也要确保子进程组被清理
        if (!reaped) {
            kill(-child_pid, SIGKILL);
            kill(child_pid, SIGKILL);
            waitpid(child_pid, nullptr, 0);
        }
    };

    close_fd(stdout_pipe[PIPE_IN]);
    close_fd(stderr_pipe[PIPE_IN]);
    close_fd(report_pipe[PIPE_IN]);
    close_fd(devnull);

    // 子进程 exec 成功后管道会因为 CLOEXEC 关闭，此时读到 EOF
    while (true) {
        child_report report;
        ssize_t nread = read(report_pipe[PIPE_OUT], &report, sizeof(report));
        if (nread < 0 && errno == EINTR) continue;
        if (nread != (ssize_t)sizeof(report)) break;
        if (report.stage == child_stage::NETWORK) {
            result.network_isolated = report.value != 0;
        } else {
            waitpid(child_pid, nullptr, 0);
            reaped = true;
            throw sandbox_error(fmt::format("unable to start {}: {} failed: {}", opt.command[0], stage_name(report.stage), strerror(report.value)));
        }
    }
    close_fd(report_pipe[PIPE_OUT]);
    if (opt.isolate_network && !result.network_isolated)
        DLOG(INFO) << "network namespace is unavailable, relying on the harness to disable sockets";

    for (int fd : {stdout_pipe[PIPE_OUT], stderr_pipe[PIPE_OUT]}) {
        int flags = fcntl(fd, F_GETFL);
        if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
    }

    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));

    while (!reaped) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        for (int fd : {stdout_pipe[PIPE_OUT], stderr_pipe[PIPE_OUT]})
            if (fd >= 0) fds[nfds++] = {fd, POLLIN, 0};
        if (nfds > 0) {
            if (poll(fds, nfds, POLL_INTERVAL) < 0 && errno != EINTR) error(errno, "waiting for child data");
        } else {
            nanosleep(&polldelay, nullptr);
        }

        pump_pipe(stdout_pipe[PIPE_OUT], result.stdout_data, result.stdout_truncated, opt.stream_size);
        pump_pipe(stderr_pipe[PIPE_OUT], result.stderr_data, result.stderr_truncated, opt.stream_size);

        pid_t pid = wait4(child_pid, &status, WNOHANG, &usage);
        if (pid == child_pid) {
            reaped = true;
            break;
        }
        if (pid < 0 && errno != EINTR) error(errno, "waiting on child");

        if (stopped) {
            result.interrupted = true;
            LOG(WARNING) << "evaluation interrupted: aborting command";
        } else if (opt.wall_limit > 0 && timer.seconds() >= opt.wall_limit) {
            result.timed_out = true;
            LOG(WARNING) << fmt::format("timelimit exceeded (hard wall time {:.3f}s): aborting command", opt.wall_limit);
        } else {
            continue;
        }

        terminate_group(child_pid);
        while (wait4(child_pid, &status, 0, &usage) < 0)
            if (errno != EINTR) error(errno, "waiting on child");
        reaped = true;
    }
    result.wall_time = timer.seconds();

    // 杀死子进程 fork 出来且仍然留驻的进程
    if (kill(-child_pid, SIGKILL) == 0)
        DLOG(INFO) << "killed stray processes of process group " << child_pid;

    pump_pipe(stdout_pipe[PIPE_OUT], result.stdout_data, result.stdout_truncated, opt.stream_size);
    pump_pipe(stderr_pipe[PIPE_OUT], result.stderr_data, result.stderr_truncated, opt.stream_size);

    result.user_time = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6;
    result.sys_time = usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exitcode = result.signal + 128;
        if (!result.timed_out && !result.interrupted)
            LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    } else {
        throw sandbox_error(fmt::format("unknown status: {:x}", status));
    }

    return result;
}

}  // namespace codebench
