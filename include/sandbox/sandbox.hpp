#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace codebench {

struct sandbox_options {
    /**
     * @brief 要执行的命令，command[0] 不含 / 时通过 PATH 查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作路径
     */
    std::filesystem::path work_dir;

    /**
     * @brief 子进程的环境变量，形如 KEY=VALUE
     * 子进程只继承 PATH，其他环境变量都不继承
     */
    std::vector<std::string> env;

    /**
     * @brief 时钟时间限制（单位为秒），不大于 0 表示不限制
     */
    double wall_limit = 8;

    /**
     * @brief CPU 时间限制（单位为秒），不大于 0 表示不限制
     * 到达限制时内核发送 SIGXCPU，1 秒后发送 SIGKILL
     */
    double cpu_limit = 0;

    /**
     * @brief 地址空间限制（单位为字节），0 表示不限制
     */
    size_t memory_limit = 0;

    /**
     * @brief 能写出的最大文件大小（单位为字节），0 表示不限制
     * 超出时内核发送 SIGXFSZ
     */
    size_t file_limit = 0;

    /**
     * @brief 同一用户最大进程数，0 表示不限制
     */
    size_t nproc = 0;

    /**
     * @brief stdout、stderr 各自最多保留的字节数
     */
    size_t stream_size = 1 << 16;

    /**
     * @brief 是否尝试将子进程放入新的网络命名空间
     */
    bool isolate_network = true;

    bool no_core_dumps = true;
};

struct sandbox_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 用户时间（指在用户态下运行的 CPU 时间）
     * 单位为秒，包含所有已经被回收的子进程
     */
    double user_time = -1;

    /**
     * @brief 系统时间（指在内核态下运行的时间）
     * 单位为秒，包含所有已经被回收的子进程
     */
    double sys_time = -1;

    /**
     * @brief 正常退出时的返回值，被信号终止时为 128 + 信号
     */
    int exitcode = -1;

    /**
     * @brief 终止子进程的信号，正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief 是否因为超过时钟时间限制而被终止
     */
    bool timed_out = false;

    /**
     * @brief 是否因为评测被全局中断而被终止
     */
    bool interrupted = false;

    /**
     * @brief 子进程是否成功进入了新的网络命名空间
     */
    bool network_isolated = false;

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

/**
 * @brief 在独立的子进程中运行命令，等待其结束
 * 子进程拥有独立的会话和进程组，结束时整个进程组都会被杀死，
 * 因此候选代码 fork 出来的进程不会留驻系统。
 * 超时或者全局中断时先发送 SIGTERM，0.1 秒后发送 SIGKILL。
 * 本函数可以在多个线程中并发调用。
 * @throw sandbox_error 若无法创建管道、fork 失败或者子进程无法启动命令
 */
sandbox_result run_sandboxed(const sandbox_options &opt);

/**
 * @brief 终止所有正在运行和之后将要运行的沙箱
 * 可以在信号处理函数中调用
 */
void stop_sandboxes();

/**
 * @brief 撤销 stop_sandboxes，之后启动的沙箱正常运行
 */
void resume_sandboxes();

/**
 * @brief 在 PATH 中查找可执行文件
 * @return 可执行文件的路径，找不到时返回空
 */
std::filesystem::path find_executable(const std::string &name);

}  // namespace codebench
