#pragma once

#include "sandbox/sandbox.hpp"

namespace codebench {

/**
 * @brief 子进程启动失败的阶段
 */
enum class child_stage : int {
    NETWORK = 0,
    SETSID,
    RLIMIT,
    CHDIR,
    REDIRECT,
    EXEC
};

/**
 * @brief 子进程通过管道报告给父进程的信息
 */
struct child_report {
    child_stage stage;

    /**
     * @brief 对于 NETWORK 为是否成功隔离网络，其他阶段为 errno
     */
    int value;
};

/**
 * @brief 将当前进程放入新的网络命名空间
 * 先尝试 CLONE_NEWNET，没有权限时尝试同时创建新的用户命名空间。
 * 只能在 fork 出的子进程中调用，只使用异步信号安全的系统调用。
 * @return true 若成功隔离网络
 */
bool isolate_network() noexcept;

/**
 * @brief 限制当前进程的资源使用，并将当前进程放入新的会话
 * 只能在 fork 出的子进程中调用，只使用异步信号安全的系统调用。
 * @param failed_stage 失败时写入失败的阶段
 * @return 0 表示成功，否则为 errno
 */
int set_restrictions(const sandbox_options &opt, child_stage &failed_stage) noexcept;

}  // namespace codebench
