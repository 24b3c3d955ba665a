#pragma once

#include <string>

namespace codebench {

/**
 * @brief 表示一个 (题目, 模型) 评测对的最终结果
 */
enum class status {
    /**
     * @brief 候选代码通过了全部测试
     * 要求评测脚本写出结果文件且返回 E_PASS，缺一不可
     */
    PASS = 0,

    /**
     * @brief 测试断言失败（AssertionError）
     */
    FAIL = 1,

    /**
     * @brief 候选代码无法评测或运行时抛出了测试没有预期的异常
     * 包括：无法提取代码、语法错误、入口符号缺失、资源超限、评测系统内部错误
     */
    ERROR = 2,

    /**
     * @brief 候选代码运行超出时钟时间或 CPU 时间限制
     * 超时的子进程会被强制终止，超时永远不会被记为 ERROR
     */
    TIMEOUT = 3
};

const char *get_display_message(status);

/**
 * @brief 评测报告中使用的小写状态名
 */
const char *to_string(status);

/**
 * @brief 解析报告中的状态名
 * @throw std::invalid_argument 若状态名不合法
 */
status status_from_string(const std::string &name);

}  // namespace codebench
