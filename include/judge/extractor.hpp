#pragma once

#include <optional>
#include <string>
#include <vector>
#include "dataset/task.hpp"

namespace codebench {

/**
 * @brief 产生候选代码的提取策略，按照优先级排列
 */
enum class extraction_policy {
    /**
     * @brief 定义了入口符号的第一个 Markdown 代码块
     */
    FENCED_ENTRY_POINT,

    /**
     * @brief 在原始文本中扫描到了入口符号的定义
     */
    ENTRY_POINT_SCAN,

    /**
     * @brief 第一个看起来包含代码的 Python（或未标注语言的）代码块
     */
    FIRST_FENCED_BLOCK,

    /**
     * @brief 在原始文本中扫描到了任意 def/class 定义
     */
    DEFINITION_SCAN,

    /**
     * @brief 没有找到代码
     */
    NONE
};

std::string to_string(extraction_policy policy);

struct extraction_result {
    /**
     * @brief 候选代码，没有找到代码时为空
     */
    std::optional<std::string> code;

    extraction_policy policy = extraction_policy::NONE;

    bool found() const { return code.has_value(); }
};

/**
 * @brief Markdown 代码块
 */
struct fenced_block {
    /**
     * @brief 开始行的 info string，比如 python
     */
    std::string info;

    /**
     * @brief 不包含开始行和结束行的代码块内容
     */
    std::string body;

    /**
     * @brief 代码块是否有结束行，没有结束行的代码块延伸到文本末尾
     */
    bool closed = true;
};

/**
 * @brief 找出文本中所有的 ``` 或 ~~~ 代码块
 * 开始行最多可以缩进 3 个空格，结束行必须使用相同字符且长度不小于开始行
 */
std::vector<fenced_block> find_fenced_blocks(const std::string &text);

/**
 * @brief 删除首尾空行，并删除所有非空行共同的缩进
 */
std::string normalize_code(const std::string &code);

/**
 * @brief 判断代码中是否存在入口符号的定义
 * 函数题和类题都接受 def name( 和 class name，
 * 缩进的 def 也算在内，即顶层类中的同名方法
 */
bool defines_symbol(const std::string &code, const std::string &entry_point);

/**
 * @brief 从模型输出中提取候选代码，按照策略的优先级依次尝试，纯文本处理
 * @param raw 模型的原始输出
 * @param entry_point 入口符号，为空时跳过和入口符号有关的策略
 */
extraction_result extract_code(const std::string &raw, const std::string &entry_point, task_kind kind);

}  // namespace codebench
