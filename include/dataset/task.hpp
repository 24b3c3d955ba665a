#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace codebench {

/**
 * @brief 题目的执行约定
 */
enum class task_kind {
    /**
     * @brief 候选代码定义一个函数（或者顶层类中的一个方法），测试直接调用该函数
     */
    FUNCTION,

    /**
     * @brief 候选代码定义一个类，测试构造该类的对象并依次调用方法
     * 比如 MinStack、LRUCache
     */
    CLASS
};

std::string to_string(task_kind kind);

/**
 * @brief 一道题目，加载后不再修改
 */
struct benchmark_task {
    std::string id;

    /**
     * @brief 题面，数据集中可能是字符串或者字符串列表，统一转换为文本
     */
    std::string prompt;

    /**
     * @brief 参考代码，难度分析的输入，也可以作为候选代码检查测试本身是否正确
     */
    std::string reference_solution;

    /**
     * @brief 入口符号：函数名或者类名
     */
    std::string entry_point;

    /**
     * @brief 测试
     * 字符串表示可执行的 Python 测试代码（定义 check(candidate) 或者顶层 assert），
     * 列表表示结构化测试数据 [{"input": ..., "output": ...}, ...]
     */
    nlohmann::json tests;

    task_kind kind = task_kind::FUNCTION;

    /**
     * @brief 测试是否为结构化测试数据
     */
    bool has_structured_tests() const;

    /**
     * @brief 测试的文本形式，供覆盖分析和难度分析使用
     */
    std::string test_source() const;
};

/**
 * @brief 模型调用层返回的一条输出
 */
struct model_response {
    std::string task_id;
    std::string model;
    std::string provider;

    /**
     * @brief 模型的原始输出文本
     */
    std::string raw_text;

    /**
     * @brief 模型调用失败时的错误类型，比如 timeout、rate_limit
     * 存在该字段时 raw_text 无意义
     */
    std::optional<std::string> failure_type;
    std::string failure_message;

    /**
     * @brief 输出文件中内嵌的题目（raw_item），数据集中找不到题目时使用
     */
    std::shared_ptr<benchmark_task> embedded_task;
};

/**
 * @brief 判断结构化测试数据是否为类题目
 * 类题目的第一个输入形如 [["ClassName", "method", ...], [[args], ...]]
 */
bool is_class_based_cases(const nlohmann::json &tests);

/**
 * @brief 将 JSON 值渲染为 Python 字面量
 * null 渲染为 None，布尔值渲染为 True/False，字符串使用单引号并转义
 */
std::string to_python_literal(const nlohmann::json &value);

/**
 * @brief 将题面或者测试字段转换为文本
 * 字符串原样返回，列表的每一项渲染为 Python 字面量后用空行连接
 */
std::string to_source_text(const nlohmann::json &value);

void from_json(const nlohmann::json &j, benchmark_task &task);
void from_json(const nlohmann::json &j, model_response &response);

/**
 * @brief 读取 JSONL 格式的数据集
 * 格式错误的行会被记录日志并跳过，重复的题目编号只保留第一个
 * @throw std::system_error 若文件无法打开
 */
std::vector<benchmark_task> load_tasks(const std::filesystem::path &path);

/**
 * @brief 读取 JSONL 格式的模型输出，格式错误的行会被记录日志并跳过
 * @throw std::system_error 若文件无法打开
 */
std::vector<model_response> load_responses(const std::filesystem::path &path);

/**
 * @brief 按照题目编号建立索引
 */
std::map<std::string, benchmark_task> index_tasks(const std::vector<benchmark_task> &tasks);

}  // namespace codebench
