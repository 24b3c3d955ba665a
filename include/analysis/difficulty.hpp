#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>
#include "analysis/python_ast.hpp"
#include "config.hpp"
#include "dataset/task.hpp"

namespace codebench {

/**
 * @brief 参考代码的结构特征
 */
struct code_metrics {
    size_t branching = 0;          // If
    size_t loop = 0;               // For、While
    size_t try_count = 0;          // Try
    size_t raise = 0;              // Raise
    size_t call = 0;               // Call
    size_t comprehension = 0;      // ListComp、DictComp、SetComp、GeneratorExp
    size_t recursion_calls = 0;
    size_t max_nesting_depth = 0;  // If、For、While、Try、With、FunctionDef、AsyncFunctionDef 的最大嵌套层数

    bool has_recursion() const { return recursion_calls > 0; }
    bool has_exception_handling() const { return try_count > 0; }
};

/**
 * @brief 统计语法树的结构特征
 * 递归调用包括对入口函数的调用，以及在函数体内对当前所在函数（或其外层函数）的调用，
 * 方法内的 self.method(...) 也算作递归调用。
 * @param module parse_python 返回的 Module 节点
 * @param entry_point 入口符号，可以为空
 */
code_metrics analyze_code(const syntax_node &module, const std::string &entry_point);

/**
 * @brief 题面特征
 */
struct prompt_metrics {
    /**
     * @brief 题面的字符数（UTF-8 码点数）
     */
    size_t prompt_length = 0;

    /**
     * @brief 约束词出现的次数，不区分大小写，按子串计数
     */
    size_t constraint_markers = 0;
};

/**
 * @brief 约束词表：must、should、always、never、edge case 等
 */
const std::vector<std::string> &constraint_words();

prompt_metrics analyze_prompt(const std::string &prompt);

/**
 * @brief 测试特征：断言数以及覆盖类别的检测结果
 */
struct test_metrics {
    size_t num_asserts = 0;
    std::map<std::string, bool> flags;
};

test_metrics analyze_tests(const std::string &source);

enum class confidence {
    /**
     * @brief 参考代码可以解析，全部指标有效
     */
    HIGH,

    /**
     * @brief 参考代码无法解析，代码指标全部为 0，分数只由题面和测试决定
     */
    LOW
};

const char *to_string(confidence value);

/**
 * @brief 单个题目的难度分析结果，对应难度报告中的一行
 */
struct difficulty_row {
    std::string task_id;
    std::string entry_point;
    code_metrics code;
    prompt_metrics prompt;
    test_metrics tests;
    double score = 0;
    std::string category;
    confidence level = confidence::HIGH;

    /**
     * @brief 全部指标，键与 difficulty_config::weights 的键一致，布尔指标为 0 或 1
     */
    std::map<std::string, double> metrics() const;
};

/**
 * @brief 加权线性组合，保留两位小数
 * 不在 weights 中的指标不参与计算
 */
double difficulty_score(const std::map<std::string, double> &metrics, const std::map<std::string, double> &weights);

/**
 * @brief 根据分界线划分难度：Easy、Medium、Hard、Challenging
 * @param thresholds 严格递增的 3 个分界线，分数小于第一个分界线为 Easy，依次类推
 */
std::string category_for_score(double score, const std::vector<double> &thresholds);

/**
 * @brief 静态分析题目的难度，只读取题目数据，不运行任何代码
 * 参考代码无法解析时不会抛出异常，而是返回 LOW 置信度的结果
 */
difficulty_row analyze_difficulty(const benchmark_task &task, const difficulty_config &config);

/**
 * @brief 写出 CSV 格式的难度报告，每个题目一行
 */
void write_difficulty_csv(std::ostream &os, const std::vector<difficulty_row> &rows);

}  // namespace codebench
