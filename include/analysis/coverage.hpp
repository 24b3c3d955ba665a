#pragma once

#include <boost/regex.hpp>
#include <map>
#include <ostream>
#include <string>
#include <vector>
#include "config.hpp"
#include "dataset/task.hpp"

namespace codebench {

/**
 * @brief 测试覆盖类别
 * 每个类别对应一个作用于测试文本的正则表达式，
 * 只要测试文本中存在一处匹配，就认为测试覆盖了该类别。
 */
struct coverage_category {
    /**
     * @brief 类别的键，同时作为 CSV 的列名和难度分析的指标名，比如 has_negative
     */
    std::string key;

    /**
     * @brief 报告中显示的名字，比如 Negatives
     */
    std::string readable;

    boost::regex pattern;
};

/**
 * @brief 全部覆盖类别，顺序固定
 */
const std::vector<coverage_category> &coverage_categories();

/**
 * @brief 统计测试文本中 assert 语句的个数
 */
size_t count_asserts(const std::string &source);

/**
 * @brief 对测试文本运行全部类别的检测
 * @return 类别键到是否覆盖的映射
 */
std::map<std::string, bool> detect_patterns(const std::string &source);

/**
 * @brief 单个题目的覆盖情况
 */
struct coverage_profile {
    std::string task_id;
    std::string entry_point;
    size_t num_asserts = 0;

    /**
     * @brief 启用的类别是否被覆盖
     */
    std::map<std::string, bool> flags;

    size_t covered() const;

    /**
     * @brief 覆盖率 = 覆盖的类别数 / 启用的类别数，没有启用任何类别时为 0
     */
    double ratio() const;
};

/**
 * @brief 整个数据集上各个类别的覆盖次数
 */
struct coverage_summary {
    size_t tasks = 0;
    std::map<std::string, size_t> covered;
};

class coverage_analyzer {
public:
    /**
     * @throw config_error 若配置中包含未知的类别
     */
    explicit coverage_analyzer(const coverage_config &config);

    /**
     * @brief 启用的类别，按照 coverage_categories() 的顺序
     */
    const std::vector<const coverage_category *> &enabled() const { return categories; }

    coverage_profile analyze(const benchmark_task &task) const;

    coverage_summary aggregate(const std::vector<coverage_profile> &profiles) const;

    /**
     * @brief 每个题目一行：task_id、entry_point、num_asserts 以及启用的类别
     */
    void write_csv(std::ostream &os, const std::vector<coverage_profile> &profiles) const;

    /**
     * @brief Markdown 格式的缺口报告：类别覆盖统计，以及前 excerpt 个题目覆盖和缺失的类别
     */
    void write_markdown(std::ostream &os, const std::vector<coverage_profile> &profiles, size_t excerpt = 20) const;

    /**
     * @brief 在控制台输出类别覆盖统计，以及前 excerpt 个题目缺失的类别
     */
    void print_summary(std::ostream &os, const std::vector<coverage_profile> &profiles, size_t excerpt = 10) const;

private:
    std::vector<const coverage_category *> categories;

    std::vector<std::string> missing_categories(const coverage_profile &profile) const;
};

}  // namespace codebench
