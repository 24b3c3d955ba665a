#pragma once

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "analysis/python_ast.hpp"
#include "dataset/task.hpp"

namespace codebench {

constexpr const char *HARNESS_FILE = "harness.py";
constexpr const char *CANDIDATE_FILE = "candidate.py";
constexpr const char *TESTS_FILE = "tests.py";
constexpr const char *CASES_FILE = "cases.json";
constexpr const char *UNIT_FILE = "unit.json";
constexpr const char *RESULT_FILE = "result.json";

/**
 * @brief 一个可以直接交给沙箱运行的评测单元
 * 沙箱将 files 写入运行文件夹后执行 python harness.py
 */
struct executable_unit {
    /**
     * @brief 文件名到文件内容的映射，文件名不含路径
     */
    std::map<std::string, std::string> files;

    /**
     * @brief 入口脚本的文件名
     */
    std::string entry_script = HARNESS_FILE;
};

/**
 * @brief 入口符号在候选代码中的位置
 */
struct symbol_location {
    /**
     * @brief 若入口符号是顶层类中的方法（比如 LeetCode 风格的 Solution 类），为类名
     */
    std::optional<std::string> owner_class;
};

/**
 * @brief 查找模块顶层绑定的名字
 * 函数、类定义，赋值，import 别名都算作绑定，
 * 顶层的 if、try、with 语句块中的绑定也算在内
 */
bool binds_top_level_name(const syntax_node &module, const std::string &name);

/**
 * @brief 表示一种题目执行约定的适配逻辑
 * 负责检查候选代码，并将候选代码和测试组装成评测单元
 */
struct task_adapter {
    virtual ~task_adapter() = default;

    /**
     * @brief 适配器负责的题目类型
     */
    virtual task_kind kind() const = 0;

    /**
     * @brief 组装评测单元
     * @param task 题目，调用方保证 task.kind == kind()
     * @param candidate 提取出的候选代码
     * @throw adapter_error 若候选代码存在语法错误、缺少入口符号或者题目没有测试
     */
    executable_unit build(const benchmark_task &task, const std::string &candidate) const;

protected:
    /**
     * @brief 在候选代码的语法树中查找入口符号
     * @return 入口符号的位置，找不到时返回空
     */
    virtual std::optional<symbol_location> locate(const syntax_node &module, const std::string &entry_point) const = 0;

    /**
     * @brief 评测脚本中和题目类型相关的部分
     * 必须定义 resolve_entry_point(candidate, unit) 和 run_cases(target, cases)
     */
    virtual std::string harness_section() const = 0;
};

/**
 * @brief 函数题：评测脚本取出入口函数并调用
 */
struct function_adapter : public task_adapter {
    task_kind kind() const override;

protected:
    std::optional<symbol_location> locate(const syntax_node &module, const std::string &entry_point) const override;
    std::string harness_section() const override;
};

/**
 * @brief 类题：评测脚本将类对象交给测试，由测试构造对象
 */
struct class_adapter : public task_adapter {
    task_kind kind() const override;

protected:
    std::optional<symbol_location> locate(const syntax_node &module, const std::string &entry_point) const override;
    std::string harness_section() const override;
};

/**
 * @brief 注册适配器，必须在评测开始前完成注册
 */
void register_adapter(std::unique_ptr<task_adapter> &&adapter);

/**
 * @brief 根据题目类型获取适配器，可以并发调用
 * @throw std::out_of_range 若该类型没有注册适配器
 */
const task_adapter &get_adapter(task_kind kind);

/**
 * @brief 注册函数题和类题的适配器
 */
void register_default_adapters();

}  // namespace codebench
