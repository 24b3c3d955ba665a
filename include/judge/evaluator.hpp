#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "config.hpp"
#include "dataset/task.hpp"
#include "judge/outcome.hpp"
#include "judge/report.hpp"

namespace codebench {

/**
 * @brief 单个模型的评测统计
 */
struct model_summary {
    size_t total = 0;
    size_t passed = 0;
    size_t failed = 0;
    size_t errors = 0;
    size_t timeouts = 0;

    double pass_rate() const;
};

/**
 * @brief 各个模型的通过率
 * 由报告线程独占，通过 record_outcome 返回更新后的副本，不存在全局状态
 */
struct pass_rate_table {
    std::map<std::string, model_summary> models;
};

/**
 * @brief 将一条评测记录计入统计
 * @return 更新后的统计
 */
pass_rate_table record_outcome(pass_rate_table table, const evaluation_record &record);

/**
 * @brief 输出每个模型的统计结果
 */
void print_summary(std::ostream &os, const pass_rate_table &table);

/**
 * @brief 评测一个 (题目, 模型) 评测对：提取代码、组装评测单元、在沙箱中运行
 * 每个阶段的失败都被隔离成 ERROR 记录，不会影响其他评测对
 * @throw interrupted_error 若评测被全局中断，此时不应写入报告
 */
evaluation_record evaluate_pair(const benchmark_task &task, const model_response &response, const evaluation_config &config);

/**
 * @brief 并发评测所有模型输出，并将结果逐行写入报告
 * 模型输出中题目编号在数据集中不存在、也没有内嵌题目的会被跳过；
 * 同一个评测对出现多次时只评测一次；
 * 报告中已经存在的评测对根据 config.resume 跳过或者重新评测。
 * @return 各个模型的通过率，包含报告中已有的记录
 * @throw report_io_error 若报告无法写入，此时评测已经停止
 */
pass_rate_table run_evaluation(const std::vector<benchmark_task> &tasks,
                               const std::vector<model_response> &responses,
                               const evaluation_config &config,
                               const std::filesystem::path &report_path);

/**
 * @brief 同上，写入已经打开的报告
 */
pass_rate_table run_evaluation(const std::vector<benchmark_task> &tasks,
                               const std::vector<model_response> &responses,
                               const evaluation_config &config,
                               report_writer &writer);

/**
 * @brief 停止评测：worker 不再领取新的评测对，正在运行的沙箱被终止
 * 可以在信号处理函数中调用
 */
void stop_evaluation();

bool evaluation_stopped();

/**
 * @brief 清除停止标记，使同一进程可以再次开始评测
 */
void reset_evaluation();

}  // namespace codebench
