#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace codebench {

/**
 * @brief 一次运行（或者投票后）的评测结果
 */
struct execution_outcome {
    status result = status::ERROR;

    /**
     * @brief 异常类名或者错误分类，比如 ZeroDivisionError、no_code_extracted、internal_error
     * PASS 时为空
     */
    std::string error_class;

    std::string message;

    /**
     * @brief 超出限制的资源：memory、file_size、processes、output，没有时为空
     */
    std::string resource;

    /**
     * @brief 运行耗费的时钟时间（单位为秒），包含所有投票运行
     */
    double duration = 0;

    /**
     * @brief 子进程输出的片段，用于排查错误
     */
    std::string stdout_excerpt;
    std::string stderr_excerpt;
};

execution_outcome make_error(const std::string &error_class, const std::string &message);

/**
 * @brief 一个 (题目, 模型) 评测对的最终记录，写入评测报告后不再修改
 */
struct evaluation_record {
    std::string task_id;
    std::string model;
    std::string provider;

    execution_outcome outcome;

    /**
     * @brief 运行次数，不投票时为 1，提取或适配失败时为 0
     */
    size_t trials = 1;

    /**
     * @brief 开启投票时每种状态的票数
     */
    std::map<status, size_t> votes;
};

void to_json(nlohmann::json &j, const evaluation_record &record);
void from_json(const nlohmann::json &j, evaluation_record &record);

/**
 * @brief 多次运行的投票结果
 */
struct vote_result {
    execution_outcome outcome;
    std::map<status, size_t> votes;
};

/**
 * @brief 对多次独立运行的结果进行投票
 * 得票最多的状态获胜，获胜结果的异常类名、信息取自第一个该状态的运行。
 * 票数并列第一时判为 FAIL。
 * @param trials 至少包含一个运行结果
 */
vote_result vote(const std::vector<execution_outcome> &trials);

}  // namespace codebench
