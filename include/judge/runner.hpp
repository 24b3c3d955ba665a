#pragma once

#include "config.hpp"
#include "judge/adapter.hpp"
#include "judge/outcome.hpp"
#include "sandbox/sandbox.hpp"

namespace codebench {

/**
 * @brief 在沙箱中运行一次评测单元
 * 评测单元的文件写入 RUN_DIR 下随机命名的运行文件夹，运行结束后删除（DEBUG 模式除外）。
 * @return 根据结果文件、返回值和终止信号判断出的评测结果
 * @throw interrupted_error 若评测被全局中断
 * @throw sandbox_error 若无法启动子进程
 * @throw std::system_error 若无法写入运行文件夹
 */
execution_outcome run_unit(const executable_unit &unit, const sandbox_config &config);

/**
 * @brief 根据沙箱运行结果和评测脚本写出的结果判断评测结果
 * @param result 沙箱的运行结果
 * @param harness_result 评测脚本写出的 result.json 的内容，评测脚本没有写出时为 null
 */
execution_outcome classify(const sandbox_result &result, const nlohmann::json &harness_result);

/**
 * @brief 根据配置生成沙箱参数
 */
sandbox_options make_sandbox_options(const sandbox_config &config);

}  // namespace codebench
