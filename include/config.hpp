#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace codebench {

/**
 * @brief 评测脚本 harness.py 的返回值
 * 评测系统根据返回值和结果文件共同判断评测结果，
 * 返回值必须和 harness 模板中的常量保持一致
 */
enum error_codes {
    E_SUCCESS = 0,
    E_INTERNAL_ERROR = 2,

    E_PASS = 42,
    E_FAIL = 43,
    E_ERROR = 44
};

/**
 * @brief 候选代码的运行根目录
 * 每次运行都会在 RUN_DIR 下创建一个随机 uuid 命名的文件夹：
 *
 * RUN_DIR
 * ├── 5f0c...e1 // 本次运行的文件夹
 * │   ├── harness.py // 评测脚本，由 Task Adapter 生成
 * │   ├── candidate.py // 候选代码
 * │   ├── tests.py // 测试代码（或 cases.json 结构化测试数据）
 * │   ├── unit.json // 评测脚本的配置：题目类型、入口符号
 * │   └── result.json // 评测脚本写出的结果：状态、异常类名、异常信息
 * └── ...
 *
 * 运行结束后文件夹会被删除，除非开启了 DEBUG 模式。
 * @defaultValue 系统临时目录下的 codebench 文件夹
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 运行候选代码的 Python 解释器，通过 PATH 查找
 */
extern std::string PYTHON_EXECUTABLE;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统不会删除候选代码的运行文件夹，
 * 以便手动检查生成的评测脚本是否符合预期。
 */
extern bool DEBUG;

/**
 * @brief 沙箱资源限制
 */
struct sandbox_config {
    /**
     * @brief 时钟时间限制（单位为秒）
     * 超过该时间后子进程组会被强制终止，评测结果为 Timeout
     */
    double time_limit = 8;

    /**
     * @brief 地址空间限制（单位为 KB），0 表示不限制
     */
    size_t memory_limit = 1 << 20;  // 1G

    /**
     * @brief 候选代码能写出的最大文件大小（单位为 KB），0 表示不限制
     */
    size_t file_limit = 1 << 16;  // 64M

    /**
     * @brief 同一用户能同时存在的最大进程数，0 表示不限制
     */
    size_t proc_limit = 512;

    /**
     * @brief stdout、stderr 各自最多保留多少字节（单位为 KB）
     * 超出部分会被丢弃，但子进程仍然可以继续写
     */
    size_t stream_size = 64;

    /**
     * @brief 是否将子进程放入新的网络命名空间
     * 内核不允许时降级为由评测脚本禁用 socket 模块
     */
    bool isolate_network = true;
};

enum class resume_mode {
    /**
     * @brief 已经存在于报告中的评测对不再评测
     */
    SKIP,

    /**
     * @brief 已经存在于报告中的评测对重新评测，并删除旧的记录
     */
    OVERWRITE
};

struct evaluation_config {
    sandbox_config sandbox;

    /**
     * @brief 同时评测的 worker 数量
     */
    size_t workers = 1;

    /**
     * @brief 是否开启多次运行投票
     * 默认不重试，每个评测对只运行一次
     */
    bool voting = false;

    /**
     * @brief 开启投票时每个评测对运行的次数
     */
    size_t trials = 3;

    resume_mode resume = resume_mode::SKIP;
};

struct difficulty_config {
    /**
     * @brief 各个指标的权重，键为指标名，参见 difficulty.hpp
     */
    std::map<std::string, double> weights;

    /**
     * @brief Easy/Medium、Medium/Hard、Hard/Challenging 的分界线，必须严格递增
     */
    std::vector<double> thresholds = {6.0, 12.0, 18.0};

    difficulty_config();
};

struct coverage_config {
    /**
     * @brief 参与统计的覆盖类别，参见 coverage.hpp
     * 为空时统计全部类别
     */
    std::vector<std::string> categories;
};

struct configuration {
    evaluation_config evaluation;
    difficulty_config difficulty;
    coverage_config coverage;
};

void from_json(const nlohmann::json &j, sandbox_config &config);
void from_json(const nlohmann::json &j, evaluation_config &config);
void from_json(const nlohmann::json &j, difficulty_config &config);
void from_json(const nlohmann::json &j, coverage_config &config);
void from_json(const nlohmann::json &j, configuration &config);

/**
 * @brief 读取 JSON 配置文件，缺省的项使用默认值
 * @throw config_error 若配置文件不存在或格式不正确
 */
configuration load_configuration(const std::filesystem::path &config_path);

/**
 * @brief 检查配置之间的约束
 * @throw config_error 若 workers、trials 为 0，或者分界线不严格递增等
 */
void validate_configuration(const configuration &config);

}  // namespace codebench
