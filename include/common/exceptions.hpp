#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace codebench {

struct bench_exception : std::exception {
    bench_exception();
    explicit bench_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const bench_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 比如 fork、pipe 失败，这类错误只影响当前的评测对
 */
struct internal_error : public bench_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示无法从模型输出中提取出候选代码
 */
struct extraction_error : public bench_exception {
    extraction_error();
    explicit extraction_error(const std::string &message);
};

/**
 * @brief 表示 Task Adapter 无法构造可执行单元
 * 语法错误、入口符号缺失、题目没有可运行的测试是不同的错误，由 kind 区分
 */
struct adapter_error : public bench_exception {
    enum class error_kind {
        SYNTAX_ERROR,
        MISSING_SYMBOL,
        NO_TESTS
    };

    adapter_error(error_kind kind, const std::string &message);

    error_kind kind;
};

/**
 * @brief 表示沙箱启动子进程失败
 */
struct sandbox_error : public internal_error {
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief 表示评测报告文件读写失败
 * 报告流丢失无法恢复，调用方必须终止进程
 */
struct report_io_error : public bench_exception {
    explicit report_io_error(const std::string &message);
};

/**
 * @brief 表示配置文件格式不正确
 */
struct config_error : public bench_exception {
    explicit config_error(const std::string &message);
};

/**
 * @brief 表示评测被全局中断，当前评测对不写入报告
 */
struct interrupted_error : public bench_exception {
    interrupted_error();
};

}  // namespace codebench
