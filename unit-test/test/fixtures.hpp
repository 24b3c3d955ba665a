#pragma once

#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <string>
#include <vector>
#include "config.hpp"
#include "dataset/task.hpp"

/**
 * @brief 测试中使用的题目：两数之和，测试为 check(candidate) 形式的 Python 代码
 */
inline codebench::benchmark_task make_add_task(const std::string &id = "add/0") {
    codebench::benchmark_task task;
    task.id = id;
    task.prompt = "def add(a, b):\n    \"\"\"Return the sum of a and b. You must handle negative numbers.\"\"\"\n";
    task.reference_solution = "def add(a, b):\n    return a + b\n";
    task.entry_point = "add";
    task.tests = "def check(candidate):\n    assert candidate(1, 2) == 3\n    assert candidate(-5, 5) == 0\n";
    task.kind = codebench::task_kind::FUNCTION;
    return task;
}

inline codebench::model_response make_response(const std::string &task_id, const std::string &model, const std::string &text) {
    codebench::model_response response;
    response.task_id = task_id;
    response.model = model;
    response.provider = "mock";
    response.raw_text = text;
    return response;
}

inline std::string fenced(const std::string &code) {
    return "Here is my solution:\n\n```python\n" + code + "```\n\nIt runs in O(1).";
}

/**
 * @brief 每个测试独占的临时目录，析构时删除
 */
struct scoped_temp_dir {
    std::filesystem::path path;

    explicit scoped_temp_dir(const std::string &name)
        : path(std::filesystem::temp_directory_path() / ("codebench-" + name + "-" + std::to_string(::getpid()))) {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~scoped_temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

inline std::vector<std::string> read_lines(const std::filesystem::path &path) {
    std::vector<std::string> lines;
    std::ifstream fin(path);
    std::string line;
    while (std::getline(fin, line))
        if (!line.empty()) lines.push_back(line);
    return lines;
}

inline codebench::evaluation_config fast_config() {
    codebench::evaluation_config config;
    config.sandbox.time_limit = 5;
    config.workers = 2;
    return config;
}
