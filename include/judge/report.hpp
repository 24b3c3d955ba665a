#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "judge/outcome.hpp"

namespace codebench {

/**
 * @brief 评测对的键：(题目编号, 模型)
 */
typedef std::pair<std::string, std::string> pair_key;

/**
 * @brief 逐行追加的 JSONL 评测报告
 * 报告只有一个写者，打开时对报告加文件锁，避免多个评测进程同时写入。
 * 每写一行都会立即 flush，因此进程被杀死时最多留下最后一行不完整的记录，
 * 下次打开时会被截断。
 */
class report_writer {
public:
    /**
     * @brief 打开报告，必要时截断不完整的最后一行，并读取已有的评测记录
     * @throw report_io_error 若报告被其他进程占用或者无法读写
     */
    explicit report_writer(const std::filesystem::path &path);

    virtual ~report_writer() = default;

    report_writer(const report_writer &) = delete;
    report_writer &operator=(const report_writer &) = delete;

    /**
     * @brief 报告中已经存在的评测对
     */
    const std::set<pair_key> &existing_pairs() const;

    /**
     * @brief 报告中已经存在的、可以解析的评测记录
     */
    const std::vector<evaluation_record> &existing_records() const;

    /**
     * @brief 删除报告中属于 pairs 的所有行
     * 剩余的行写入临时文件后原子地替换报告，用于 overwrite 模式的重新评测
     * @throw report_io_error 若无法写入或替换报告
     */
    void discard(const std::set<pair_key> &pairs);

    /**
     * @brief 追加一条评测记录并 flush
     * @throw report_io_error 若写入失败，调用方必须终止评测
     */
    virtual void write(const evaluation_record &record);

private:
    std::filesystem::path path;
    scoped_file_lock lock;
    std::ofstream out;

    /**
     * @brief 报告中已有的完整行，按照原文保存，以便 discard 时原样写回
     */
    std::vector<std::string> lines;
    std::vector<std::optional<pair_key>> line_keys;

    std::set<pair_key> pairs;
    std::vector<evaluation_record> records;

    void load();
    void open_for_append();
};

}  // namespace codebench
