#pragma once

#include <filesystem>
#include <string>

namespace codebench {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将 content 写入文件，覆盖原有内容
 * @throw std::system_error 若无法打开或写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将不合法的 UTF-8 字节替换为 '?'
 * 子进程的输出可能是任意字节，写入 JSON 之前必须先清理
 */
std::string utf8_sanitize(const std::string &string);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 可执行单元的文件名最终会拼接到运行目录下，
 * 如果文件名包含 "../" 或者是绝对路径，可能导致写到运行目录之外。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 将字段转义为 CSV 格式
 * 包含逗号、引号或者换行的字段用双引号包裹，内部的双引号写两次
 */
std::string csv_escape(const std::string &field);

struct scoped_file_lock {
    scoped_file_lock();
    explicit scoped_file_lock(const std::filesystem::path &path);
    scoped_file_lock(scoped_file_lock &&);
    ~scoped_file_lock();

    scoped_file_lock &operator=(scoped_file_lock &&);

    void release();

private:
    int fd = -1;
    bool valid = false;
};

/**
 * @brief 对文件加锁
 * 通过对 path + ".lock" 文件加 flock 实现，不阻塞：
 * 若锁已被其他进程持有，直接抛出异常。
 * 用于避免两个评测进程同时追加同一个报告文件。
 * @param path 要被加锁的文件
 * @return 文件锁
 * @throw std::system_error 若锁已被占用
 */
scoped_file_lock lock_file_exclusive(const std::filesystem::path &path);

}  // namespace codebench
