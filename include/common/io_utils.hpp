#pragma once

#include <filesystem>
#include <string>

namespace boxjudge {

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
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw std::system_error 文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，提交 id、题目 id
 * 都会被拼接进路径中，如果包含 "../" 或者 "/"，那么最后有可能
 * 读写到运行目录以外的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 在作用域结束时递归删除的文件夹
 * 只能移动，不能复制。release 可以重复调用
 */
struct scoped_directory {
    scoped_directory();
    explicit scoped_directory(const std::filesystem::path &path);
    scoped_directory(scoped_directory &&);
    ~scoped_directory();

    scoped_directory &operator=(scoped_directory &&);

    const std::filesystem::path &path() const;

    /**
     * @brief 不再在析构时删除文件夹，用于保留现场调试
     */
    void keep();

    /**
     * @brief 删除文件夹
     * @return 文件夹已经不存在时返回 true，删除失败时返回 false 并记录日志
     */
    bool release();

private:
    std::filesystem::path dir;
    bool valid = false;
};

}  // namespace boxjudge
