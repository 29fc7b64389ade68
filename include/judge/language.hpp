#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

/**
 * 这个头文件包含语言配置
 * 包含：
 * 1. language_profile 类（表示一种语言在沙箱中的编译和运行方式）
 * 2. language_registry 类（启动时构造一次的语言配置表）
 */
namespace boxjudge {

/**
 * @brief 解释执行的语言，不需要编译，如 Python
 */
struct interpreted_language {};

/**
 * @brief 需要先编译再运行的语言，如 C++
 */
struct compiled_language {
    /**
     * @brief 编译命令模板
     * 可以使用 {filename}（源文件名）和 {basename}（去掉扩展名的源文件名）
     * 如：g++ -O2 -std=c++17 -o {basename} {filename}
     */
    std::string compile_command;
};

/**
 * @brief 表示一种语言的运行配置
 * 所有的 language_profile 由 language_registry 持有，构造后不再修改
 */
struct language_profile {
    /**
     * @brief 语言 id，和提交中的 language 字段一致，如 python、cpp
     */
    std::string id;

    /**
     * @brief 编译和运行使用的容器镜像
     */
    std::string image;

    /**
     * @brief 源文件扩展名，如 .py
     */
    std::string extension;

    std::variant<interpreted_language, compiled_language> kind;

    /**
     * @brief 运行命令模板，占位符同 compiled_language::compile_command
     * 运行命令会在沙箱的 /workspace 下通过 sh -c 执行，标准输入为测试点的输入数据
     */
    std::string run_command;

    bool needs_compilation() const;

    /**
     * @brief 选手源代码在沙箱中的文件名
     */
    std::string source_file() const;

    /**
     * @brief 展开占位符之后的编译命令
     * @throw std::logic_error 该语言不需要编译
     */
    std::string compile_command_line() const;

    /**
     * @brief 展开占位符之后的运行命令
     */
    std::string run_command_line() const;
};

void from_json(const nlohmann::json &j, language_profile &profile);

/**
 * @brief 语言配置表
 * 只在进程启动时构造，之后只读，因此可以被任意多个线程并发查询。
 * 增加新语言只需要修改配置文件，不会在运行时修改已有的配置。
 */
struct language_registry {
    /**
     * @brief 从语言配置列表构造
     * @throw std::invalid_argument 配置不合法，如 id 重复、命令模板无法展开
     */
    explicit language_registry(std::vector<language_profile> profiles);

    /**
     * @brief 内置的 python 和 cpp 配置
     */
    static language_registry builtin();

    /**
     * @brief 解析语言配置
     * 格式为 {"languages": {"<id>": {"image", "extension", "compile"?, "run"}}}
     */
    static language_registry from_json(const nlohmann::json &j);

    static language_registry load(const std::filesystem::path &config_path);

    /**
     * @brief 根据语言 id 查找配置
     * @throw unsupported_language 不存在该语言的配置
     */
    const language_profile &resolve(const std::string &language) const;

    std::vector<std::string> languages() const;

private:
    std::map<std::string, language_profile> profiles;
};

}  // namespace boxjudge
