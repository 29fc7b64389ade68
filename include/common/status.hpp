#pragma once

#include <string>

namespace boxjudge {

/**
 * @brief 表示数据点或整个提交的评测结果
 *
 */
enum class status {
    /**
     * @brief 测试点正在等待评测
     * 仅在评测过程中出现，不会出现在最终的评测结果中
     */
    PENDING = 0,

    /**
     * @brief 测试点正在运行
     * 仅在评测过程中出现，不会出现在最终的评测结果中
     */
    RUNNING = 1,

    /**
     * @brief 用户程序本测试点评测通过
     * 行末空白字符和文末空行的差异不影响结果
     */
    ACCEPTED = 2,

    /**
     * @brief 用户程序编译错误
     * 编译错误的提交不会运行任何测试点
     */
    COMPILATION_ERROR = 4,

    /**
     * @brief 答案错误
     */
    WRONG_ANSWER = 7,

    /**
     * @brief 用户程序出现运行时错误
     * 包括程序非零返回、被信号杀死，以及沙箱创建、监控、销毁失败等基础设施错误。
     */
    RUNTIME_ERROR = 8,

    /**
     * @brief 用户程序运行时间超出限制
     * 比较的是时钟时间
     */
    TIME_LIMIT_EXCEEDED = 9,

    /**
     * @brief 用户程序运行内存超限
     * 内存采样值超过限制，或者容器内发生了 OOM Kill
     */
    MEMORY_LIMIT_EXCEEDED = 10
};

const char *get_display_message(status);

/**
 * @brief 评测结果在对外接口中的名字，如 ACCEPTED、COMPILE_ERROR
 */
const char *get_wire_name(status);

/**
 * @brief 根据对外接口中的名字查找评测结果
 * @throw std::invalid_argument 名字不是合法的评测结果
 */
status parse_wire_name(const std::string &name);

}  // namespace boxjudge
