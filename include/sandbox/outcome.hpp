#pragma once

#include <cstdint>
#include <string>

namespace boxjudge {

/**
 * @brief 沙箱中一次执行的结束方式
 */
enum class outcome_kind {
    COMPLETED,        // 程序正常退出，返回值为 0
    TIMED_OUT,        // 超出时间限制，程序被强制终止
    MEMORY_EXCEEDED,  // 内存采样超出限制或者发生 OOM，程序被强制终止
    COMPILE_FAILED,   // 编译失败，程序没有运行
    RUNTIME_CRASHED,  // 程序返回值非 0
    SANDBOX_ERROR     // 沙箱创建、监控或销毁失败，或者评测被取消
};

const char *get_display_message(outcome_kind);

/**
 * @brief 执行监控器对一次执行的观察结果，交给评测结果判定使用
 */
struct execution_outcome {
    /**
     * @brief 对应的测试点 id，编译时为空
     */
    std::string test_case_id;

    int exit_code = -1;

    std::string output;

    std::string error;

    /**
     * @brief 运行用时，单位为毫秒
     * 超时的情况下为时间限制本身，而不是实际等待的时间
     */
    std::int64_t elapsed = 0;

    /**
     * @brief 采样得到的内存峰值，单位为字节
     */
    std::int64_t peak_memory = 0;

    outcome_kind kind = outcome_kind::SANDBOX_ERROR;
};

}  // namespace boxjudge
