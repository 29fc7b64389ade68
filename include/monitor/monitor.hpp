#pragma once

#include <cstddef>
#include <string>
#include "judge/submission.hpp"

namespace boxjudge {

/**
 * @brief 提交的评测阶段
 * RECEIVED -> COMPILING? -> (COMPILE_ERROR | RUNNING_TESTS) -> AGGREGATED
 */
enum class submission_state {
    RECEIVED,
    COMPILING,
    COMPILE_ERROR,
    RUNNING_TESTS,
    AGGREGATED
};

/**
 * @brief 测试点的评测阶段
 * PENDING -> LAUNCHING -> RUNNING -> (COMPLETED | TIMED_OUT | MEM_EXCEEDED | CRASHED | SANDBOX_ERROR) -> EVALUATED -> RELEASED
 * 沙箱创建失败或者评测已被取消时，从 LAUNCHING 直接进入 SANDBOX_ERROR
 * 沙箱销毁失败时，在 EVALUATED 之后上报 SANDBOX_ERROR，再上报 RELEASED
 */
enum class test_state {
    PENDING,
    LAUNCHING,
    RUNNING,
    COMPLETED,
    TIMED_OUT,
    MEM_EXCEEDED,
    CRASHED,
    SANDBOX_ERROR,
    EVALUATED,
    RELEASED
};

const char *get_display_message(submission_state);

const char *get_display_message(test_state);

/**
 * @brief 执行监控行为
 * 评测过程会在多个线程中同时上报测试点的状态，实现必须是线程安全的。
 * 上报时抛出的异常会被记录到日志中，不会影响评测结果。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报提交进入了新的评测阶段
     */
    virtual void submission_state_changed(const submission &submit, submission_state state);

    /**
     * @brief 监控上报某个测试点进入了新的评测阶段
     * @param index 测试点在提交中的下标
     * @param test_case_id 测试点 id
     */
    virtual void test_state_changed(const submission &submit, std::size_t index, const std::string &test_case_id, test_state state);
};

/**
 * @brief 将评测状态写入日志
 */
struct logging_monitor : public monitor {
    void submission_state_changed(const submission &submit, submission_state state) override;

    void test_state_changed(const submission &submit, std::size_t index, const std::string &test_case_id, test_state state) override;
};

}  // namespace boxjudge
