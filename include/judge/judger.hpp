#pragma once

#include <filesystem>
#include <functional>
#include <vector>
#include "common/cancellation.hpp"
#include "judge/language.hpp"
#include "judge/submission.hpp"
#include "judge/verdict.hpp"
#include "monitor/monitor.hpp"
#include "sandbox/cleanup.hpp"
#include "sandbox/execution_monitor.hpp"
#include "sandbox/launcher.hpp"
#include "sandbox/runtime.hpp"

namespace boxjudge {

/**
 * @brief 评测一个提交的全部测试点
 *
 * 一个提交的评测流程：
 * 1. 在语言配置表中查找语言，不支持的语言直接拒绝，不会创建任何沙箱
 * 2. 若语言需要编译，在一次性的编译沙箱中编译，编译失败时不运行任何测试点
 * 3. 每个测试点在独立的沙箱中运行，最多 MAX_WORKERS 个沙箱同时运行
 * 4. 判定每个测试点的评测结果，并按严重程度合并为整个提交的评测结果
 *
 * 每个沙箱都会被销毁恰好一次，无论测试点正常结束、出错还是评测被取消。
 * judge 可以被多个线程同时调用，不同的提交之间不共享任何可变状态。
 */
struct judger {
    /**
     * @param languages 语言配置表
     * @param runtime 容器运行时
     * @param policy 合并评测结果时使用的严重程度
     * @param monitors 评测状态的监控
     */
    judger(const language_registry &languages,
           container_runtime &runtime,
           severity_policy policy = severity_policy::standard(),
           std::vector<monitor *> monitors = {});

    /**
     * @brief 评测一个提交
     * @param submit 选手提交
     * @param test_cases 测试点，评测结果的顺序与之相同
     * @param cancel 取消标记，取消后尚未结束的测试点记为 RUNTIME_ERROR
     * @throw unsupported_language 提交的语言没有配置，此时没有创建任何沙箱
     * @throw std::invalid_argument 提交 id 不能安全地用作文件夹名
     */
    judge_result judge(const submission &submit, const std::vector<test_case> &test_cases, const cancellation_token *cancel = nullptr);

private:
    /**
     * @brief 在编译沙箱中编译选手程序，编译产物写入 build_dir
     */
    execution_outcome compile(const submission &submit, const language_profile &profile, const std::filesystem::path &build_dir, const cancellation_token *cancel);

    /**
     * @brief 评测一个测试点，不会抛出异常
     */
    test_verdict judge_test_case(const submission &submit, std::size_t index, const test_case &kase, const language_profile &profile, const std::filesystem::path &build_dir, const cancellation_token *cancel);

    void report(const std::function<void(monitor &)> &callback);

    const language_registry &languages;
    severity_policy policy;
    std::vector<monitor *> monitors;

    sandbox_cleaner cleaner;
    sandbox_launcher launcher;
    execution_monitor supervisor;
};

}  // namespace boxjudge
