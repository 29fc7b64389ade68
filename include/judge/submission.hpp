#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace boxjudge {

/**
 * @brief 一个选手代码提交
 * 提交被接受后不再修改，评测过程中只读
 */
struct submission {
    /**
     * @brief 选手代码提交的 id
     * string 可以兼容一切情况
     */
    std::string sub_id;

    /**
     * @brief 选手代码提交的题目 id
     * string 可以兼容一切情况
     */
    std::string prob_id;

    /**
     * @brief 提交使用的语言 id，在 language_registry 中查找
     */
    std::string language;

    std::string source_code;
};

/**
 * @brief 表示一个测试点
 * 由题目数据源提供，评测过程中只读
 */
struct test_case {
    std::string id;

    /**
     * @brief 喂给选手程序标准输入的数据
     */
    std::string input;

    /**
     * @brief 标准输出数据
     */
    std::string expected_output;

    /**
     * @brief 时间限制，限制应用程序的实际运行时间（时钟时间）
     * @note 单位为毫秒
     */
    int time_limit = 1000;

    /**
     * @brief 内存限制，限制应用程序实际最多能使用多少内存
     * @note 单位为字节，小于等于 0 的数表示不限制
     */
    std::int64_t memory_limit = 256ll << 20;
};

/**
 * @brief 一个测试点的评测结果
 */
struct test_verdict {
    std::string test_case_id;

    boxjudge::status status = boxjudge::status::PENDING;

    /**
     * @brief 本测试点程序运行用时
     * 单位为毫秒，超时的测试点记为时间限制
     */
    std::int64_t run_time = 0;

    /**
     * @brief 本测试点程序运行使用的内存峰值
     * 单位为字节
     */
    std::int64_t memory_used = 0;

    /**
     * @brief 错误报告
     * 保存选手程序的标准错误输出或者评测系统的错误信息，只用于日志
     */
    std::string error_log;
};

/**
 * @brief 一个提交的评测结果
 */
struct judge_result {
    std::string sub_id;

    /**
     * @brief 整个提交的评测结果，为所有测试点中最严重的结果
     */
    boxjudge::status result = boxjudge::status::PENDING;

    /**
     * @brief 每个测试点的评测结果，顺序和输入的测试点顺序一致
     * 编译错误时为空
     */
    std::vector<test_verdict> test_results;

    /**
     * @brief 编译错误时保存编译器的输出
     */
    std::string message;

    /**
     * @brief 评测是否被调用方取消
     * 被取消时尚未开始评测的测试点记为 RUNTIME_ERROR
     */
    bool cancelled = false;
};

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << submit.language << ":" << submit.prob_id << "-" << submit.sub_id << "]";
    return os;
}

}  // namespace boxjudge
