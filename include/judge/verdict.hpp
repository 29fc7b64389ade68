#pragma once

#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/submission.hpp"
#include "sandbox/outcome.hpp"

/**
 * 这个头文件包含评测结果判定
 * 包含：
 * 1. 输出比较（忽略行末空白字符和文末空行）
 * 2. evaluate 函数（将执行结果映射为测试点评测结果）
 * 3. severity_policy 类（将测试点评测结果合并为提交的评测结果）
 */
namespace boxjudge {

/**
 * @brief 规范化程序输出
 * 删除每一行行末的空白字符，统一换行符为 \n，并删除文末的空行
 */
std::string normalize_output(const std::string &text);

/**
 * @brief 比较选手输出和标准输出
 * 行末空白字符、文末空行、换行符的差异都会被忽略，其他差异（包括行首空白、行中空白）都会导致答案错误
 */
bool outputs_match(const std::string &actual, const std::string &expected);

/**
 * @brief 判定一个测试点的评测结果
 * 这个函数不会抛出异常，相同的输入总是得到相同的结果
 * @param outcome 执行监控器的观察结果
 * @param expected_output 标准输出
 */
test_verdict evaluate(const execution_outcome &outcome, const std::string &expected_output);

/**
 * @brief 评测结果的严重程度
 * 整个提交的评测结果取所有测试点中最严重的一个，默认的严重程度从高到低为：
 * COMPILE_ERROR > RUNTIME_ERROR > TIME_LIMIT_EXCEEDED > MEMORY_LIMIT_EXCEEDED > WRONG_ANSWER > ACCEPTED
 */
struct severity_policy {
    /**
     * @brief 默认的严重程度顺序
     */
    static severity_policy standard();

    /**
     * @brief 从逗号分隔的评测结果名字构造，如 "COMPILE_ERROR,RUNTIME_ERROR,..."，严重的在前
     * @throw std::invalid_argument 名字不合法，没有恰好列出每个评测结果一次，或者 ACCEPTED 不在最后
     */
    static severity_policy parse(const std::string &wire_names);

    /**
     * @param order 从最严重到最不严重的评测结果，必须恰好包含每个终态评测结果一次，
     *              且 ACCEPTED 必须排在最后
     * @throw std::invalid_argument order 不合法
     */
    explicit severity_policy(std::vector<status> order);

    /**
     * @brief 评测结果的严重程度，数值越大越严重
     * @throw std::invalid_argument status 不是终态评测结果
     */
    int rank(status s) const;

    /**
     * @brief 合并所有测试点的评测结果
     * 没有测试点时返回 ACCEPTED
     */
    status aggregate(const std::vector<test_verdict> &verdicts) const;

    const std::vector<status> &order() const;

private:
    std::vector<status> severity;
};

}  // namespace boxjudge
