#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "judge/submission.hpp"

namespace boxjudge::server {

/**
 * @brief 题目数据源，根据题目 id 提供测试点
 */
struct test_case_source {
    virtual ~test_case_source();

    /**
     * @brief 获取题目的全部测试点，顺序即评测结果的顺序
     * @throw problem_not_found 题目不存在
     * @throw std::invalid_argument 题目 id 不合法或者题目数据格式错误
     */
    virtual std::vector<test_case> fetch_test_cases(const std::string &prob_id) = 0;
};

/**
 * @brief 保存在本地文件夹中的题目数据
 * 每道题目是 root 下的一个 <prob_id>.json 文件：
 * {
 *   "timeLimit": 1000,    // 题目的时间限制，单位为毫秒
 *   "memoryLimit": 256,   // 题目的内存限制，单位为 MB
 *   "testCases": [
 *     {"id": "1", "input": "1 2\n", "output": "3\n", "timeLimit": 2000, "memoryLimit": 512}
 *   ]
 * }
 * 测试点可以单独指定时间和内存限制，没有指定时使用题目的限制。
 */
struct local_problem_store : public test_case_source {
    explicit local_problem_store(const std::filesystem::path &root);

    std::vector<test_case> fetch_test_cases(const std::string &prob_id) override;

    /**
     * @brief 解析题目数据
     * @throw std::invalid_argument 格式错误
     */
    static std::vector<test_case> parse_problem(const nlohmann::json &problem);

private:
    std::filesystem::path root;
};

}  // namespace boxjudge::server
