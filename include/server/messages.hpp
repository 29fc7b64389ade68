#pragma once

#include <nlohmann/json.hpp>
#include "judge/submission.hpp"

/**
 * 评测请求和评测结果的 JSON 格式
 *
 * 评测请求：
 * {"submissionId": "1", "problemId": "1000", "language": "python", "sourceCode": "print(1)"}
 *
 * 评测结果：
 * {
 *   "submissionId": "1",
 *   "result": "ACCEPTED",
 *   "testResults": [{"testCaseId": "1", "status": "ACCEPTED", "executionTime": 12, "memoryUsed": 4194304}],
 *   "message": "..."   // 仅在编译错误时出现
 * }
 */
namespace boxjudge {

/**
 * @throw std::invalid_argument 缺少字段或者字段类型不正确
 */
void from_json(const nlohmann::json &j, submission &submit);

void to_json(nlohmann::json &j, const test_verdict &verdict);

void to_json(nlohmann::json &j, const judge_result &result);

}  // namespace boxjudge
