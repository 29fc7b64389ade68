#pragma once

#include <istream>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include "common/cancellation.hpp"
#include "judge/judger.hpp"
#include "judge/language.hpp"
#include "server/problem_store.hpp"

namespace boxjudge::server {

/**
 * @brief 评测服务
 * 读取评测请求，从题目数据源获取测试点并评测，返回评测结果。
 * 请求格式错误、语言不支持、题目不存在时返回 {"error": "<原因>"}。
 */
struct judge_service {
    judge_service(const language_registry &languages, test_case_source &problems, judger &judge);

    /**
     * @brief 处理一个评测请求
     * @param request 评测请求的 JSON 文本
     * @param cancel 取消标记
     * @return 评测结果或者错误信息
     */
    nlohmann::json handle(const std::string &request, const cancellation_token *cancel = nullptr);

    /**
     * @brief 逐行读取评测请求，每个请求输出一行评测结果，直到输入结束或者被取消
     * @return 处理的请求数
     */
    std::size_t serve(std::istream &in, std::ostream &out, const cancellation_token *cancel = nullptr);

private:
    const language_registry &languages;
    test_case_source &problems;
    judger &judge;
};

}  // namespace boxjudge::server
