#include "server/messages.hpp"
#include "common/json_utils.hpp"
#include "common/status.hpp"

namespace boxjudge {
using namespace std;
using namespace nlohmann;

/**
 * @brief 读取 id 字段，id 可以是字符串或者整数
 */
static string get_id(const json &j, const char *key) {
    const json &value = access(j, key);
    if (value.is_number_integer()) return to_string(value.get<int64_t>());
    return get_value<string>(j, key);
}

void from_json(const json &j, submission &submit) {
    submit.sub_id = get_id(j, "submissionId");
    submit.prob_id = get_id(j, "problemId");
    submit.language = get_value<string>(j, "language");
    submit.source_code = get_value<string>(j, "sourceCode");
}

void to_json(json &j, const test_verdict &verdict) {
    j = {{"testCaseId", verdict.test_case_id},
         {"status", get_wire_name(verdict.status)},
         {"executionTime", verdict.run_time},
         {"memoryUsed", verdict.memory_used}};
}

void to_json(json &j, const judge_result &result) {
    j = {{"submissionId", result.sub_id},
         {"result", get_wire_name(result.result)},
         {"testResults", result.test_results}};
    if (!result.message.empty())
        j["message"] = result.message;
    if (result.cancelled)
        j["cancelled"] = true;
}

}  // namespace boxjudge
