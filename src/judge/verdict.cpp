#include "judge/verdict.hpp"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace boxjudge {
using namespace std;

string normalize_output(const string &text) {
    vector<string> lines;
    boost::algorithm::split(lines, text, boost::is_any_of("\n"));
    for (auto &line : lines)
        boost::algorithm::trim_right(line);
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
    return boost::algorithm::join(lines, "\n");
}

bool outputs_match(const string &actual, const string &expected) {
    return normalize_output(actual) == normalize_output(expected);
}

test_verdict evaluate(const execution_outcome &outcome, const string &expected_output) {
    test_verdict verdict;
    verdict.test_case_id = outcome.test_case_id;
    verdict.run_time = outcome.elapsed;
    verdict.memory_used = outcome.peak_memory;
    verdict.error_log = outcome.error;

    switch (outcome.kind) {
        case outcome_kind::COMPLETED:
            verdict.status = outputs_match(outcome.output, expected_output) ? status::ACCEPTED : status::WRONG_ANSWER;
            break;
        case outcome_kind::TIMED_OUT:
            verdict.status = status::TIME_LIMIT_EXCEEDED;
            break;
        case outcome_kind::MEMORY_EXCEEDED:
            verdict.status = status::MEMORY_LIMIT_EXCEEDED;
            break;
        case outcome_kind::COMPILE_FAILED:
            verdict.status = status::COMPILATION_ERROR;
            break;
        case outcome_kind::RUNTIME_CRASHED:
            verdict.status = status::RUNTIME_ERROR;
            verdict.error_log = "Exited with code " + to_string(outcome.exit_code) + "\n" + outcome.error;
            break;
        case outcome_kind::SANDBOX_ERROR:
        default:
            verdict.status = status::RUNTIME_ERROR;
            break;
    }
    return verdict;
}

static const status final_statuses[] = {
    status::ACCEPTED,
    status::COMPILATION_ERROR,
    status::WRONG_ANSWER,
    status::RUNTIME_ERROR,
    status::TIME_LIMIT_EXCEEDED,
    status::MEMORY_LIMIT_EXCEEDED};

severity_policy severity_policy::standard() {
    return severity_policy({status::COMPILATION_ERROR,
                            status::RUNTIME_ERROR,
                            status::TIME_LIMIT_EXCEEDED,
                            status::MEMORY_LIMIT_EXCEEDED,
                            status::WRONG_ANSWER,
                            status::ACCEPTED});
}

severity_policy severity_policy::parse(const string &wire_names) {
    vector<string> names;
    boost::algorithm::split(names, wire_names, boost::is_any_of(","));
    vector<status> order;
    for (auto &name : names)
        order.push_back(parse_wire_name(boost::algorithm::trim_copy(name)));
    return severity_policy(move(order));
}

severity_policy::severity_policy(vector<status> order) : severity(move(order)) {
    if (severity.size() != size(final_statuses))
        throw invalid_argument("severity order must list every final status exactly once");
    for (status s : final_statuses)
        if (count(severity.begin(), severity.end(), s) != 1)
            throw invalid_argument(string("severity order must list ") + get_wire_name(s) + " exactly once");
    // 只有全部测试点通过时，合并结果才能是 ACCEPTED
    if (severity.back() != status::ACCEPTED)
        throw invalid_argument("severity order must end with ACCEPTED");
}

int severity_policy::rank(status s) const {
    auto it = find(severity.begin(), severity.end(), s);
    if (it == severity.end())
        throw invalid_argument(string("status ") + get_wire_name(s) + " has no severity");
    return (int)distance(it, severity.end());
}

status severity_policy::aggregate(const vector<test_verdict> &verdicts) const {
    status result = status::ACCEPTED;
    for (auto &verdict : verdicts)
        if (rank(verdict.status) > rank(result))
            result = verdict.status;
    return result;
}

const vector<status> &severity_policy::order() const {
    return severity;
}

}  // namespace boxjudge
