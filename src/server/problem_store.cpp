#include "server/problem_store.hpp"
#include <glog/logging.h>
#include <fstream>
#include <limits>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace boxjudge::server {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

test_case_source::~test_case_source() {}

local_problem_store::local_problem_store(const fs::path &root) : root(root) {}

vector<test_case> local_problem_store::parse_problem(const json &problem) {
    int time_limit = get_value_def<int>(problem, 1000, "timeLimit");
    int64_t memory_limit = get_value_def<int64_t>(problem, 256, "memoryLimit");

    vector<test_case> test_cases;
    const json &cases = access(problem, "testCases");
    if (!cases.is_array()) throw build_invalid_argument(problem, "testCases");
    for (size_t i = 0; i < cases.size(); ++i) {
        const json &item = cases[i];
        test_case kase;
        kase.id = get_value_def<string>(item, to_string(i + 1), "id");
        kase.input = get_value_def<string>(item, "", "input");
        kase.expected_output = get_value<string>(item, "output");
        kase.time_limit = get_value_def<int>(item, time_limit, "timeLimit");
        int64_t mb = get_value_def<int64_t>(item, memory_limit, "memoryLimit");
        if (mb > (numeric_limits<int64_t>::max() >> 20))
            throw invalid_argument("memory limit of test case " + kase.id + " is too large");
        kase.memory_limit = mb > 0 ? (mb << 20) : -1;
        if (kase.time_limit <= 0)
            throw invalid_argument("time limit of test case " + kase.id + " must be positive");
        test_cases.push_back(move(kase));
    }
    return test_cases;
}

vector<test_case> local_problem_store::fetch_test_cases(const string &prob_id) {
    fs::path file = root / (assert_safe_path(prob_id) + ".json");
    ifstream fin(file);
    if (!fin) throw problem_not_found(prob_id);

    json problem;
    try {
        fin >> problem;
    } catch (json::exception &e) {
        throw invalid_argument("malformed problem " + prob_id + ": " + e.what());
    }
    auto test_cases = parse_problem(problem);
    DLOG(INFO) << "Problem " << prob_id << " loaded with " << test_cases.size() << " test case(s)";
    return test_cases;
}

}  // namespace boxjudge::server
