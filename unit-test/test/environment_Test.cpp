#include "test/environment.hpp"
#include <glog/logging.h>
#include <filesystem>
#include "common/utils.hpp"
#include "config.hpp"

namespace boxjudge {
using namespace std;

void setup_test_environment() {
    if (!get_env("DEBUG", "").empty()) boxjudge::DEBUG = true;

    boxjudge::RUN_DIR = filesystem::path("/tmp/boxjudge-test/run");
    filesystem::create_directories(boxjudge::RUN_DIR);
    CHECK(filesystem::is_directory(boxjudge::RUN_DIR))
        << "Run directory " << boxjudge::RUN_DIR << " does not exist";

    boxjudge::MAX_WORKERS = 4;
    boxjudge::SAMPLE_INTERVAL = 10;
    boxjudge::CLEANUP_TIMEOUT = 2000;
    boxjudge::COMPILE_TIME_LIMIT = 1000;
}

submission make_submission(const string &language, const string &source_code, const string &sub_id) {
    submission submit;
    submit.sub_id = sub_id;
    submit.prob_id = "1234";
    submit.language = language;
    submit.source_code = source_code;
    return submit;
}

test_case make_test_case(const string &id, const string &input, const string &expected_output, int time_limit) {
    test_case kase;
    kase.id = id;
    kase.input = input;
    kase.expected_output = expected_output;
    kase.time_limit = time_limit;
    kase.memory_limit = 256ll << 20;
    return kase;
}

}  // namespace boxjudge
