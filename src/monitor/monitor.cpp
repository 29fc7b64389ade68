#include "monitor/monitor.hpp"
#include <glog/logging.h>

namespace boxjudge {

const char *get_display_message(submission_state state) {
    switch (state) {
        case submission_state::RECEIVED: return "Received";
        case submission_state::COMPILING: return "Compiling";
        case submission_state::COMPILE_ERROR: return "Compile Error";
        case submission_state::RUNNING_TESTS: return "Running Tests";
        case submission_state::AGGREGATED: return "Aggregated";
    }
    return "Unknown";
}

const char *get_display_message(test_state state) {
    switch (state) {
        case test_state::PENDING: return "Pending";
        case test_state::LAUNCHING: return "Launching";
        case test_state::RUNNING: return "Running";
        case test_state::COMPLETED: return "Completed";
        case test_state::TIMED_OUT: return "Timed Out";
        case test_state::MEM_EXCEEDED: return "Memory Exceeded";
        case test_state::CRASHED: return "Crashed";
        case test_state::SANDBOX_ERROR: return "Sandbox Error";
        case test_state::EVALUATED: return "Evaluated";
        case test_state::RELEASED: return "Released";
    }
    return "Unknown";
}

monitor::~monitor() {}

void monitor::submission_state_changed(const submission &, submission_state) {}

void monitor::test_state_changed(const submission &, std::size_t, const std::string &, test_state) {}

void logging_monitor::submission_state_changed(const submission &submit, submission_state state) {
    LOG(INFO) << submit << " " << get_display_message(state);
}

void logging_monitor::test_state_changed(const submission &submit, std::size_t index, const std::string &test_case_id, test_state state) {
    VLOG(1) << submit << " test case #" << index << " [" << test_case_id << "] " << get_display_message(state);
}

}  // namespace boxjudge
