#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace boxjudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PENDING, "Pending")
    (status::RUNNING, "Running")
    (status::ACCEPTED, "Accepted")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded");

static const unordered_map<status, const char *> wire_string = boost::assign::map_list_of
    (status::PENDING, "PENDING")
    (status::RUNNING, "RUNNING")
    (status::ACCEPTED, "ACCEPTED")
    (status::COMPILATION_ERROR, "COMPILE_ERROR")
    (status::WRONG_ANSWER, "WRONG_ANSWER")
    (status::RUNTIME_ERROR, "RUNTIME_ERROR")
    (status::TIME_LIMIT_EXCEEDED, "TIME_LIMIT_EXCEEDED")
    (status::MEMORY_LIMIT_EXCEEDED, "MEMORY_LIMIT_EXCEEDED");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_wire_name(status stat) {
    return wire_string.at(stat);
}

status parse_wire_name(const string &name) {
    for (auto &[stat, wire] : wire_string)
        if (name == wire) return stat;
    throw invalid_argument("Unrecognized status " + name);
}

}  // namespace boxjudge
