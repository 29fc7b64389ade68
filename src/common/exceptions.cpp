#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace boxjudge {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

unsupported_language::unsupported_language(const string &language)
    : judge_exception("Unsupported language: " + language), language(language) {}

sandbox_creation_error::sandbox_creation_error()
    : judge_exception() {}

sandbox_creation_error::sandbox_creation_error(const string &message)
    : judge_exception(message) {}

sandbox_teardown_error::sandbox_teardown_error()
    : judge_exception() {}

sandbox_teardown_error::sandbox_teardown_error(const string &message)
    : judge_exception(message) {}

runtime_unavailable::runtime_unavailable()
    : judge_exception() {}

runtime_unavailable::runtime_unavailable(const string &message)
    : judge_exception(message) {}

problem_not_found::problem_not_found(const string &prob_id)
    : judge_exception("Problem not found: " + prob_id), prob_id(prob_id) {}

}  // namespace boxjudge
