#include "server/service.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"
#include "server/messages.hpp"

namespace boxjudge::server {
using namespace std;
using namespace nlohmann;

static json error_response(const string &message) {
    return {{"error", message}};
}

judge_service::judge_service(const language_registry &languages, test_case_source &problems, judger &judge)
    : languages(languages), problems(problems), judge(judge) {}

json judge_service::handle(const string &request, const cancellation_token *cancel) {
    submission submit;
    try {
        submit = json::parse(request).get<submission>();
    } catch (json::exception &e) {
        LOG(WARNING) << "Malformed request: " << e.what();
        return error_response(string("Malformed request: ") + e.what());
    } catch (invalid_argument &e) {
        LOG(WARNING) << "Malformed request: " << e.what();
        return error_response(string("Malformed request: ") + e.what());
    }

    try {
        languages.resolve(submit.language);
        auto test_cases = problems.fetch_test_cases(submit.prob_id);
        return judge.judge(submit, test_cases, cancel);
    } catch (unsupported_language &e) {
        LOG(WARNING) << submit << " rejected: " << e.what();
        return error_response(e.what());
    } catch (problem_not_found &e) {
        LOG(WARNING) << submit << " rejected: " << e.what();
        return error_response(e.what());
    } catch (invalid_argument &e) {
        LOG(WARNING) << submit << " rejected: " << e.what();
        return error_response(e.what());
    } catch (judge_exception &e) {
        LOG(ERROR) << submit << " failed: " << e;
        return error_response(e.what());
    }
}

size_t judge_service::serve(istream &in, ostream &out, const cancellation_token *cancel) {
    size_t handled = 0;
    string line;
    while ((!cancel || !cancel->cancelled()) && getline(in, line)) {
        if (boost::algorithm::trim_copy(line).empty()) continue;
        out << handle(line, cancel).dump() << endl;
        ++handled;
    }
    return handled;
}

}  // namespace boxjudge::server
