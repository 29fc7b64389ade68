#include "judge/judger.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <optional>
#include <system_error>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace boxjudge {
using namespace std;
namespace fs = std::filesystem;

judger::judger(const language_registry &languages, container_runtime &runtime, severity_policy policy, vector<monitor *> monitors)
    : languages(languages),
      policy(move(policy)),
      monitors(move(monitors)),
      cleaner(runtime),
      launcher(runtime, cleaner),
      supervisor(runtime, chrono::milliseconds(SAMPLE_INTERVAL)) {}

void judger::report(const function<void(monitor &)> &callback) {
    for (monitor *m : monitors) {
        try {
            callback(*m);
        } catch (exception &ex) {
            LOG(ERROR) << "Monitor has crashed when reporting judge state, " << ex.what();
        }
    }
}

static test_state get_test_state(outcome_kind kind) {
    switch (kind) {
        case outcome_kind::COMPLETED: return test_state::COMPLETED;
        case outcome_kind::TIMED_OUT: return test_state::TIMED_OUT;
        case outcome_kind::MEMORY_EXCEEDED: return test_state::MEM_EXCEEDED;
        case outcome_kind::RUNTIME_CRASHED: return test_state::CRASHED;
        default: return test_state::SANDBOX_ERROR;
    }
}

/**
 * @brief 所有测试点都因为基础设施错误而无法运行时，构造全部为 RUNTIME_ERROR 的评测结果
 */
static vector<test_verdict> fail_all(const vector<test_case> &test_cases, const string &error_log) {
    vector<test_verdict> verdicts;
    for (auto &kase : test_cases) {
        test_verdict verdict;
        verdict.test_case_id = kase.id;
        verdict.status = status::RUNTIME_ERROR;
        verdict.error_log = error_log;
        verdicts.push_back(verdict);
    }
    return verdicts;
}

execution_outcome judger::compile(const submission &submit, const language_profile &profile, const fs::path &build_dir, const cancellation_token *cancel) {
    execution_outcome outcome;
    try {
        scoped_sandbox lease(cleaner, launcher.launch_compile(submit, profile, build_dir));
        outcome = supervisor.supervise(lease.get(), COMPILE_TIME_LIMIT, cancel);
        if (!lease.release())
            LOG(WARNING) << submit << " unable to tear down compile sandbox";
    } catch (sandbox_creation_error &e) {
        LOG(ERROR) << submit << " unable to create compile sandbox: " << e.what();
        outcome.kind = outcome_kind::SANDBOX_ERROR;
        outcome.error = e.what();
    }
    return sandbox_launcher::classify_compilation(move(outcome));
}

test_verdict judger::judge_test_case(const submission &submit, size_t index, const test_case &kase, const language_profile &profile, const fs::path &build_dir, const cancellation_token *cancel) {
    auto state_changed = [&](test_state state) {
        report([&](monitor &m) { m.test_state_changed(submit, index, kase.id, state); });
    };

    test_verdict verdict;
    verdict.test_case_id = kase.id;
    verdict.status = status::RUNTIME_ERROR;

    try {
        state_changed(test_state::LAUNCHING);
        if (cancel && cancel->cancelled()) {
            verdict.error_log = "Judging was cancelled";
            state_changed(test_state::SANDBOX_ERROR);
            state_changed(test_state::EVALUATED);
            return verdict;
        }

        optional<scoped_sandbox> lease;
        execution_outcome outcome;
        try {
            lease.emplace(cleaner, launcher.launch(submit, kase, profile, build_dir));
        } catch (sandbox_creation_error &e) {
            LOG(ERROR) << submit << " unable to create sandbox for test case [" << kase.id << "]: " << e.what();
            outcome.test_case_id = kase.id;
            outcome.kind = outcome_kind::SANDBOX_ERROR;
            outcome.error = e.what();
        }

        if (lease) {
            state_changed(test_state::RUNNING);
            outcome = supervisor.supervise(lease->get(), kase.time_limit, cancel);
        }
        state_changed(get_test_state(outcome.kind));

        verdict = evaluate(outcome, kase.expected_output);
        state_changed(test_state::EVALUATED);

        if (lease) {
            if (!lease->release()) {
                // 沙箱没有被完整销毁，这个测试点记为 RUNTIME_ERROR，其他测试点不受影响
                LOG(ERROR) << submit << " unable to tear down sandbox of test case [" << kase.id << "]";
                verdict.status = status::RUNTIME_ERROR;
                verdict.error_log += "\nSandbox teardown failed";
                state_changed(test_state::SANDBOX_ERROR);
            }
            state_changed(test_state::RELEASED);
        }
    } catch (exception &e) {
        LOG(ERROR) << submit << " has crashed when judging test case [" << kase.id << "]: " << e.what();
        verdict.test_case_id = kase.id;
        verdict.status = status::RUNTIME_ERROR;
        verdict.error_log = e.what();
    }
    return verdict;
}

judge_result judger::judge(const submission &submit, const vector<test_case> &test_cases, const cancellation_token *cancel) {
    const language_profile &profile = languages.resolve(submit.language);
    const string safe_sub_id = assert_safe_path(submit.sub_id);

    judge_result result;
    result.sub_id = submit.sub_id;
    report([&](monitor &m) { m.submission_state_changed(submit, submission_state::RECEIVED); });
    LOG(INFO) << submit << " received with " << test_cases.size() << " test case(s)";

    scoped_directory workdir;
    fs::path build_dir;
    try {
        workdir = scoped_directory(RUN_DIR / (safe_sub_id + "-" + random_uuid()));
        if (DEBUG) workdir.keep();
        build_dir = workdir.path() / "compile";
        fs::create_directories(build_dir);
        sandbox_launcher::write_source(submit, profile, build_dir);
    } catch (system_error &e) {
        LOG(ERROR) << submit << " unable to prepare run directory: " << e.what();
        result.test_results = fail_all(test_cases, e.what());
        result.result = policy.aggregate(result.test_results);
        report([&](monitor &m) { m.submission_state_changed(submit, submission_state::AGGREGATED); });
        return result;
    }

    if (profile.needs_compilation()) {
        report([&](monitor &m) { m.submission_state_changed(submit, submission_state::COMPILING); });
        auto outcome = compile(submit, profile, build_dir, cancel);

        if (outcome.kind == outcome_kind::COMPILE_FAILED) {
            result.result = status::COMPILATION_ERROR;
            result.message = outcome.output + outcome.error;
            report([&](monitor &m) { m.submission_state_changed(submit, submission_state::COMPILE_ERROR); });
            LOG(INFO) << submit << " compilation failed";
            return result;
        }

        if (outcome.kind != outcome_kind::COMPLETED) {
            result.test_results = fail_all(test_cases, outcome.error);
            result.cancelled = cancel && cancel->cancelled();
            result.result = policy.aggregate(result.test_results);
            report([&](monitor &m) { m.submission_state_changed(submit, submission_state::AGGREGATED); });
            return result;
        }
    }

    report([&](monitor &m) { m.submission_state_changed(submit, submission_state::RUNNING_TESTS); });

    // 评测结果按下标写回，保证顺序与输入的测试点一致
    vector<test_verdict> verdicts(test_cases.size());
    concurrent_queue<size_t> queue;
    for (size_t i = 0; i < test_cases.size(); ++i) queue.push(i);
    queue.close();

    auto work = [&]() {
        size_t index;
        while (queue.pop(index))
            verdicts[index] = judge_test_case(submit, index, test_cases[index], profile, build_dir, cancel);
    };

    size_t worker_count = min(max<size_t>(MAX_WORKERS, 1), test_cases.size());
    vector<thread> workers;
    for (size_t i = 0; i < worker_count; ++i) {
        try {
            workers.emplace_back(work);
        } catch (system_error &e) {
            LOG(WARNING) << submit << " unable to start worker thread: " << e.what();
            break;
        }
    }
    if (workers.empty()) work();
    for (auto &worker : workers) worker.join();

    result.test_results = move(verdicts);
    result.cancelled = cancel && cancel->cancelled();
    result.result = policy.aggregate(result.test_results);
    report([&](monitor &m) { m.submission_state_changed(submit, submission_state::AGGREGATED); });
    LOG(INFO) << submit << " judged: " << get_display_message(result.result);
    return result;
}

}  // namespace boxjudge
