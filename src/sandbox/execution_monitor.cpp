#include "sandbox/execution_monitor.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "config.hpp"

namespace boxjudge {
using namespace std;

const char *get_display_message(outcome_kind kind) {
    switch (kind) {
        case outcome_kind::COMPLETED:
            return "Completed";
        case outcome_kind::TIMED_OUT:
            return "Timed Out";
        case outcome_kind::MEMORY_EXCEEDED:
            return "Memory Exceeded";
        case outcome_kind::COMPILE_FAILED:
            return "Compile Failed";
        case outcome_kind::RUNTIME_CRASHED:
            return "Runtime Crashed";
        case outcome_kind::SANDBOX_ERROR:
            return "Sandbox Error";
    }
    return "Unknown";
}

execution_monitor::execution_monitor(container_runtime &runtime, chrono::milliseconds sample_interval)
    : runtime(runtime), sample_interval(sample_interval) {}

void execution_monitor::terminate(const sandbox_handle &handle) {
    try {
        runtime.terminate(handle.container_id);
    } catch (exception &e) {
        // 沙箱清理器删除容器时会再次杀死容器
        LOG(WARNING) << "Unable to terminate container " << handle.container_id << ": " << e.what();
    }
}

static int64_t elapsed_since(chrono::steady_clock::time_point start, chrono::steady_clock::time_point end) {
    return chrono::duration_cast<chrono::milliseconds>(end - start).count();
}

execution_outcome execution_monitor::supervise(sandbox_handle &handle, int time_limit, const cancellation_token *cancel) {
    execution_outcome outcome;
    outcome.test_case_id = handle.test_case_id;

    if (!handle.execution.valid()) {
        outcome.kind = outcome_kind::SANDBOX_ERROR;
        outcome.error = "Execution was not started";
        return outcome;
    }

    const int64_t memory_limit = handle.caps.memory_limit;
    const auto deadline = handle.started_at + chrono::milliseconds(time_limit);
    bool oom_killed = false;

    auto observe = [&](const container_stats &stats) {
        outcome.peak_memory = max({outcome.peak_memory, stats.memory, stats.peak_memory});
        oom_killed = oom_killed || stats.oom_killed;
    };
    auto memory_exceeded = [&]() {
        return oom_killed || (memory_limit > 0 && outcome.peak_memory > memory_limit);
    };

    while (true) {
        auto now = chrono::steady_clock::now();
        if (cancel && cancel->cancelled()) {
            terminate(handle);
            outcome.kind = outcome_kind::SANDBOX_ERROR;
            outcome.error = "Judging was cancelled";
            outcome.elapsed = elapsed_since(handle.started_at, now);
            return outcome;
        }

        if (now >= deadline) {
            // 采样耗时可能越过期限，此时程序也许已经在期限内结束，按实际结束时间判定
            if (handle.execution.wait_for(chrono::seconds(0)) == future_status::ready)
                break;
            terminate(handle);
            outcome.kind = outcome_kind::TIMED_OUT;
            outcome.elapsed = time_limit;
            return outcome;
        }

        auto wait = min<chrono::steady_clock::duration>(sample_interval, deadline - now);
        if (handle.execution.wait_for(wait) == future_status::ready)
            break;

        try {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
            observe(runtime.stats(handle.container_id, max(remaining, chrono::milliseconds(1))));
        } catch (exception &e) {
            if (chrono::steady_clock::now() >= deadline) {
                // 采样被期限截断，交给下一轮判定程序是否已经结束
                DLOG(INFO) << "Sampling container " << handle.container_id << " cut short by deadline: " << e.what();
                continue;
            }
            LOG(ERROR) << "Unable to sample container " << handle.container_id << ": " << e.what();
            terminate(handle);
            outcome.kind = outcome_kind::SANDBOX_ERROR;
            outcome.error = e.what();
            outcome.elapsed = elapsed_since(handle.started_at, chrono::steady_clock::now());
            return outcome;
        }

        if (memory_exceeded()) {
            terminate(handle);
            outcome.kind = outcome_kind::MEMORY_EXCEEDED;
            outcome.elapsed = elapsed_since(handle.started_at, chrono::steady_clock::now());
            return outcome;
        }
    }

    finished_execution execution;
    try {
        execution = handle.execution.get();
    } catch (exception &e) {
        LOG(ERROR) << "Lost track of execution in container " << handle.container_id << ": " << e.what();
        outcome.kind = outcome_kind::SANDBOX_ERROR;
        outcome.error = e.what();
        outcome.elapsed = elapsed_since(handle.started_at, chrono::steady_clock::now());
        return outcome;
    }

    // 程序结束后容器仍然存在，cgroup 中保留着内存峰值和 OOM 计数
    try {
        observe(runtime.stats(handle.container_id, chrono::milliseconds(RUNTIME_CALL_TIMEOUT)));
    } catch (exception &e) {
        LOG(WARNING) << "Unable to sample container " << handle.container_id << " after execution: " << e.what();
    }

    outcome.exit_code = execution.result.exit_code;
    outcome.output = move(execution.result.output);
    outcome.error = move(execution.result.error);
    outcome.elapsed = elapsed_since(handle.started_at, execution.finished_at);

    if (memory_exceeded()) {
        outcome.kind = outcome_kind::MEMORY_EXCEEDED;
    } else if (outcome.elapsed > time_limit) {
        // 程序在两次采样之间越过了时间限制
        outcome.kind = outcome_kind::TIMED_OUT;
        outcome.elapsed = time_limit;
    } else if (outcome.exit_code == 0) {
        outcome.kind = outcome_kind::COMPLETED;
    } else {
        outcome.kind = outcome_kind::RUNTIME_CRASHED;
    }
    return outcome;
}

}  // namespace boxjudge
