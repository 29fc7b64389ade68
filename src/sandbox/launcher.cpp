#include "sandbox/launcher.hpp"
#include <glog/logging.h>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/cleanup.hpp"

namespace boxjudge {
using namespace std;
namespace fs = std::filesystem;

sandbox_launcher::sandbox_launcher(container_runtime &runtime, sandbox_cleaner &cleaner)
    : runtime(runtime), cleaner(cleaner) {}

void sandbox_launcher::write_source(const submission &submit, const language_profile &profile, const fs::path &dir) {
    write_file_content(dir / profile.source_file(), submit.source_code);
}

sandbox_handle sandbox_launcher::launch(const submission &submit, const test_case &kase, const language_profile &profile, const fs::path &artifacts) {
    sandbox_handle handle;
    handle.test_case_id = kase.id;
    handle.caps.memory_limit = kase.memory_limit;
    handle.caps.max_processes = MAX_PROCESSES;
    handle.caps.cpus = SANDBOX_CPUS;
    handle.caps.network_disabled = true;

    try {
        // 每个测试点使用独立的运行目录，选手程序在一个测试点中写下的文件不会被其他测试点看到
        fs::path run_dir = artifacts.empty()
                               ? RUN_DIR / assert_safe_path(submit.sub_id) / ("run-" + random_uuid())
                               : artifacts.parent_path() / ("run-" + random_uuid());
        handle.scope = scoped_directory(run_dir);
        if (artifacts.empty())
            write_source(submit, profile, run_dir);
        else
            fs::copy(artifacts, run_dir, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
        handle.caps.workspace = run_dir;
    } catch (fs::filesystem_error &e) {
        throw sandbox_creation_error(string("unable to prepare workspace: ") + e.what());
    } catch (system_error &e) {
        throw sandbox_creation_error(string("unable to prepare workspace: ") + e.what());
    }

    return start(move(handle), profile.image, profile.run_command_line(), kase.input, kase.time_limit);
}

sandbox_handle sandbox_launcher::launch_compile(const submission &submit, const language_profile &profile, const fs::path &build_dir) {
    sandbox_handle handle;
    handle.caps.memory_limit = COMPILE_MEMORY_LIMIT;
    handle.caps.max_processes = MAX_PROCESSES;
    handle.caps.cpus = SANDBOX_CPUS;
    handle.caps.network_disabled = true;
    handle.caps.workspace = build_dir;

    DLOG(INFO) << submit << " compiling in " << build_dir;
    return start(move(handle), profile.image, profile.compile_command_line(), "", COMPILE_TIME_LIMIT);
}

sandbox_handle sandbox_launcher::start(sandbox_handle &&handle, const string &image, const string &command, const string &input, int time_limit) {
    // 容器创建失败时沙箱的文件夹由 handle.scope 析构时删除
    handle.container_id = runtime.create(image, handle.caps);
    handle.created_at = chrono::system_clock::now();

    try {
        // 执行监控器会在 time_limit 时终止程序，这里的期限只是为了防止容器运行时卡住
        auto hard_deadline = chrono::milliseconds(time_limit + CLEANUP_TIMEOUT);
        container_runtime *rt = &runtime;
        string container_id = handle.container_id;
        handle.started_at = chrono::steady_clock::now();
        handle.execution = async(launch::async, [rt, container_id, command, input, hard_deadline]() {
            finished_execution execution;
            execution.result = rt->exec(container_id, command, input, hard_deadline);
            execution.finished_at = chrono::steady_clock::now();
            return execution;
        });
    } catch (system_error &e) {
        // 容器已经创建，调用方拿不到这个沙箱，必须在这里销毁
        cleaner.release(handle);
        throw sandbox_creation_error(string("unable to start execution: ") + e.what());
    }

    DLOG(INFO) << "Sandbox " << handle.container_id << " started for test case [" << handle.test_case_id << "]";
    return move(handle);
}

execution_outcome sandbox_launcher::classify_compilation(execution_outcome outcome) {
    switch (outcome.kind) {
        case outcome_kind::COMPLETED:
        case outcome_kind::SANDBOX_ERROR:
            break;
        case outcome_kind::TIMED_OUT:
            outcome.kind = outcome_kind::COMPILE_FAILED;
            outcome.error = "Compile time limit exceeded\n" + outcome.error;
            break;
        case outcome_kind::MEMORY_EXCEEDED:
            outcome.kind = outcome_kind::COMPILE_FAILED;
            outcome.error = "Compile memory limit exceeded\n" + outcome.error;
            break;
        default:
            outcome.kind = outcome_kind::COMPILE_FAILED;
            break;
    }
    return outcome;
}

}  // namespace boxjudge
