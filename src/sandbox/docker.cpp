#include "sandbox/docker.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace boxjudge {
using namespace std;
namespace fs = std::filesystem;

container_runtime::~container_runtime() {}

docker_runtime::docker_runtime(const string &docker, const fs::path &cgroup_root)
    : docker(docker), cgroup_root(cgroup_root) {}

process_result docker_runtime::call(const vector<string> &args, int timeout_ms, const string &input) {
    try {
        return run_process(args, input, chrono::milliseconds(timeout_ms), OUTPUT_LIMIT);
    } catch (system_error &e) {
        throw runtime_unavailable(string("unable to run ") + docker + ": " + e.what());
    }
}

/**
 * @brief 判断 docker 命令行工具的错误输出是否来自 docker 本身而不是容器内的程序
 */
static bool is_daemon_error(const string &error) {
    return error.find("Error response from daemon") != string::npos ||
           error.find("Cannot connect to the Docker daemon") != string::npos ||
           error.find("error during connect") != string::npos;
}

vector<string> docker_runtime::create_arguments(const string &name, const string &image, const sandbox_constraints &constraints) const {
    vector<string> args = make_arguments(docker, "create", "--name", name);
    if (constraints.network_disabled)
        to_string_list(args, "--network", "none");
    if (constraints.memory_limit > 0)
        // memory-swap 和 memory 相同，保证不会使用 swap
        to_string_list(args, "--memory", constraints.memory_limit, "--memory-swap", constraints.memory_limit);
    to_string_list(args,
                   "--pids-limit", constraints.max_processes,
                   "--cpus", constraints.cpus,
                   "--cap-drop", "ALL",
                   "--security-opt", "no-new-privileges",
                   "--read-only",
                   "--tmpfs", "/tmp:rw,nosuid,size=64m",
                   "-v", constraints.workspace.string() + ":/workspace",
                   "-w", "/workspace",
                   "--entrypoint", "sleep",
                   image, "infinity");
    return args;
}

string docker_runtime::create(const string &image, const sandbox_constraints &constraints) {
    string name = "boxjudge-" + random_uuid();

    process_result created;
    try {
        created = call(create_arguments(name, image, constraints), RUNTIME_CALL_TIMEOUT);
    } catch (runtime_unavailable &e) {
        throw sandbox_creation_error(e.what());
    }
    if (created.timed_out)
        throw sandbox_creation_error("docker create timed out");
    if (created.exit_code != 0)
        throw sandbox_creation_error("docker create failed: " + boost::algorithm::trim_copy(created.error));

    string id = boost::algorithm::trim_copy(created.output);
    if (id.empty()) throw sandbox_creation_error("docker create returned no container id");

    process_result started;
    try {
        started = call(make_arguments(docker, "start", id), RUNTIME_CALL_TIMEOUT);
    } catch (runtime_unavailable &e) {
        started.exit_code = -1;
        started.error = e.what();
    }
    if (started.timed_out || started.exit_code != 0) {
        // 容器已经创建但没有启动，必须在这里删除，调用方拿不到这个容器
        try {
            remove(id);
        } catch (exception &e) {
            LOG(ERROR) << "Unable to remove container " << id << " which failed to start: " << e.what();
        }
        throw sandbox_creation_error("docker start failed: " + boost::algorithm::trim_copy(started.error));
    }

    fs::path cgroup = find_cgroup(id);
    if (cgroup.empty())
        LOG(WARNING) << "Unable to locate cgroup of container " << id << ", falling back to docker stats";

    {
        lock_guard<mutex> guard(mut);
        cgroups[id] = cgroup;
    }
    return id;
}

exec_result docker_runtime::exec(const string &container_id, const string &command, const string &input, chrono::milliseconds timeout) {
    auto res = call(make_arguments(docker, "exec", "-i", "-w", "/workspace", container_id, "sh", "-c", command),
                    (int)timeout.count(), input);
    if (res.timed_out)
        throw runtime_unavailable("docker exec in container " + container_id + " did not return in time");
    if (res.exit_code != 0 && is_daemon_error(res.error))
        throw runtime_unavailable("docker exec failed: " + boost::algorithm::trim_copy(res.error));

    exec_result result;
    result.exit_code = res.exit_code;
    result.output = move(res.output);
    result.error = move(res.error);
    return result;
}

fs::path docker_runtime::find_cgroup(const string &container_id) const {
    // systemd 和 cgroupfs 两种 cgroup driver，以及 cgroup v1 的 memory 子系统
    const fs::path candidates[] = {
        cgroup_root / "system.slice" / ("docker-" + container_id + ".scope"),
        cgroup_root / "docker" / container_id,
        cgroup_root / "memory" / "system.slice" / ("docker-" + container_id + ".scope"),
        cgroup_root / "memory" / "docker" / container_id};
    error_code ec;
    for (auto &dir : candidates)
        if (fs::is_directory(dir, ec)) return dir;
    return {};
}

template <typename T>
static bool try_read_number(const fs::path &file, T &value) {
    ifstream fin(file);
    if (!fin) return false;
    string text;
    fin >> text;
    try {
        value = boost::lexical_cast<T>(text);
        return true;
    } catch (boost::bad_lexical_cast &) {
        return false;
    }
}

/**
 * @brief 读取 memory.events 或 memory.oom_control 中的 oom_kill 计数
 */
static int64_t read_oom_kill(const fs::path &file) {
    ifstream fin(file);
    string key;
    int64_t value;
    while (fin >> key >> value)
        if (key == "oom_kill") return value;
    return 0;
}

container_stats docker_runtime::read_cgroup_stats(const fs::path &dir) {
    container_stats result;
    if (fs::exists(dir / "memory.current")) {  // cgroup v2
        try_read_number(dir / "memory.current", result.memory);
        if (!try_read_number(dir / "memory.peak", result.peak_memory))
            result.peak_memory = -1;
        result.oom_killed = read_oom_kill(dir / "memory.events") > 0;
    } else {  // cgroup v1
        try_read_number(dir / "memory.usage_in_bytes", result.memory);
        if (!try_read_number(dir / "memory.max_usage_in_bytes", result.peak_memory))
            result.peak_memory = -1;
        result.oom_killed = read_oom_kill(dir / "memory.oom_control") > 0;
    }
    return result;
}

int64_t docker_runtime::parse_memory_usage(const string &text) {
    string usage = boost::algorithm::trim_copy(text.substr(0, text.find('/')));
    size_t unit_begin = usage.find_first_not_of("0123456789.");
    if (unit_begin == 0 || usage.empty())
        throw invalid_argument("malformed memory usage " + text);

    double value;
    try {
        value = boost::lexical_cast<double>(usage.substr(0, unit_begin));
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument("malformed memory usage " + text);
    }

    string unit = unit_begin == string::npos ? "B" : usage.substr(unit_begin);
    double scale;
    if (unit == "B")
        scale = 1;
    else if (unit == "KiB")
        scale = 1024.0;
    else if (unit == "MiB")
        scale = 1024.0 * 1024;
    else if (unit == "GiB")
        scale = 1024.0 * 1024 * 1024;
    else if (unit == "kB" || unit == "KB")
        scale = 1e3;
    else if (unit == "MB")
        scale = 1e6;
    else if (unit == "GB")
        scale = 1e9;
    else
        throw invalid_argument("unknown memory unit " + unit);
    return (int64_t)llround(value * scale);
}

container_stats docker_runtime::stats(const string &container_id, chrono::milliseconds timeout) {
    fs::path cgroup;
    {
        lock_guard<mutex> guard(mut);
        auto it = cgroups.find(container_id);
        if (it != cgroups.end()) cgroup = it->second;
    }
    if (!cgroup.empty()) {
        error_code ec;
        if (fs::is_directory(cgroup, ec)) return read_cgroup_stats(cgroup);
    }

    int deadline = (int)min<int64_t>(timeout.count(), RUNTIME_CALL_TIMEOUT);
    auto res = call(make_arguments(docker, "stats", "--no-stream", "--format", "{{.MemUsage}}", container_id), max(deadline, 1));
    if (res.timed_out)
        throw runtime_unavailable("docker stats did not return in " + to_string(deadline) + "ms");
    if (res.exit_code != 0)
        throw runtime_unavailable("docker stats failed: " + boost::algorithm::trim_copy(res.error));
    container_stats result;
    try {
        result.memory = parse_memory_usage(res.output);
    } catch (invalid_argument &e) {
        throw runtime_unavailable(e.what());
    }
    return result;
}

void docker_runtime::terminate(const string &container_id) {
    auto res = call(make_arguments(docker, "kill", container_id), CLEANUP_TIMEOUT);
    if (res.timed_out)
        throw runtime_unavailable("docker kill timed out");
    // 容器已经停止时 docker kill 会失败，这种情况等价于终止成功
    if (res.exit_code != 0 && res.error.find("is not running") == string::npos)
        throw runtime_unavailable("docker kill failed: " + boost::algorithm::trim_copy(res.error));
}

void docker_runtime::remove(const string &container_id) {
    process_result res;
    try {
        res = call(make_arguments(docker, "rm", "-f", "-v", container_id), CLEANUP_TIMEOUT);
    } catch (runtime_unavailable &e) {
        throw sandbox_teardown_error(e.what());
    }
    if (res.timed_out)
        throw sandbox_teardown_error("docker rm timed out for container " + container_id);
    if (res.exit_code != 0 && res.error.find("No such container") == string::npos)
        throw sandbox_teardown_error("docker rm failed: " + boost::algorithm::trim_copy(res.error));

    lock_guard<mutex> guard(mut);
    cgroups.erase(container_id);
}

}  // namespace boxjudge
