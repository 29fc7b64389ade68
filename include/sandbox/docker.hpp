#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "common/utils.hpp"
#include "sandbox/runtime.hpp"

namespace boxjudge {

/**
 * @brief 通过 docker 命令行工具实现的容器运行时
 *
 * 每个沙箱是一个以 sleep infinity 为主进程的容器，创建时就带上全部资源限制：
 * docker create --network none --memory <b> --memory-swap <b> --pids-limit <n> --cpus <c> ...
 * 选手程序通过 docker exec 在容器中运行，杀死容器（docker kill）会连带杀死选手程序。
 *
 * 内存采样优先直接读取容器的 cgroup 文件，找不到 cgroup 时退回到 docker stats。
 * 每次调用命令行工具都有期限，命令行工具卡住时会被杀死并视为容器运行时不可用。
 */
struct docker_runtime : public container_runtime {
    /**
     * @param docker docker 命令行工具的路径
     * @param cgroup_root cgroup 文件系统的挂载点
     */
    explicit docker_runtime(const std::string &docker, const std::filesystem::path &cgroup_root = "/sys/fs/cgroup");

    std::string create(const std::string &image, const sandbox_constraints &constraints) override;

    exec_result exec(const std::string &container_id,
                     const std::string &command,
                     const std::string &input,
                     std::chrono::milliseconds timeout) override;

    container_stats stats(const std::string &container_id, std::chrono::milliseconds timeout) override;

    void terminate(const std::string &container_id) override;

    void remove(const std::string &container_id) override;

    /**
     * @brief 构造 docker create 的参数列表
     */
    std::vector<std::string> create_arguments(const std::string &name, const std::string &image, const sandbox_constraints &constraints) const;

    /**
     * @brief 查找容器的 cgroup 文件夹，找不到时返回空路径
     */
    std::filesystem::path find_cgroup(const std::string &container_id) const;

    /**
     * @brief 从 cgroup 文件夹读取内存使用情况，兼容 cgroup v1 和 v2
     */
    static container_stats read_cgroup_stats(const std::filesystem::path &cgroup_dir);

    /**
     * @brief 解析 docker stats 的 MemUsage 列，如 "12.5MiB / 256MiB"
     * @return 当前内存使用，单位为字节
     * @throw std::invalid_argument 格式不正确
     */
    static std::int64_t parse_memory_usage(const std::string &text);

private:
    process_result call(const std::vector<std::string> &args, int timeout_ms, const std::string &input = "");

    std::string docker;
    std::filesystem::path cgroup_root;

    std::mutex mut;
    std::map<std::string, std::filesystem::path> cgroups;
};

}  // namespace boxjudge
