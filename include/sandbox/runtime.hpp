#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace boxjudge {

/**
 * @brief 创建沙箱时施加的资源限制
 * 这些限制必须在容器创建时就生效，不允许在选手程序运行后再补上
 */
struct sandbox_constraints {
    /**
     * @brief 内存限制（含 swap），单位为字节，小于等于 0 表示不限制
     */
    std::int64_t memory_limit = -1;

    /**
     * @brief 进程数限制
     */
    int max_processes = 64;

    /**
     * @brief 可以使用的 CPU 核数
     */
    double cpus = 1.0;

    /**
     * @brief 是否禁用网络，评测沙箱总是禁用网络
     */
    bool network_disabled = true;

    /**
     * @brief 挂载到沙箱 /workspace 的文件夹，只对这一个沙箱可见
     */
    std::filesystem::path workspace;
};

/**
 * @brief 沙箱中执行一条命令的结果
 */
struct exec_result {
    int exit_code = -1;

    std::string output;

    std::string error;
};

/**
 * @brief 沙箱的资源使用情况
 */
struct container_stats {
    /**
     * @brief 当前内存使用，单位为字节
     */
    std::int64_t memory = 0;

    /**
     * @brief 内存使用峰值，单位为字节，运行时无法提供时为 -1
     */
    std::int64_t peak_memory = -1;

    /**
     * @brief 沙箱内的进程是否因为内存不足被内核杀死
     */
    bool oom_killed = false;
};

/**
 * @brief 容器运行时接口
 * 沙箱的启动、监控、销毁都通过这个接口访问容器运行时，测试时可以替换为模拟实现，
 * 用来模拟超时、内存超限、容器运行时不可用等情况。
 *
 * 实现必须是线程安全的，多个测试点会在不同的线程中同时调用。
 */
struct container_runtime {
    virtual ~container_runtime();

    /**
     * @brief 创建并启动一个沙箱，沙箱启动后处于空闲状态，等待 exec
     * @param image 容器镜像
     * @param constraints 资源限制，创建时生效
     * @return 容器 id
     * @throw sandbox_creation_error 容器运行时不可用或者拒绝了资源限制
     */
    virtual std::string create(const std::string &image, const sandbox_constraints &constraints) = 0;

    /**
     * @brief 在沙箱中执行命令，阻塞直到命令结束
     * 命令在 /workspace 下通过 sh -c 执行。沙箱被 terminate 后该函数应当尽快返回。
     * @param container_id 容器 id
     * @param command shell 命令
     * @param input 标准输入
     * @param timeout 兜底的最长等待时间，超时后放弃等待并抛出异常
     * @throw runtime_unavailable 无法观察命令的执行情况
     */
    virtual exec_result exec(const std::string &container_id,
                             const std::string &command,
                             const std::string &input,
                             std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 查询沙箱的资源使用情况
     * @param container_id 容器 id
     * @param timeout 查询的最长等待时间，超时后放弃查询并抛出异常
     * @throw runtime_unavailable 无法查询或者查询超时
     */
    virtual container_stats stats(const std::string &container_id, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 强制杀死沙箱中的所有进程
     * @throw runtime_unavailable 容器运行时不可用
     */
    virtual void terminate(const std::string &container_id) = 0;

    /**
     * @brief 删除沙箱，包括容器的文件系统和网络命名空间
     * @throw sandbox_teardown_error 删除失败
     */
    virtual void remove(const std::string &container_id) = 0;
};

}  // namespace boxjudge
