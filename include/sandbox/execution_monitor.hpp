#pragma once

#include <chrono>
#include "common/cancellation.hpp"
#include "sandbox/launcher.hpp"
#include "sandbox/outcome.hpp"
#include "sandbox/runtime.hpp"

namespace boxjudge {

/**
 * @brief 执行监控器
 * 在沙箱中的程序运行期间周期性地采样内存，超出时间限制或者内存限制时强制终止沙箱，
 * 并将程序的结束方式归类为 outcome_kind。
 */
struct execution_monitor {
    /**
     * @param runtime 容器运行时
     * @param sample_interval 内存采样间隔
     */
    execution_monitor(container_runtime &runtime, std::chrono::milliseconds sample_interval);

    /**
     * @brief 等待沙箱中的程序结束
     * 内存限制取自沙箱创建时的资源限制 handle.caps.memory_limit。
     * @param handle 已经开始执行的沙箱
     * @param time_limit 时间限制，单位为毫秒
     * @param cancel 取消标记，取消后程序会被终止并返回 SANDBOX_ERROR
     * @return 执行结果，不会抛出异常
     */
    execution_outcome supervise(sandbox_handle &handle, int time_limit, const cancellation_token *cancel = nullptr);

private:
    void terminate(const sandbox_handle &handle);

    container_runtime &runtime;
    std::chrono::milliseconds sample_interval;
};

}  // namespace boxjudge
