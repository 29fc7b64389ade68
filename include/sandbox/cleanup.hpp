#pragma once

#include "sandbox/launcher.hpp"
#include "sandbox/runtime.hpp"

namespace boxjudge {

/**
 * @brief 沙箱清理器
 * 负责销毁沙箱：杀死仍在运行的程序，删除容器，等待 exec 调用返回，最后删除沙箱的文件夹。
 * 同一个沙箱只会被销毁一次，重复调用 release 直接返回第一次的结果。
 */
struct sandbox_cleaner {
    explicit sandbox_cleaner(container_runtime &runtime);

    /**
     * @brief 销毁沙箱
     * 销毁失败不会抛出异常，只会记录日志并返回 false
     * @return 容器和文件夹是否都已经删除
     */
    bool release(sandbox_handle &handle);

private:
    container_runtime &runtime;
};

/**
 * @brief 在作用域结束时销毁沙箱
 * 无论评测过程正常结束、抛出异常还是被取消，沙箱都会被销毁恰好一次。
 *
 * @code{.cpp}
 * scoped_sandbox lease(cleaner, launcher.launch(submit, kase, profile, build_dir));
 * auto outcome = monitor.supervise(lease.get(), kase.time_limit);
 * if (!lease.release()) { ... }
 * @endcode
 */
struct scoped_sandbox {
    scoped_sandbox(sandbox_cleaner &cleaner, sandbox_handle &&handle);
    scoped_sandbox(scoped_sandbox &&other);
    scoped_sandbox(const scoped_sandbox &) = delete;
    scoped_sandbox &operator=(const scoped_sandbox &) = delete;
    ~scoped_sandbox();

    sandbox_handle &get();

    /**
     * @brief 提前销毁沙箱，以便获取销毁结果
     * @return 销毁是否成功
     */
    bool release();

private:
    sandbox_cleaner *cleaner;
    sandbox_handle handle;
};

}  // namespace boxjudge
