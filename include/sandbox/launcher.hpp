#pragma once

#include <chrono>
#include <filesystem>
#include <future>
#include <string>
#include "common/io_utils.hpp"
#include "judge/language.hpp"
#include "judge/submission.hpp"
#include "sandbox/outcome.hpp"
#include "sandbox/runtime.hpp"

namespace boxjudge {

struct sandbox_cleaner;

/**
 * @brief 沙箱中命令执行结束的时刻和结果
 */
struct finished_execution {
    exec_result result;
    std::chrono::steady_clock::time_point finished_at;
};

/**
 * @brief 表示一个已经启动的沙箱
 * 只能移动，不能复制：沙箱启动器创建后交给执行监控器使用，最后由沙箱清理器销毁，
 * 任何时候都只有一个所有者，避免多个线程同时操作同一个沙箱。
 */
struct sandbox_handle {
    std::string container_id;

    std::chrono::system_clock::time_point created_at;

    /**
     * @brief 创建沙箱时施加的资源限制
     */
    sandbox_constraints caps;

    /**
     * @brief 沙箱运行的测试点 id，编译沙箱为空
     */
    std::string test_case_id;

    /**
     * @brief 只挂载给这个沙箱的文件夹，销毁沙箱时一并删除
     * 编译沙箱挂载的是提交的编译目录，由评测过程持有，这里为空
     */
    scoped_directory scope;

    /**
     * @brief 命令开始执行的时刻，用于计算运行时间和超时
     */
    std::chrono::steady_clock::time_point started_at;

    /**
     * @brief 正在沙箱中执行的命令
     */
    std::future<finished_execution> execution;

    /**
     * @brief 是否已经被销毁
     */
    bool released = false;

    /**
     * @brief 销毁是否成功，released 为真时有效
     */
    bool teardown_succeeded = true;
};

/**
 * @brief 沙箱启动器
 * 为每个（提交，测试点）创建一个独立的沙箱：准备只对该沙箱可见的文件夹，
 * 带着资源限制创建容器，然后开始执行运行命令。
 */
struct sandbox_launcher {
    sandbox_launcher(container_runtime &runtime, sandbox_cleaner &cleaner);

    /**
     * @brief 为一个测试点启动沙箱
     * @param submit 选手提交
     * @param kase 测试点，输入数据会喂给选手程序的标准输入
     * @param profile 提交所使用语言的配置
     * @param artifacts 编译目录，非空时复制到沙箱的文件夹中；为空时直接写入选手源代码
     * @return 已经开始执行运行命令的沙箱
     * @throw sandbox_creation_error 容器运行时不可用或者拒绝了资源限制
     */
    sandbox_handle launch(const submission &submit, const test_case &kase, const language_profile &profile, const std::filesystem::path &artifacts);

    /**
     * @brief 启动一个一次性的编译沙箱，编译目录挂载到沙箱中，编译产物直接写入编译目录
     * @param build_dir 编译目录，必须已经包含选手源代码
     * @throw sandbox_creation_error 容器运行时不可用或者拒绝了资源限制
     */
    sandbox_handle launch_compile(const submission &submit, const language_profile &profile, const std::filesystem::path &build_dir);

    /**
     * @brief 将选手源代码写入 dir
     */
    static void write_source(const submission &submit, const language_profile &profile, const std::filesystem::path &dir);

    /**
     * @brief 将编译沙箱的执行结果转换为编译结果
     * 正常结束表示编译成功；超时、内存超限、返回值非 0 都是编译错误；沙箱错误保持不变
     */
    static execution_outcome classify_compilation(execution_outcome outcome);

private:
    sandbox_handle start(sandbox_handle &&handle, const std::string &image, const std::string &command, const std::string &input, int time_limit);

    container_runtime &runtime;
    sandbox_cleaner &cleaner;
};

}  // namespace boxjudge
