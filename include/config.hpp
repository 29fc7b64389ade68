#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

/**
 * 进程级配置
 * 这些变量只在 main 启动 worker 之前设置一次，之后只读，可以被任意线程并发读取。
 * 每个提交的评测状态都保存在各自的评测过程中，不放在这里。
 */
namespace boxjudge {

/**
 * @brief 选手程序编译及运行的根目录
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * └── 5100001 // submission id
 *     ├── compile // 选手程序的代码和编译目录，挂载到编译沙箱的 /workspace
 *     │   ├── main.cpp // 选手程序的主代码（示例）
 *     │   └── main // 编译产物
 *     ├── run-[uuid] // 一个测试点的运行目录，从 compile 复制而来，只挂载给该测试点的沙箱
 *     └── run-...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 容器运行时的命令行工具，默认为 docker
 */
extern std::string DOCKER_BIN;

/**
 * @brief 同一个提交最多同时运行多少个沙箱
 * 这个值应该根据机器能安全承载的并发容器数配置，不能无限并发
 */
extern std::size_t MAX_WORKERS;

/**
 * @brief 每个沙箱最多允许多少个进程
 */
extern int MAX_PROCESSES;

/**
 * @brief 每个沙箱可以使用的 CPU 核数
 */
extern double SANDBOX_CPUS;

/**
 * @brief 编译时间限制，单位为毫秒
 */
extern int COMPILE_TIME_LIMIT;

/**
 * @brief 编译内存限制，单位为字节
 */
extern std::int64_t COMPILE_MEMORY_LIMIT;

/**
 * @brief 每次调用容器运行时销毁沙箱的最长等待时间，单位为毫秒
 */
extern int CLEANUP_TIMEOUT;

/**
 * @brief 创建沙箱、查询沙箱状态时调用容器运行时的最长等待时间，单位为毫秒
 */
extern int RUNTIME_CALL_TIMEOUT;

/**
 * @brief 内存采样间隔，单位为毫秒
 */
extern int SAMPLE_INTERVAL;

/**
 * @brief 选手程序标准输出、标准错误输出各自最多保存多少字节
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统不会删除产生的提交目录，以便手动检查测试产生的文件内容是否符合预期。
 */
extern bool DEBUG;

}  // namespace boxjudge
