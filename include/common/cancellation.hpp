#pragma once

#include <atomic>

namespace boxjudge {

/**
 * @brief 取消标记，由调用方持有，评测线程轮询
 * cancel 只做一次原子写入，可以在信号处理函数中调用
 */
struct cancellation_token {
    void cancel() noexcept {
        flag.store(true);
    }

    bool cancelled() const noexcept {
        return flag.load();
    }

private:
    std::atomic<bool> flag{false};
};

}  // namespace boxjudge
