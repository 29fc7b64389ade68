#include "sandbox/cleanup.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace boxjudge {
using namespace std;

sandbox_cleaner::sandbox_cleaner(container_runtime &runtime)
    : runtime(runtime) {}

bool sandbox_cleaner::release(sandbox_handle &handle) {
    if (handle.released) return handle.teardown_succeeded;
    handle.released = true;

    bool succeeded = true;
    bool running = handle.execution.valid() &&
                   handle.execution.wait_for(chrono::seconds(0)) != future_status::ready;

    if (!handle.container_id.empty()) {
        if (running) {
            try {
                runtime.terminate(handle.container_id);
            } catch (exception &e) {
                // docker rm -f 仍然会杀死容器，这里只记录日志
                LOG(WARNING) << "Unable to terminate container " << handle.container_id << ": " << e.what();
            }
        }

        try {
            runtime.remove(handle.container_id);
            DLOG(INFO) << "Container " << handle.container_id << " removed";
        } catch (exception &e) {
            LOG(ERROR) << "Unable to remove container " << handle.container_id << ": " << e.what();
            succeeded = false;
        }
    }

    if (handle.execution.valid()) {
        if (handle.execution.wait_for(chrono::milliseconds(CLEANUP_TIMEOUT)) != future_status::ready)
            LOG(ERROR) << "Execution in container " << handle.container_id << " is still running after teardown";
        try {
            // std::async 返回的 future 析构时会等待执行结束，exec 自身有期限，因此这里不会无限阻塞
            handle.execution.get();
        } catch (exception &e) {
            LOG(INFO) << "Execution in container " << handle.container_id << " ended with: " << e.what();
        }
    }

    if (!handle.scope.release())
        succeeded = false;

    handle.teardown_succeeded = succeeded;
    return succeeded;
}

scoped_sandbox::scoped_sandbox(sandbox_cleaner &cleaner, sandbox_handle &&handle)
    : cleaner(&cleaner), handle(move(handle)) {}

scoped_sandbox::scoped_sandbox(scoped_sandbox &&other)
    : cleaner(other.cleaner), handle(move(other.handle)) {
    // 被移动后的对象不再持有沙箱
    other.handle.container_id.clear();
    other.handle.released = true;
    other.handle.teardown_succeeded = true;
}

scoped_sandbox::~scoped_sandbox() {
    release();
}

sandbox_handle &scoped_sandbox::get() {
    return handle;
}

bool scoped_sandbox::release() {
    return cleaner->release(handle);
}

}  // namespace boxjudge
