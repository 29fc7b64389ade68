#include "common/utils.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <system_error>

namespace boxjudge {
using namespace std;

namespace {

struct pipe_pair {
    int fds[2] = {-1, -1};

    pipe_pair() {
        if (pipe2(fds, O_CLOEXEC) < 0)
            throw system_error(errno, system_category(), "pipe2");
    }

    ~pipe_pair() {
        close_read();
        close_write();
    }

    void close_read() {
        if (fds[0] >= 0) close(fds[0]);
        fds[0] = -1;
    }

    void close_write() {
        if (fds[1] >= 0) close(fds[1]);
        fds[1] = -1;
    }
};

void append_limited(string &buffer, const char *data, size_t size, size_t limit) {
    if (buffer.size() >= limit) return;
    buffer.append(data, min(size, limit - buffer.size()));
}

}  // namespace

process_result run_process(const vector<string> &args, const string &input, chrono::milliseconds timeout, size_t output_limit) {
    if (args.empty()) throw invalid_argument("run_process requires at least argv[0]");

    // argv 必须在 fork 之前准备好，子进程只能调用 async-signal-safe 的函数
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    pipe_pair in, out, err;

    pid_t pid = fork();
    if (pid < 0) throw system_error(errno, system_category(), "fork");
    if (pid == 0) {  // 子进程
        // 避免子进程被终止，要求父进程处理中断信号
        signal(SIGINT, SIG_IGN);
        signal(SIGPIPE, SIG_DFL);
        dup2(in.fds[0], STDIN_FILENO);
        dup2(out.fds[1], STDOUT_FILENO);
        dup2(err.fds[1], STDERR_FILENO);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    in.close_read();
    out.close_write();
    err.close_write();
    fcntl(in.fds[1], F_SETFL, O_NONBLOCK);

    process_result result;
    size_t written = 0;
    if (input.empty()) in.close_write();

    auto deadline = chrono::steady_clock::now() + timeout;
    char buffer[8192];
    while (out.fds[0] >= 0 || err.fds[0] >= 0) {
        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            kill(pid, SIGKILL);
            result.timed_out = true;
            break;
        }

        pollfd fds[3];
        int nfds = 0;
        if (in.fds[1] >= 0) fds[nfds++] = {in.fds[1], POLLOUT, 0};
        if (out.fds[0] >= 0) fds[nfds++] = {out.fds[0], POLLIN, 0};
        if (err.fds[0] >= 0) fds[nfds++] = {err.fds[0], POLLIN, 0};

        int wait_ms = (int)chrono::duration_cast<chrono::milliseconds>(deadline - now).count() + 1;
        int ret = poll(fds, nfds, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            throw system_error(errno, system_category(), "poll");
        }

        for (int i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;
            if (fds[i].fd == in.fds[1]) {
                ssize_t n = write(in.fds[1], input.data() + written, input.size() - written);
                if (n > 0) written += n;
                // EPIPE 表示外部命令不再读取标准输入
                if ((n < 0 && errno != EAGAIN && errno != EINTR) || written == input.size())
                    in.close_write();
            } else {
                bool is_out = fds[i].fd == out.fds[0];
                ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0) {
                    append_limited(is_out ? result.output : result.error, buffer, n, output_limit);
                } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                    if (is_out)
                        out.close_read();
                    else
                        err.close_read();
                }
            }
        }
    }

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw system_error(errno, system_category(), "waitpid");
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    }
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string random_uuid() {
    return boost::lexical_cast<string>(boost::uuids::random_generator()());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace boxjudge
