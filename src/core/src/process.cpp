#include "../include/rotap_process.hpp"

#include <algorithm>
#include <array>
#include <thread>

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rotap {

static constexpr size_t MAX_CAPTURE = 64 * 1024;

static int decode_status(int status) {
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

static void kill_and_reap(pid_t pid, int& status) {
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) break;
    }
}

ProcessResult run_process(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout) {
    ProcessResult result;
    if (argv.empty()) return result;

    // Build argv before fork: only async-signal-safe calls in the child
    std::vector<const char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(a.c_str());
    cargv.push_back(nullptr);

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1) {
        result.output = "pipe failed";
        return result;
    }

    pid_t pid = fork();
    if (pid == -1) {
        close(pipefd[0]);
        close(pipefd[1]);
        result.output = "fork failed";
        return result;
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        execvp(cargv[0], const_cast<char* const*>(cargv.data()));
        _exit(127);  // execvp failed
    }

    close(pipefd[1]);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    auto remaining_ms = [&]() -> int {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        return left > 0 ? static_cast<int>(left) : 0;
    };

    std::array<char, 4096> buffer;
    bool eof = false;
    while (!eof) {
        int wait_ms = remaining_ms();
        if (wait_ms == 0) {
            result.timed_out = true;
            break;
        }
        pollfd pfd{pipefd[0], POLLIN, 0};
        int pr = poll(&pfd, 1, wait_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) continue;  // deadline re-checked at loop top

        ssize_t n = read(pipefd[0], buffer.data(), buffer.size());
        if (n > 0) {
            if (result.output.size() < MAX_CAPTURE) {
                size_t take = std::min(static_cast<size_t>(n), MAX_CAPTURE - result.output.size());
                result.output.append(buffer.data(), take);
            }
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            break;
        }
    }
    close(pipefd[0]);

    int status = 0;
    if (result.timed_out) {
        kill_and_reap(pid, status);
        result.exit_code = -1;
        return result;
    }

    // Output closed; the child may still be running. Poll for exit until the deadline.
    while (true) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            result.exit_code = decode_status(status);
            return result;
        }
        if (w < 0 && errno != EINTR) {
            result.exit_code = -1;
            return result;
        }
        if (remaining_ms() == 0) {
            result.timed_out = true;
            kill_and_reap(pid, status);
            result.exit_code = -1;
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace rotap
