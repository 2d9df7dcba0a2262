#include "process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/wait.h>
#include <unistd.h>

namespace chitin {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Ignores SIGINT/SIGQUIT for its lifetime, restoring the previous handlers.
class TerminalSignalGuard {
public:
    TerminalSignalGuard() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGINT, &ignore, &old_int_);
        sigaction(SIGQUIT, &ignore, &old_quit_);
    }
    ~TerminalSignalGuard() {
        sigaction(SIGINT, &old_int_, nullptr);
        sigaction(SIGQUIT, &old_quit_, nullptr);
    }
    TerminalSignalGuard(const TerminalSignalGuard&) = delete;
    TerminalSignalGuard& operator=(const TerminalSignalGuard&) = delete;

private:
    struct sigaction old_int_ {};
    struct sigaction old_quit_ {};
};

} // namespace

int exit_code_from_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv,
                                      StdioMode mode,
                                      const OutputCallback& on_output) {
    ProcessResult result;
    if (argv.empty()) {
        result.spawn_errno = EINVAL;
        result.error = "empty command line";
        return result;
    }

    // Built before fork: the child must not allocate.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    bool capture = mode != StdioMode::Inherit;

    // Carries the exec errno back to us; closed by a successful exec.
    int exec_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int devnull = -1;

    if (pipe2(exec_pipe, O_CLOEXEC) != 0 ||
        (capture && pipe2(out_pipe, O_CLOEXEC) != 0)) {
        result.spawn_errno = errno;
        result.error = std::string("Failed to create pipes: ") + std::strerror(errno);
        close_fd(exec_pipe[0]);
        close_fd(exec_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return result;
    }
    if (mode == StdioMode::Silent) {
        devnull = open("/dev/null", O_RDWR | O_CLOEXEC);
    }

    // Anything still buffered would otherwise be written twice or out of order.
    std::cout.flush();
    std::fflush(stdout);

    TerminalSignalGuard signals;

    pid_t pid = fork();
    if (pid < 0) {
        result.spawn_errno = errno;
        result.error = std::string("Failed to fork process: ") + std::strerror(errno);
        close_fd(exec_pipe[0]);
        close_fd(exec_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(devnull);
        return result;
    }

    if (pid == 0) {
        signal(SIGINT, SIG_DFL);
        signal(SIGQUIT, SIG_DFL);
        if (capture) dup2(out_pipe[1], STDOUT_FILENO);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        execvp(cargv[0], cargv.data());
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close_fd(exec_pipe[1]);
    close_fd(out_pipe[1]);
    close_fd(devnull);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);
    bool exec_failed = n == static_cast<ssize_t>(sizeof(child_errno));

    if (capture) {
        std::array<char, 4096> buffer;
        while (true) {
            ssize_t r = read(out_pipe[0], buffer.data(), buffer.size());
            if (r < 0 && errno == EINTR) continue;
            if (r <= 0) break; // EOF or error
            result.output.append(buffer.data(), static_cast<size_t>(r));
            if (on_output) on_output(buffer.data(), static_cast<size_t>(r));
        }
        close_fd(out_pipe[0]);
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (exec_failed) {
        result.spawn_errno = child_errno;
        result.error = std::string("Failed to execute ") + argv[0] + ": " +
                       std::strerror(child_errno);
        return result;
    }

    result.spawned = true;
    if (waited < 0) {
        result.exit_code = 1;
        result.error = std::string("Failed to wait for ") + argv[0] + ": " +
                       std::strerror(errno);
        return result;
    }
    result.exit_code = exit_code_from_status(status);
    return result;
}

} // namespace chitin
