#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace chitin {

enum class StdioMode {
    Inherit, // child shares our stdin, stdout and stderr
    Capture, // child's stdout is piped back to us; stdin and stderr are shared
    Silent,  // stdout piped back; stdin and stderr go to /dev/null
};

// Receives raw stdout bytes as they arrive (Capture/Silent only).
using OutputCallback = std::function<void(const char* data, size_t len)>;

struct ProcessResult {
    bool spawned = false;  // false: the program never started (exec failed)
    int exit_code = 0;     // child's exit status, 128 + signo if killed
    int spawn_errno = 0;   // errno from fork/exec when !spawned
    std::string output;    // captured stdout (Capture/Silent only)
    std::string error;     // human-readable spawn failure
};

// Abstract subprocess runner (injectable for testing)
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Run argv[0] (PATH-searched) with the remaining arguments and wait for it.
    virtual ProcessResult run(const std::vector<std::string>& argv,
                              StdioMode mode,
                              const OutputCallback& on_output = nullptr) = 0;
};

// fork/execvp implementation. While the child runs, SIGINT and SIGQUIT are
// ignored here so the child alone decides how to react to a terminal ^C; the
// child gets default dispositions back before exec.
class PosixProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv,
                      StdioMode mode,
                      const OutputCallback& on_output = nullptr) override;
};

// Shell-style exit code from a waitpid() status.
int exit_code_from_status(int status);

} // namespace chitin
