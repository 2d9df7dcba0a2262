#pragma once
#include "process.hpp"
#include "rebrand.hpp"
#include "runtime.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace chitin {

struct DelegationResult {
    enum class Status { Completed, SpawnError };

    Status status = Status::Completed;
    int exit_code = 0;      // the child's, untouched
    std::string captured;   // rebranded stdout, capture mode only
    int spawn_errno = 0;
    std::string error;

    bool spawn_failed() const { return status == Status::SpawnError; }
};

// Runs the wrapped CLI on behalf of the user.
//
// capture == false: stdio is inherited, arguments are passed verbatim and
// nothing is transformed; the child's exit code is returned as is.
//
// capture == true: stdout is read back, rebranded line by line and echoed to
// `echo` as it arrives; the rebranded text is also returned for caching.
// stdin and stderr stay attached to the terminal.
class Delegator {
public:
    Delegator(ProcessRunner& runner, WrappedCli cli, RebrandContext rebrand, std::ostream& echo);

    DelegationResult run(const std::vector<std::string>& args, bool capture);

    const WrappedCli& cli() const { return cli_; }

private:
    ProcessRunner& runner_;
    WrappedCli cli_;
    RebrandContext rebrand_;
    std::ostream& echo_;
};

} // namespace chitin
