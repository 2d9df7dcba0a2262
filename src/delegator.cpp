#include "delegator.hpp"
#include <ostream>

namespace chitin {

Delegator::Delegator(ProcessRunner& runner, WrappedCli cli, RebrandContext rebrand,
                     std::ostream& echo)
    : runner_(runner), cli_(std::move(cli)), rebrand_(std::move(rebrand)), echo_(echo) {}

DelegationResult Delegator::run(const std::vector<std::string>& args, bool capture) {
    std::vector<std::string> argv = cli_.command;
    argv.insert(argv.end(), args.begin(), args.end());

    DelegationResult result;

    if (!capture) {
        ProcessResult pr = runner_.run(argv, StdioMode::Inherit);
        if (!pr.spawned) {
            result.status = DelegationResult::Status::SpawnError;
            result.spawn_errno = pr.spawn_errno;
            result.error = pr.error;
            return result;
        }
        result.exit_code = pr.exit_code;
        return result;
    }

    LineRebrander rebrander(rebrand_, [this](const std::string& text) {
        echo_ << text;
        echo_.flush();
    });

    ProcessResult pr = runner_.run(argv, StdioMode::Capture,
        [&rebrander](const char* data, size_t len) { rebrander.feed(data, len); });
    rebrander.finish();

    if (!pr.spawned) {
        result.status = DelegationResult::Status::SpawnError;
        result.spawn_errno = pr.spawn_errno;
        result.error = pr.error;
        return result;
    }
    result.exit_code = pr.exit_code;
    result.captured = rebrander.output();
    return result;
}

} // namespace chitin
