#include "version_probe.hpp"

namespace chitin {

VersionProbe::VersionProbe(const RuntimeDetector& detector, WrappedCli cli, ProcessRunner& runner)
    : detector_(detector), cli_(std::move(cli)), runner_(runner) {}

const VersionResult& VersionProbe::wrapped_version() {
    if (!result_) {
        result_ = detector_.probe_version(cli_, runner_);
    }
    return *result_;
}

} // namespace chitin
