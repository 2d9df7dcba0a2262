#pragma once
#include "process.hpp"
#include "runtime.hpp"
#include <optional>
#include <string>

#ifndef CHITIN_VERSION
#define CHITIN_VERSION "0.0.0-dev"
#endif

namespace chitin {

// Versions of this shim and of the wrapped CLI. The wrapped version is
// probed at most once per process and the result reused.
class VersionProbe {
public:
    VersionProbe(const RuntimeDetector& detector, WrappedCli cli, ProcessRunner& runner);

    static std::string wrapper_version() { return CHITIN_VERSION; }

    const VersionResult& wrapped_version();

    bool probed() const { return result_.has_value(); }

private:
    const RuntimeDetector& detector_;
    WrappedCli cli_;
    ProcessRunner& runner_;
    std::optional<VersionResult> result_;
};

} // namespace chitin
