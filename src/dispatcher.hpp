#pragma once
#include "cache/help_cache.hpp"
#include "classify.hpp"
#include "config.hpp"
#include "delegator.hpp"
#include "process.hpp"
#include "runtime.hpp"
#include "version_probe.hpp"
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace chitin {

// Exit codes authored by chitin itself, never by the wrapped CLI.
constexpr int kExitCannotExecute = 126;
constexpr int kExitNotFound = 127;

// Called when the wrapped CLI is missing. Returns true once it is available.
using InstallHandler = std::function<bool()>;
using Clock = std::function<uint64_t()>;

// Entry point: classify the invocation, then either answer from the help
// cache or hand off to the wrapped CLI.
class Dispatcher {
public:
    Dispatcher(const Config& config, ProcessRunner& runner,
               std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // args excludes argv[0]. Returns the process exit code.
    int handle(const std::vector<std::string>& args);

    void set_clock(Clock clock) { clock_ = std::move(clock); }
    void set_install_handler(InstallHandler handler) { install_handler_ = std::move(handler); }

    const HelpCacheStore& store() const { return store_; }

private:
    std::optional<WrappedCli> locate();
    int handle_cacheable(const CacheKey& key, const WrappedCli& cli);
    int report_spawn_error(const DelegationResult& result);
    void debug(const std::string& message);

    const Config& config_;
    ProcessRunner& runner_;
    std::ostream& out_;
    std::ostream& err_;
    RuntimeDetector detector_;
    HelpCacheStore store_;
    Clock clock_;
    InstallHandler install_handler_;
};

} // namespace chitin
