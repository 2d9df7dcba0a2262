#include "dispatcher.hpp"
#include "cache/cache_policy.hpp"
#include "util.hpp"
#include <cerrno>

namespace chitin {

Dispatcher::Dispatcher(const Config& config, ProcessRunner& runner,
                       std::ostream& out, std::ostream& err)
    : config_(config), runner_(runner), out_(out), err_(err),
      detector_(config), store_(config.cache_path()), clock_(epoch_seconds) {}

void Dispatcher::debug(const std::string& message) {
    if (config_.debug) err_ << "[" << config_.brand.to << "] " << message << "\n";
}

std::optional<WrappedCli> Dispatcher::locate() {
    auto cli = detector_.locate_wrapped_cli();
    if (!cli && install_handler_ && install_handler_()) {
        cli = detector_.locate_wrapped_cli();
    }
    return cli;
}

int Dispatcher::handle(const std::vector<std::string>& args) {
    Invocation inv = classify(args, config_.max_path_depth);
    debug(inv.cacheable() ? "cacheable: " + inv.key.to_string() : std::string("delegate"));

    auto cli = locate();
    if (!cli) {
        err_ << config_.brand.to << ": cannot find '" << detector_.package_name()
             << "' on PATH or in a global Node.js install.\n\n"
             << install_guidance(detector_.package_name());
        return kExitNotFound;
    }

    if (inv.cacheable()) {
        return handle_cacheable(inv.key, *cli);
    }

    RebrandContext rebrand{config_.brand, VersionProbe::wrapper_version(), ""};
    Delegator delegator(runner_, *cli, rebrand, out_);
    DelegationResult result = delegator.run(args, false);
    if (result.spawn_failed()) return report_spawn_error(result);
    return result.exit_code;
}

int Dispatcher::handle_cacheable(const CacheKey& key, const WrappedCli& cli) {
    VersionProbe probe(detector_, cli, runner_);
    const VersionResult& wrapped = probe.wrapped_version();
    Versions current{VersionProbe::wrapper_version(), wrapped.version};

    bool use_cache = config_.cache.enabled && wrapped.available;
    if (!wrapped.available) {
        debug("version probe failed (" + wrapped.error + "), bypassing cache");
    } else {
        debug(std::string("wrapped version ") + wrapped.version + " from " + wrapped.source);
    }

    std::string cache_key = key.to_string();
    if (use_cache) {
        store_.load();
        CacheDecision decision = decide(store_.get(cache_key), current, clock_(), config_.cache.ttl);
        debug(std::string("cache ") + decision_name(decision.kind) + " for " + cache_key);
        if (decision.hit()) {
            out_ << decision.content;
            out_.flush();
            return 0;
        }
    }

    RebrandContext rebrand{config_.brand, current.wrapper, current.wrapped};
    Delegator delegator(runner_, cli, rebrand, out_);
    DelegationResult result = delegator.run(key.capture_args(), true);
    if (result.spawn_failed()) return report_spawn_error(result);

    if (use_cache && result.exit_code == 0 && !result.captured.empty()) {
        HelpCacheEntry entry{result.captured, current.wrapper, current.wrapped, clock_()};
        if (!store_.put(cache_key, entry)) {
            debug("continuing without caching " + cache_key);
        }
    }
    return result.exit_code;
}

int Dispatcher::report_spawn_error(const DelegationResult& result) {
    err_ << config_.brand.to << ": failed to run '" << detector_.package_name()
         << "': " << result.error << "\n";
    if (result.spawn_errno == ENOENT) {
        err_ << "\n" << install_guidance(detector_.package_name());
        return kExitNotFound;
    }
    return kExitCannotExecute;
}

} // namespace chitin
