#pragma once
#include "config.hpp"
#include "process.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chitin {

// How to start the wrapped CLI.
struct WrappedCli {
    std::vector<std::string> command; // {"/usr/bin/openclaw"} or {"node", ".../openclaw.mjs"}
    std::string entry_path;           // file whose package.json carries the version
};

struct VersionResult {
    bool available = false;
    std::string version;
    std::string source; // "config", "manifest" or "probe"
    std::string error;
};

// Locates the wrapped CLI and determines its version.
class RuntimeDetector {
public:
    explicit RuntimeDetector(const Config& config);

    // Explicit path from config, else PATH (skipping this executable), else a
    // global Node.js install of the package run through `node`.
    std::optional<WrappedCli> locate_wrapped_cli() const;

    // Pinned version, else package.json next to the entry point, else
    // `<cli> --version` with output captured silently.
    VersionResult probe_version(const WrappedCli& cli, ProcessRunner& runner) const;

    bool has_node() const;

    // Package/command name of the wrapped CLI ("openclaw")
    const std::string& package_name() const { return package_name_; }

private:
    std::optional<std::string> find_node_entry() const;

    std::string wrapped_command_;
    std::string pinned_version_;
    std::string package_name_;
};

// Search PATH for an executable. Paths equivalent to `skip` are ignored.
std::optional<std::string> find_in_path(const std::string& name,
                                        const std::string& skip = "");

// Version from the nearest package.json named `package_name` at or above
// the (symlink-resolved) entry point.
std::optional<std::string> read_manifest_version(const std::string& entry_path,
                                                 const std::string& package_name);

// "openclaw 2026.2.1\n" -> "2026.2.1". Empty if there is no output.
std::string parse_version_output(const std::string& output);

// Printed when the wrapped CLI cannot be found or started.
std::string install_guidance(const std::string& package_name);

} // namespace chitin
