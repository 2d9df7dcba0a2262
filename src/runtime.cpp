#include "runtime.hpp"
#include "util.hpp"

#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chitin {

namespace {

constexpr int kManifestSearchDepth = 4;

bool is_executable_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

bool same_file(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return false;
    std::error_code ec;
    bool eq = fs::equivalent(a, b, ec);
    return !ec && eq;
}

std::string self_executable() {
    std::error_code ec;
    auto p = fs::read_symlink("/proc/self/exe", ec);
    return ec ? std::string() : p.string();
}

} // namespace

RuntimeDetector::RuntimeDetector(const Config& config)
    : wrapped_command_(config.wrapped_command),
      pinned_version_(config.wrapped_version),
      package_name_(fs::path(config.wrapped_command).filename().string()) {}

std::optional<std::string> find_in_path(const std::string& name, const std::string& skip) {
    if (name.empty()) return std::nullopt;
    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;

    for (auto dir : split(path_env, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (!is_executable_file(candidate)) continue;
        if (same_file(candidate, skip)) continue;
        return candidate;
    }
    return std::nullopt;
}

std::optional<std::string> read_manifest_version(const std::string& entry_path,
                                                 const std::string& package_name) {
    std::error_code ec;
    fs::path resolved = fs::canonical(entry_path, ec);
    if (ec) return std::nullopt;

    fs::path dir = resolved.parent_path();
    for (int depth = 0; depth < kManifestSearchDepth && !dir.empty(); ++depth) {
        std::string raw;
        if (read_file((dir / "package.json").string(), raw)) {
            try {
                auto j = nlohmann::json::parse(raw);
                if (j.is_object() && j.value("name", "") == package_name &&
                    j.contains("version") && j["version"].is_string()) {
                    return j["version"].get<std::string>();
                }
            } catch (const nlohmann::json::exception&) { // NOLINT(bugprone-empty-catch)
                // Unreadable manifest, keep walking up
            }
        }
        if (dir == dir.root_path()) break;
        dir = dir.parent_path();
    }
    return std::nullopt;
}

std::string parse_version_output(const std::string& output) {
    for (const auto& raw_line : split(output, '\n')) {
        std::string line = trim(raw_line);
        if (line.empty()) continue;
        auto pos = line.find_last_of(" \t");
        return pos == std::string::npos ? line : line.substr(pos + 1);
    }
    return {};
}

std::string install_guidance(const std::string& package_name) {
    return package_name + " requires Node.js >= 22 and a package manager.\n"
           "\n"
           "Option 1 (Recommended): Install pnpm + Node.js\n"
           "  curl -fsSL https://get.pnpm.io/install.sh | sh -\n"
           "  pnpm env use --global 22\n"
           "  pnpm add -g " + package_name + "@latest\n"
           "\n"
           "Option 2: Install Node.js via your system package manager, then\n"
           "  npm install -g " + package_name + "@latest\n";
}

bool RuntimeDetector::has_node() const {
    return find_in_path("node").has_value();
}

std::optional<std::string> RuntimeDetector::find_node_entry() const {
    std::string home = home_dir();
    std::string entry = package_name_ + ".mjs";
    std::error_code ec;

    std::vector<std::string> candidates;
    if (!home.empty()) {
        // pnpm global store: .pnpm/<name>@<version>/node_modules/<name>/<name>.mjs
        std::string pnpm_store = home + "/.local/share/pnpm/global/5/.pnpm";
        for (fs::directory_iterator it(pnpm_store, ec), end; !ec && it != end; it.increment(ec)) {
            std::string dirname = it->path().filename().string();
            if (!starts_with(dirname, package_name_ + "@")) continue;
            fs::path candidate = it->path() / "node_modules" / package_name_ / entry;
            if (fs::exists(candidate, ec)) return candidate.string();
        }
        candidates.push_back(home + "/.local/share/pnpm/global/5/node_modules/" +
                             package_name_ + "/" + entry);
    }
    candidates.push_back("/usr/lib/node_modules/" + package_name_ + "/" + entry);
    candidates.push_back("/usr/local/lib/node_modules/" + package_name_ + "/" + entry);
    if (!home.empty()) {
        candidates.push_back(home + "/.npm-global/lib/node_modules/" + package_name_ + "/" + entry);
        candidates.push_back(home + "/node_modules/" + package_name_ + "/" + entry);
    }

    for (const auto& c : candidates) {
        if (fs::exists(c, ec)) return c;
    }
    return std::nullopt;
}

std::optional<WrappedCli> RuntimeDetector::locate_wrapped_cli() const {
    if (wrapped_command_.find('/') != std::string::npos) {
        std::string path = expand_home(wrapped_command_);
        if (!is_executable_file(path)) return std::nullopt;
        return WrappedCli{{path}, path};
    }

    if (auto path = find_in_path(wrapped_command_, self_executable())) {
        return WrappedCli{{*path}, *path};
    }

    if (has_node()) {
        if (auto entry = find_node_entry()) {
            return WrappedCli{{"node", *entry}, *entry};
        }
    }
    return std::nullopt;
}

VersionResult RuntimeDetector::probe_version(const WrappedCli& cli, ProcessRunner& runner) const {
    VersionResult vr;

    if (!pinned_version_.empty()) {
        vr.available = true;
        vr.version = pinned_version_;
        vr.source = "config";
        return vr;
    }

    if (auto v = read_manifest_version(cli.entry_path, package_name_)) {
        vr.available = true;
        vr.version = *v;
        vr.source = "manifest";
        return vr;
    }

    std::vector<std::string> argv = cli.command;
    argv.emplace_back("--version");
    ProcessResult pr = runner.run(argv, StdioMode::Silent);
    vr.source = "probe";
    if (!pr.spawned) {
        vr.error = pr.error;
        return vr;
    }
    if (pr.exit_code != 0) {
        vr.error = package_name_ + " --version exited with " + std::to_string(pr.exit_code);
        return vr;
    }
    vr.version = parse_version_output(pr.output);
    if (vr.version.empty()) {
        vr.error = package_name_ + " --version printed nothing";
        return vr;
    }
    vr.available = true;
    return vr;
}

} // namespace chitin
