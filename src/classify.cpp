#include "classify.hpp"
#include "util.hpp"
#include <cctype>
#include <optional>

namespace chitin {

namespace {

std::optional<RequestKind> trigger_kind(const std::string& arg) {
    if (arg == "--help" || arg == "-h") return RequestKind::Help;
    if (arg == "--version" || arg == "-V") return RequestKind::Version;
    return std::nullopt;
}

// Subcommand names: "gateway", "channels", "login", "agent:run".
// Rejects file paths, URLs, values with spaces and anything flag-like.
bool is_command_token(const std::string& arg) {
    if (arg.empty() || !std::isalnum(static_cast<unsigned char>(arg[0]))) return false;
    for (char c : arg) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '-' && c != '_' && c != '.' && c != ':') return false;
    }
    return true;
}

} // namespace

const char* kind_name(RequestKind kind) {
    return kind == RequestKind::Help ? "help" : "version";
}

std::string CacheKey::to_string() const {
    return join(path, " ") + "#" + kind_name(kind);
}

std::vector<std::string> CacheKey::capture_args() const {
    std::vector<std::string> args = path;
    args.emplace_back(kind == RequestKind::Help ? "--help" : "--version");
    return args;
}

Invocation classify(const std::vector<std::string>& args, uint32_t max_depth) {
    Invocation delegate;

    if (args.empty()) {
        Invocation inv;
        inv.route = Invocation::Route::Cacheable;
        inv.key.kind = RequestKind::Help;
        return inv;
    }

    std::vector<std::string> path;
    size_t i = 0;
    while (i < args.size() && is_command_token(args[i])) {
        if (path.size() >= max_depth) return delegate;
        path.push_back(args[i]);
        ++i;
    }

    if (i == args.size()) return delegate; // no trigger flag

    std::optional<RequestKind> kind;
    for (; i < args.size(); ++i) {
        auto k = trigger_kind(args[i]);
        if (!k) return delegate;
        if (kind && *kind != *k) return delegate;
        kind = k;
    }

    Invocation inv;
    inv.route = Invocation::Route::Cacheable;
    inv.key.path = std::move(path);
    inv.key.kind = *kind;
    return inv;
}

} // namespace chitin
