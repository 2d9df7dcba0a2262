#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace chitin {

enum class RequestKind { Help, Version };

// Identifies a cacheable request: the subcommand path plus which flag
// asked for it. "channels login --help" and "channels login -h" share a key.
struct CacheKey {
    std::vector<std::string> path; // empty = main command
    RequestKind kind = RequestKind::Help;

    // "channels login#help", "#version"
    std::string to_string() const;

    // Argument vector used to capture fresh output: path + canonical flag
    std::vector<std::string> capture_args() const;

    bool operator==(const CacheKey& other) const {
        return path == other.path && kind == other.kind;
    }
};

struct Invocation {
    enum class Route { Cacheable, Delegate };
    Route route = Route::Delegate;
    CacheKey key; // meaningful only for Cacheable

    bool cacheable() const { return route == Route::Cacheable; }
};

const char* kind_name(RequestKind kind);

// Pure, total classification of an argument vector (argv without argv[0]).
//  - no arguments: main help
//  - leading command-like tokens form the path (at most max_depth of them)
//  - every token after the path must be a help flag (--help, -h) or a version
//    flag (--version, -V), at least one present, all of the same kind
// Anything else is delegated untouched.
Invocation classify(const std::vector<std::string>& args, uint32_t max_depth = 3);

} // namespace chitin
