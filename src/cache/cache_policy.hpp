#pragma once
#include "help_cache.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace chitin {

struct Versions {
    std::string wrapper;
    std::string wrapped;
};

struct CacheDecision {
    enum class Kind { Hit, Miss, Stale };
    Kind kind = Kind::Miss;
    std::string content; // set on Hit

    bool hit() const { return kind == Kind::Hit; }
};

const char* decision_name(CacheDecision::Kind kind);

// Decide whether a cached entry may be served.
//  1. no entry                                 -> Miss
//  2. either recorded version differs          -> Stale (regardless of age)
//  3. now - created_at >= ttl, or created_at
//     lies in the future                       -> Stale
//  4. otherwise                                -> Hit(content)
CacheDecision decide(const std::optional<HelpCacheEntry>& entry,
                     const Versions& current,
                     uint64_t now,
                     uint64_t ttl_seconds);

} // namespace chitin
