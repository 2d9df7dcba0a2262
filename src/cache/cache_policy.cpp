#include "cache_policy.hpp"

namespace chitin {

const char* decision_name(CacheDecision::Kind kind) {
    switch (kind) {
        case CacheDecision::Kind::Hit:   return "hit";
        case CacheDecision::Kind::Miss:  return "miss";
        case CacheDecision::Kind::Stale: return "stale";
    }
    return "miss";
}

CacheDecision decide(const std::optional<HelpCacheEntry>& entry,
                     const Versions& current,
                     uint64_t now,
                     uint64_t ttl_seconds) {
    CacheDecision d;
    if (!entry) {
        d.kind = CacheDecision::Kind::Miss;
        return d;
    }

    // Version drift first: a fresh entry from another version is still wrong.
    if (entry->wrapper_version != current.wrapper ||
        entry->wrapped_version != current.wrapped) {
        d.kind = CacheDecision::Kind::Stale;
        return d;
    }

    if (entry->created_at > now || now - entry->created_at >= ttl_seconds) {
        d.kind = CacheDecision::Kind::Stale;
        return d;
    }

    d.kind = CacheDecision::Kind::Hit;
    d.content = entry->content;
    return d;
}

} // namespace chitin
