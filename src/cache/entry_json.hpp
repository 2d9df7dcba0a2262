#pragma once
#include "help_cache.hpp"
#include <nlohmann/json.hpp>

namespace chitin {

// JSON <-> HelpCacheEntry conversion for the on-disk cache file.

inline bool entry_is_well_formed(const nlohmann::json& item) {
    return item.is_object() &&
           item.contains("content") && item["content"].is_string() &&
           item.contains("wrapper_version") && item["wrapper_version"].is_string() &&
           item.contains("wrapped_version") && item["wrapped_version"].is_string() &&
           item.contains("created_at") && item["created_at"].is_number_unsigned();
}

inline HelpCacheEntry entry_from_json(const nlohmann::json& item) {
    HelpCacheEntry entry;
    entry.content = item.value("content", "");
    entry.wrapper_version = item.value("wrapper_version", "");
    entry.wrapped_version = item.value("wrapped_version", "");
    entry.created_at = item.value("created_at", uint64_t{0});
    return entry;
}

inline nlohmann::json entry_to_json(const HelpCacheEntry& entry) {
    return {
        {"content", entry.content},
        {"wrapper_version", entry.wrapper_version},
        {"wrapped_version", entry.wrapped_version},
        {"created_at", entry.created_at}
    };
}

} // namespace chitin
