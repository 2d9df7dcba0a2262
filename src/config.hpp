#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace chitin {

// Brand vocabulary used when rebranding captured help text.
struct BrandConfig {
    std::string from = "openclaw";   // wrapped CLI's command name
    std::string to = "chitin";       // this shim's command name
    std::string banner = "OpenClaw"; // prefix of the wrapped CLI's banner line
};

struct CacheConfig {
    bool enabled = true;
    uint32_t ttl = 86400;  // 24 hours
    std::string path;      // empty = ~/.chitin/cache/help_cache.json
};

struct Config {
    std::string wrapped_command = "openclaw";
    std::string wrapped_version; // non-empty pins the version, skipping the probe
    uint32_t max_path_depth = 3;
    bool debug = false;

    BrandConfig brand;
    CacheConfig cache;

    // Load from ~/.chitin/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Resolved cache file location
    std::string cache_path() const;
};

// True when rebranding with this vocabulary is idempotent.
bool brand_is_consistent(const BrandConfig& brand);

} // namespace chitin
