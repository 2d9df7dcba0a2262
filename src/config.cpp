#include "config.hpp"
#include "rebrand.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <vector>

namespace chitin {

nlohmann::json Config::defaults_json() {
    return {
        {"wrapped_command", "openclaw"},
        {"wrapped_version", ""},
        {"max_path_depth", 3},
        {"debug", false},
        {"brand", {
            {"from", "openclaw"},
            {"to", "chitin"},
            {"banner", "OpenClaw"}
        }},
        {"cache", {
            {"enabled", true},
            {"ttl", 86400},
            {"path", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

bool brand_is_consistent(const BrandConfig& brand) {
    if (brand.from.empty() || brand.to.empty() || brand.banner.empty()) return false;
    if (brand.from == brand.to) return false;
    if (starts_with(brand.to, brand.banner)) return false;
    // A replacement that itself contains the replaced token would grow on every pass
    return replace_brand_tokens(brand.to, brand.from, brand.to) == brand.to;
}

Config Config::load() {
    Config cfg;

    // Held back until `debug` is known: outside debug mode stderr belongs to
    // the wrapped CLI alone.
    std::vector<std::string> notices;

    std::string config_path = expand_home("~/.chitin/config.json");
    nlohmann::json j = defaults_json();

    std::ifstream file;
    if (!config_path.empty()) file.open(config_path);

    if (config_path.empty()) {
        notices.push_back("No home directory, using built-in defaults");
    } else if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            if (!original.is_object()) {
                notices.push_back("Ignoring " + config_path + ": top level is not an object");
            } else {
                j = merge_defaults(original, defaults_json());
                if (j != original && atomic_write_file(config_path, j.dump(4) + "\n")) {
                    notices.push_back("Migrated config with new defaults: " + config_path);
                }
            }
        } catch (const nlohmann::json::exception& e) {
            notices.push_back("Ignoring malformed " + config_path + ": " + e.what());
            j = defaults_json();
        }
    } else if (atomic_write_file(config_path, j.dump(4) + "\n")) {
        notices.push_back("Created default config: " + config_path);
    }

    if (j.contains("wrapped_command") && j["wrapped_command"].is_string())
        cfg.wrapped_command = j["wrapped_command"].get<std::string>();
    if (j.contains("wrapped_version") && j["wrapped_version"].is_string())
        cfg.wrapped_version = j["wrapped_version"].get<std::string>();
    if (j.contains("max_path_depth") && j["max_path_depth"].is_number_unsigned())
        cfg.max_path_depth = j["max_path_depth"].get<uint32_t>();
    if (j.contains("debug") && j["debug"].is_boolean())
        cfg.debug = j["debug"].get<bool>();

    if (j.contains("brand") && j["brand"].is_object()) {
        auto& b = j["brand"];
        BrandConfig brand;
        if (b.contains("from") && b["from"].is_string())
            brand.from = b["from"].get<std::string>();
        if (b.contains("to") && b["to"].is_string())
            brand.to = b["to"].get<std::string>();
        if (b.contains("banner") && b["banner"].is_string())
            brand.banner = b["banner"].get<std::string>();
        if (brand_is_consistent(brand)) {
            cfg.brand = brand;
        } else {
            notices.push_back("Inconsistent brand settings, using defaults");
        }
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.cache.enabled = c["enabled"].get<bool>();
        if (c.contains("ttl") && c["ttl"].is_number_unsigned())
            cfg.cache.ttl = c["ttl"].get<uint32_t>();
        if (c.contains("path") && c["path"].is_string())
            cfg.cache.path = c["path"].get<std::string>();
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("CHITIN_WRAPPED"))
        cfg.wrapped_command = v;
    if (const char* v = std::getenv("CHITIN_WRAPPED_VERSION"))
        cfg.wrapped_version = v;
    if (const char* v = std::getenv("CHITIN_CACHE_PATH"))
        cfg.cache.path = v;
    if (std::getenv("CHITIN_NO_CACHE"))
        cfg.cache.enabled = false;
    if (std::getenv("CHITIN_DEBUG"))
        cfg.debug = true;

    // Never fall back to a cwd-relative cache file
    if (cfg.cache.enabled && cfg.cache_path().empty()) {
        cfg.cache.enabled = false;
        notices.push_back("No home directory, help cache disabled");
    }

    if (cfg.debug) {
        for (const auto& n : notices) std::cerr << "[config] " << n << "\n";
    }
    return cfg;
}

std::string Config::cache_path() const {
    if (!cache.path.empty()) return expand_home(cache.path);
    return expand_home("~/.chitin/cache/help_cache.json");
}

} // namespace chitin
