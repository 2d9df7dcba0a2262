#include <catch2/catch.hpp>
#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <unistd.h>

using namespace chitin;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.wrapped_command == "openclaw");
    REQUIRE(cfg.wrapped_version.empty());
    REQUIRE(cfg.max_path_depth == 3);
    REQUIRE_FALSE(cfg.debug);
    REQUIRE(cfg.brand.from == "openclaw");
    REQUIRE(cfg.brand.to == "chitin");
    REQUIRE(cfg.cache.enabled);
    REQUIRE(cfg.cache.ttl == 86400);
}

TEST_CASE("brand_is_consistent: rejects vocabularies that are not idempotent", "[config]") {
    BrandConfig ok;
    REQUIRE(brand_is_consistent(ok));

    BrandConfig contains_from;
    contains_from.to = "fast openclaw";
    REQUIRE_FALSE(brand_is_consistent(contains_from));

    BrandConfig same;
    same.to = same.from;
    REQUIRE_FALSE(brand_is_consistent(same));

    BrandConfig empty;
    empty.from.clear();
    REQUIRE_FALSE(brand_is_consistent(empty));

    BrandConfig looks_like_banner;
    looks_like_banner.to = "OpenClawFast";
    REQUIRE_FALSE(brand_is_consistent(looks_like_banner));
}

TEST_CASE("brand_is_consistent: suffixed names are fine", "[config]") {
    BrandConfig b;
    b.to = "openclaw2";
    REQUIRE(brand_is_consistent(b));
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "chitin_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("CHITIN_WRAPPED");
        unsetenv("CHITIN_WRAPPED_VERSION");
        unsetenv("CHITIN_CACHE_PATH");
        unsetenv("CHITIN_NO_CACHE");
        unsetenv("CHITIN_DEBUG");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.chitin/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.chitin");
        std::ofstream f(config_path());
        f << content;
    }

    nlohmann::json read_config() const {
        std::ifstream f(config_path());
        return nlohmann::json::parse(f);
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "wrapped_command": "/opt/openclaw/bin/openclaw",
        "wrapped_version": "2026.2.1",
        "max_path_depth": 2,
        "debug": true,
        "brand": { "from": "openclaw", "to": "oc", "banner": "OpenClaw" },
        "cache": { "enabled": false, "ttl": 60, "path": "/tmp/x/help.json" }
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.wrapped_command == "/opt/openclaw/bin/openclaw");
    REQUIRE(cfg.wrapped_version == "2026.2.1");
    REQUIRE(cfg.max_path_depth == 2);
    REQUIRE(cfg.debug);
    REQUIRE(cfg.brand.to == "oc");
    REQUIRE_FALSE(cfg.cache.enabled);
    REQUIRE(cfg.cache.ttl == 60);
    REQUIRE(cfg.cache_path() == "/tmp/x/help.json");
}

TEST_CASE("Config::load: missing config file creates defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.wrapped_command == "openclaw");
    REQUIRE(std::filesystem::exists(g.config_path()));
    REQUIRE(g.read_config() == Config::defaults_json());
}

TEST_CASE("Config::load: default cache path lives under HOME", "[config]") {
    ConfigTestGuard g;
    Config cfg = Config::load();
    REQUIRE(cfg.cache_path() == g.dir + "/.chitin/cache/help_cache.json");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.wrapped_command == "openclaw");
    REQUIRE(cfg.cache.enabled);
}

TEST_CASE("Config::load: non-object top level falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("[1, 2, 3]");

    Config cfg = Config::load();
    REQUIRE(cfg.cache.ttl == 86400);
}

TEST_CASE("Config::load: missing keys are migrated into the file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"wrapped_command": "oc-dev"})");

    Config cfg = Config::load();
    REQUIRE(cfg.wrapped_command == "oc-dev");

    auto j = g.read_config();
    REQUIRE(j["wrapped_command"] == "oc-dev");
    REQUIRE(j.contains("cache"));
    REQUIRE(j["cache"]["ttl"] == 86400);
}

TEST_CASE("Config::load: inconsistent brand falls back to default brand", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"brand": {"from": "openclaw", "to": "openclaw fast", "banner": "OpenClaw"}})");

    Config cfg = Config::load();
    REQUIRE(cfg.brand.to == "chitin");
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"wrapped_command": "from-file", "cache": {"enabled": true}})");

    setenv("CHITIN_WRAPPED", "from-env", 1);
    setenv("CHITIN_WRAPPED_VERSION", "9.9.9", 1);
    setenv("CHITIN_CACHE_PATH", "/tmp/env-cache.json", 1);
    setenv("CHITIN_NO_CACHE", "1", 1);
    setenv("CHITIN_DEBUG", "1", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.wrapped_command == "from-env");
    REQUIRE(cfg.wrapped_version == "9.9.9");
    REQUIRE(cfg.cache_path() == "/tmp/env-cache.json");
    REQUIRE_FALSE(cfg.cache.enabled);
    REQUIRE(cfg.debug);

    unsetenv("CHITIN_WRAPPED");
    unsetenv("CHITIN_WRAPPED_VERSION");
    unsetenv("CHITIN_CACHE_PATH");
    unsetenv("CHITIN_NO_CACHE");
    unsetenv("CHITIN_DEBUG");
}

TEST_CASE("Config::load: wrong value types keep defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"max_path_depth": "deep", "cache": {"ttl": -5, "enabled": "yes"}})");

    Config cfg = Config::load();
    REQUIRE(cfg.max_path_depth == 3);
    REQUIRE(cfg.cache.ttl == 86400);
    REQUIRE(cfg.cache.enabled);
}

// ── stderr stays quiet ───────────────────────────────────────────

// RAII: captures std::cerr into a string stream
struct CerrCapture {
    std::ostringstream captured;
    std::streambuf* old;
    CerrCapture() : old(std::cerr.rdbuf(captured.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old); }
    CerrCapture(const CerrCapture&) = delete;
    CerrCapture& operator=(const CerrCapture&) = delete;
};

TEST_CASE("Config::load: first run writes nothing to stderr", "[config]") {
    ConfigTestGuard g;
    CerrCapture err;

    Config cfg = Config::load();
    REQUIRE(std::filesystem::exists(g.config_path()));
    REQUIRE(err.captured.str().empty());
}

TEST_CASE("Config::load: migration and malformed files are silent", "[config]") {
    ConfigTestGuard g;

    g.write_config(R"({"wrapped_command": "openclaw"})");
    {
        CerrCapture err;
        Config::load();
        REQUIRE(err.captured.str().empty());
    }

    g.write_config("{ not json");
    {
        CerrCapture err;
        Config::load();
        REQUIRE(err.captured.str().empty());
    }

    g.write_config(R"({"brand": {"from": "openclaw", "to": "openclaw"}})");
    {
        CerrCapture err;
        Config::load();
        REQUIRE(err.captured.str().empty());
    }
}

TEST_CASE("Config::load: notices are shown in debug mode", "[config]") {
    ConfigTestGuard g;
    setenv("CHITIN_DEBUG", "1", 1);
    CerrCapture err;

    Config::load();
    REQUIRE(err.captured.str().find("[config] Created default config: " + g.config_path()) !=
            std::string::npos);
    unsetenv("CHITIN_DEBUG");
}

TEST_CASE("Config: cache path without HOME is never cwd-relative", "[config]") {
    ConfigTestGuard g;
    unsetenv("HOME");

    Config cfg;
    std::string path = cfg.cache_path();
    REQUIRE_FALSE(path.rfind("~", 0) == 0);
    REQUIRE((path.empty() || path[0] == '/'));

    cfg.cache.path = "~/elsewhere/cache.json";
    path = cfg.cache_path();
    REQUIRE((path.empty() || path[0] == '/'));
}
