#include "help_cache.hpp"
#include "entry_json.hpp"
#include "../util.hpp"
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <unistd.h>

namespace chitin {

HelpCacheStore::HelpCacheStore(std::string path) : path_(std::move(path)) {}

HelpCacheStore::EntryMap HelpCacheStore::read_entries(const std::string& path) {
    EntryMap entries;

    std::string raw;
    if (!read_file(path, raw)) return entries;

    try {
        nlohmann::json j = nlohmann::json::parse(raw);
        if (!j.is_object()) return entries;
        if (j.value("schema", "") != kSchema) return entries;
        if (!j.contains("entries") || !j["entries"].is_object()) return entries;

        for (const auto& [key, item] : j["entries"].items()) {
            if (!entry_is_well_formed(item)) continue;
            entries[key] = entry_from_json(item);
        }
    } catch (const nlohmann::json::exception&) {
        // Corrupt file: cold cache
        entries.clear();
    }
    return entries;
}

void HelpCacheStore::load() {
    entries_ = read_entries(path_);
}

std::optional<HelpCacheEntry> HelpCacheStore::get(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void HelpCacheStore::sweep_stale_temp_files() const {
    namespace fs = std::filesystem;
    fs::path target(path_);
    fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");
    std::string prefix = target.filename().string() + ".tmp.";

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (!starts_with(name, prefix)) continue;
        std::string pid_text = name.substr(prefix.size());
        if (pid_text.empty() || pid_text.size() > 9 ||
            pid_text.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        pid_t pid = static_cast<pid_t>(std::stol(pid_text));
        if (pid <= 0 || pid == getpid()) continue;
        // Owner still running (or not ours to signal): its write may be in flight
        if (kill(pid, 0) == 0 || errno != ESRCH) continue;

        std::error_code rm_ec;
        fs::remove(it->path(), rm_ec);
    }
}

bool HelpCacheStore::put(const std::string& key, const HelpCacheEntry& entry) {
    sweep_stale_temp_files();

    // Merge with whatever other processes committed since our load()
    EntryMap merged = read_entries(path_);
    merged[key] = entry;

    for (auto it = merged.begin(); it != merged.end(); ) {
        if (it->second.wrapper_version != entry.wrapper_version ||
            it->second.wrapped_version != entry.wrapped_version) {
            it = merged.erase(it);
        } else {
            ++it;
        }
    }

    entries_ = merged;

    nlohmann::json items = nlohmann::json::object();
    for (const auto& [k, e] : entries_) {
        items[k] = entry_to_json(e);
    }
    nlohmann::json j = {
        {"schema", kSchema},
        {"entries", items}
    };

    // Non-UTF-8 output from the wrapped CLI is stored with U+FFFD substitutions
    std::string text = j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (!atomic_write_file(path_, text + "\n")) {
        std::cerr << "[cache] Failed to write " << path_ << "\n";
        return false;
    }
    return true;
}

bool HelpCacheStore::clear() {
    entries_.clear();
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    return !ec;
}

} // namespace chitin
