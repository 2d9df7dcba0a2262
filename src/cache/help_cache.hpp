#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace chitin {

struct HelpCacheEntry {
    std::string content;          // captured output, already rebranded
    std::string wrapper_version;  // chitin version at capture time
    std::string wrapped_version;  // wrapped CLI version at capture time
    uint64_t created_at = 0;      // epoch seconds
};

// Persistent help/version text cache, one JSON file shared by every
// invocation. Nothing is kept between processes: load() reads the file
// fresh, put() rewrites it through a temp file + rename so readers only
// ever see a complete old or complete new file.
class HelpCacheStore {
public:
    static constexpr const char* kSchema = "chitin-help-cache/1";

    explicit HelpCacheStore(std::string path);

    // Read the file. Missing, unreadable, corrupt or foreign-schema files
    // leave the store empty; this never fails.
    void load();

    std::optional<HelpCacheEntry> get(const std::string& key) const;

    // Record an entry and persist. Entries captured under different
    // versions are dropped in the same write, as are temp files abandoned
    // by dead writers. Returns false if the file
    // could not be written; the in-memory store is updated regardless.
    bool put(const std::string& key, const HelpCacheEntry& entry);

    // Remove the file and all entries.
    bool clear();

    size_t size() const { return entries_.size(); }
    const std::string& path() const { return path_; }

private:
    using EntryMap = std::unordered_map<std::string, HelpCacheEntry>;

    static EntryMap read_entries(const std::string& path);

    // Remove <path>.tmp.<pid> files left by writers that died before rename
    void sweep_stale_temp_files() const;

    std::string path_;
    EntryMap entries_;
};

} // namespace chitin
