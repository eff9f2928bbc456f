#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace laralog {

constexpr std::size_t kMaxRecentFiles = 10;

// Most-recently-watched paths, newest first, kept in a JSON array on disk.
class RecentFiles {
public:
    explicit RecentFiles(const std::string& config_path);

    // laralog.config in the current working directory.
    static std::string default_config_path();

    // Reads the config; falls back to (and migrates) a legacy recent_files.json
    // next to it. Missing or malformed files give an empty list. A list that
    // needed deduplicating or trimming is saved back.
    void load();

    // Writes the deduplicated, trimmed list. Failures are logged.
    bool save();

    // Both persist immediately; false when the save failed.
    bool add(const std::string& path);
    bool remove(const std::string& path);

    const std::vector<std::string>& files() const { return files_; }
    const std::string& config_path() const { return config_path_; }

    static std::string normalize(const std::string& path);
    static std::vector<std::string> dedupe_and_trim(const std::vector<std::string>& files);

private:
    static bool read_list(const std::string& path, std::vector<std::string>& out);
    void drop(const std::string& path);

    std::string config_path_;
    std::string legacy_path_;
    std::vector<std::string> files_;
};

} // namespace laralog
