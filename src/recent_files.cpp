#include "recent_files.hpp"
#include "app_log.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <nlohmann/json.hpp>

namespace laralog {

namespace fs = std::filesystem;

RecentFiles::RecentFiles(const std::string& config_path)
    : config_path_(config_path)
{
    fs::path dir = fs::path(config_path).parent_path();
    legacy_path_ = (dir / "recent_files.json").string();
}

std::string RecentFiles::default_config_path() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        return "laralog.config";
    }
    return (cwd / "laralog.config").string();
}

std::string RecentFiles::normalize(const std::string& path) {
    if (path.empty()) return path;
    std::string normal = fs::path(path).lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

std::vector<std::string> RecentFiles::dedupe_and_trim(const std::vector<std::string>& files) {
    std::set<std::string> seen;
    std::vector<std::string> unique;
    for (const auto& p : files) {
        if (p.empty()) continue;
        if (!seen.insert(normalize(p)).second) continue;
        unique.push_back(p);
        if (unique.size() == kMaxRecentFiles) break;
    }
    return unique;
}

bool RecentFiles::read_list(const std::string& path, std::vector<std::string>& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    auto j = nlohmann::json::parse(file, nullptr, false);
    out.clear();
    if (j.is_discarded() || !j.is_array()) {
        AppLog::error("Config", "Ignoring malformed recent files list: " + path);
        return true;
    }
    for (const auto& item : j) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return true;
}

void RecentFiles::load() {
    files_.clear();

    std::error_code ec;
    if (fs::exists(config_path_, ec)) {
        std::vector<std::string> loaded;
        if (read_list(config_path_, loaded)) {
            files_ = dedupe_and_trim(loaded);
            // Duplicates or overflow on disk get written back cleaned.
            if (files_ != loaded) {
                save();
            }
        }
        return;
    }

    if (!fs::exists(legacy_path_, ec)) {
        return;
    }

    std::vector<std::string> legacy;
    if (!read_list(legacy_path_, legacy)) {
        return;
    }
    files_ = dedupe_and_trim(legacy);

    // Migrate: write the new location first, only then drop the old file.
    if (save()) {
        fs::remove(legacy_path_, ec);
        if (ec) {
            AppLog::error("Config", "Failed to remove legacy " + legacy_path_ + ": " + ec.message());
        } else {
            AppLog::log("Config", "Migrated recent files to " + config_path_);
        }
    }
}

bool RecentFiles::save() {
    files_ = dedupe_and_trim(files_);

    std::ofstream file(config_path_, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        AppLog::error("Config", "Failed to write " + config_path_);
        return false;
    }
    file << nlohmann::json(files_).dump();
    if (!file) {
        AppLog::error("Config", "Failed to write " + config_path_);
        return false;
    }
    return true;
}

void RecentFiles::drop(const std::string& path) {
    std::string key = normalize(path);
    std::vector<std::string> kept;
    for (const auto& p : files_) {
        if (normalize(p) != key) kept.push_back(p);
    }
    files_ = std::move(kept);
}

bool RecentFiles::add(const std::string& path) {
    drop(path);
    files_.insert(files_.begin(), path);
    return save();
}

bool RecentFiles::remove(const std::string& path) {
    drop(path);
    return save();
}

} // namespace laralog
