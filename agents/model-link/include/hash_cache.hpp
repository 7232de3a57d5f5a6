#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "text_util.hpp"

// Lowercase hex SHA-256 of the file contents. Throws std::runtime_error if the file cannot be read.
std::string sha256_file(const std::filesystem::path& p);

using FileHasher = std::function<std::string(const std::filesystem::path&)>;
using FileFilter = std::function<bool(const std::filesystem::path&)>;

struct HashCacheEntry {
    std::int64_t mtime{0};
    std::string hash;
};

// Persistent path -> (mtime, hash) map so unchanged files are never re-hashed.
// Every operation runs under one lock; the backing JSON store is loaded on first use and rewritten on change.
class HashCache {
public:
    explicit HashCache(std::filesystem::path store_path, FileHasher hasher = sha256_file);

    // Walks every root, reusing cached hashes whose mtime still matches and hashing the rest.
    // Entries for files that no longer exist are evicted. Returns the hash of every accepted file.
    std::vector<std::string> scan(const std::vector<std::filesystem::path>& roots, const FileFilter& accept);

    // Records a hash computed elsewhere (e.g. right after a download). Returns all cached hashes.
    std::vector<std::string> update(const std::filesystem::path& path, const std::string& hash);

    // Scans, then maps each cached hash to one existing file carrying it. Keys compare case-insensitively.
    std::map<std::string, std::filesystem::path, CaseInsensitiveLess> files_by_hash(
        const std::vector<std::filesystem::path>& roots, const FileFilter& accept);

    std::size_t size();
    const std::filesystem::path& store_path() const { return store_path_; }

private:
    void ensure_loaded();
    void save();

    std::mutex mtx_;
    std::filesystem::path store_path_;
    FileHasher hasher_;
    std::map<std::string, HashCacheEntry, CaseInsensitiveLess> entries_;
    bool loaded_{false};
};

std::int64_t file_mtime(const std::filesystem::path& p);
