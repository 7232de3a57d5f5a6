#include "../include/hash_cache.hpp"
#include "../include/log.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
}

std::string sha256_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("Cannot read " + p.string());
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    std::vector<char> buf(1 << 20);
    while (f) {
        f.read(buf.data(), (std::streamsize)buf.size());
        std::streamsize n = f.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), (size_t)n) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }
    if (f.bad()) throw std::runtime_error("Read failed: " + p.string());
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) throw std::runtime_error("EVP_DigestFinal_ex failed");
    std::ostringstream oss;
    for (unsigned int i = 0; i < md_len; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

std::int64_t file_mtime(const fs::path& p) {
    std::error_code ec;
    auto t = fs::last_write_time(p, ec);
    if (ec) return 0;
    return static_cast<std::int64_t>(t.time_since_epoch().count());
}

HashCache::HashCache(fs::path store_path, FileHasher hasher)
    : store_path_(std::move(store_path)), hasher_(std::move(hasher)) {}

void HashCache::ensure_loaded() {
    if (loaded_) return;
    loaded_ = true;
    std::error_code ec;
    if (!fs::exists(store_path_, ec)) return;
    try {
        std::ifstream in(store_path_);
        json data = json::parse(in);
        for (auto it = data.begin(); it != data.end(); ++it) {
            if (!it->is_object()) continue;
            HashCacheEntry e;
            e.mtime = it->value("mtime", (std::int64_t)0);
            e.hash = it->value("hash", std::string());
            entries_[it.key()] = e;
        }
    } catch (const std::exception& e) {
        log_error("Failed to load hash cache: " + std::string(e.what()));
        entries_.clear();
    }
}

void HashCache::save() {
    try {
        if (store_path_.has_parent_path()) fs::create_directories(store_path_.parent_path());
        json data = json::object();
        for (const auto& kv : entries_) {
            data[kv.first] = {{"mtime", kv.second.mtime}, {"hash", kv.second.hash}};
        }
        fs::path tmp = store_path_;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            out << data.dump(2);
            if (!out) throw std::runtime_error("write failed: " + tmp.string());
        }
        fs::rename(tmp, store_path_);
    } catch (const std::exception& e) {
        log_error("Failed to save hash cache: " + std::string(e.what()));
    }
}

std::vector<std::string> HashCache::scan(const std::vector<fs::path>& roots, const FileFilter& accept) {
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_loaded();
    bool updated = false;
    std::vector<std::string> hashes;
    std::set<std::string, CaseInsensitiveLess> seen;

    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) continue;
        try {
            for (const auto& entry : fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied)) {
                if (!entry.is_regular_file() || !accept(entry.path())) continue;
                std::string key = entry.path().string();
                seen.insert(key);
                std::int64_t mtime = file_mtime(entry.path());
                auto it = entries_.find(key);
                if (it != entries_.end() && it->second.mtime == mtime && !it->second.hash.empty()) {
                    hashes.push_back(it->second.hash);
                    continue;
                }
                std::string hash;
                try {
                    hash = hasher_(entry.path());
                } catch (const std::exception& e) {
                    log_warn("Failed to hash '" + key + "': " + e.what());
                    continue;
                }
                entries_[key] = HashCacheEntry{mtime, hash};
                hashes.push_back(hash);
                updated = true;
            }
        } catch (const std::exception& e) {
            log_error("Failed to scan '" + root.string() + "': " + e.what());
        }
    }

    for (auto it = entries_.begin(); it != entries_.end();) {
        std::error_code ec;
        if (!seen.count(it->first) && !fs::exists(it->first, ec)) {
            it = entries_.erase(it);
            updated = true;
        } else {
            ++it;
        }
    }

    if (updated) save();
    return hashes;
}

std::vector<std::string> HashCache::update(const fs::path& path, const std::string& hash) {
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_loaded();
    entries_[path.string()] = HashCacheEntry{file_mtime(path), hash};
    save();
    std::vector<std::string> hashes;
    for (const auto& kv : entries_) {
        if (!kv.second.hash.empty()) hashes.push_back(kv.second.hash);
    }
    return hashes;
}

std::map<std::string, fs::path, CaseInsensitiveLess> HashCache::files_by_hash(const std::vector<fs::path>& roots,
                                                                              const FileFilter& accept) {
    scan(roots, accept);
    std::lock_guard<std::mutex> lock(mtx_);
    std::map<std::string, fs::path, CaseInsensitiveLess> out;
    for (const auto& kv : entries_) {
        std::error_code ec;
        if (kv.second.hash.empty() || !fs::is_regular_file(kv.first, ec)) continue;
        out[kv.second.hash] = fs::path(kv.first);
    }
    return out;
}

std::size_t HashCache::size() {
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_loaded();
    return entries_.size();
}
