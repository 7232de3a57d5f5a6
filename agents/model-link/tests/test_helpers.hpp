#pragma once
#include "../include/artifact_fetcher.hpp"
#include "../include/hash_cache.hpp"
#include "../include/link_channel.hpp"
#include "../include/messages.hpp"
#include "../include/sidecar_writer.hpp"
#include "../include/transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

struct TempDir {
    fs::path path;

    TempDir() {
        std::random_device rd;
        path = fs::temp_directory_path() / ("model-link-test-" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

inline void write_file(const fs::path& p, const std::string& content) {
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline std::string sha256_of(const std::string& content) {
    TempDir dir;
    fs::path p = dir.path / "blob";
    write_file(p, content);
    return sha256_file(p);
}

// Polls pred until it holds or the timeout elapses.
inline bool eventually(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

inline std::vector<json> of_type(const std::vector<std::string>& wire, const std::string& type) {
    std::vector<json> out;
    for (const auto& w : wire) {
        json j = json::parse(w);
        if (j.value("type", "") == type) out.push_back(j);
    }
    return out;
}

class FakeChannel : public LinkChannel {
public:
    bool send_text(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!open_) return false;
        sent_.push_back(text);
        return true;
    }

    ReceiveStatus receive(std::string& out, std::chrono::milliseconds wait) override {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, wait, [this] { return !inbox_.empty() || !open_; });
        if (!inbox_.empty()) {
            out = inbox_.front();
            inbox_.pop_front();
            return ReceiveStatus::Message;
        }
        return open_ ? ReceiveStatus::Idle : ReceiveStatus::Closed;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return open_;
    }

    CloseInfo close_info() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return info_;
    }

    void close(const std::string& reason, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!open_) return;
        open_ = false;
        info_ = CloseInfo{1000, reason};
        cv_.notify_all();
    }

    void push_inbound(const std::string& text) {
        std::lock_guard<std::mutex> lock(mtx_);
        inbox_.push_back(text);
        cv_.notify_all();
    }

    void json_inbound(const json& msg) { push_inbound(msg.dump()); }

    // Peer-initiated close with the given code and reason.
    void remote_close(CloseInfo info) {
        std::lock_guard<std::mutex> lock(mtx_);
        open_ = false;
        info_ = std::move(info);
        cv_.notify_all();
    }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return sent_;
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::string> inbox_;
    std::vector<std::string> sent_;
    CloseInfo info_;
    bool open_{true};
};

// Hands out scripted channels in order; connect() throws once the script runs dry.
class FakeConnector : public LinkConnector {
public:
    void script(std::shared_ptr<FakeChannel> channel) {
        std::lock_guard<std::mutex> lock(mtx_);
        script_.push_back(std::move(channel));
    }

    std::shared_ptr<LinkChannel> connect(const ConnectRequest& req, const CancellationSignal&) override {
        std::lock_guard<std::mutex> lock(mtx_);
        requests_.push_back(req);
        if (script_.empty()) throw std::runtime_error("connection refused");
        auto ch = script_.front();
        script_.pop_front();
        return ch;
    }

    int attempts() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return static_cast<int>(requests_.size());
    }

    std::vector<ConnectRequest> requests() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return requests_;
    }

private:
    mutable std::mutex mtx_;
    std::deque<std::shared_ptr<FakeChannel>> script_;
    std::vector<ConnectRequest> requests_;
};

// Accepts progress and inventory like the HTTP fallback does; everything else is refused.
class RecordingFallback : public FallbackSender {
public:
    bool deliver(const OutboundMessage& msg) override {
        std::lock_guard<std::mutex> lock(mtx_);
        attempted_.push_back(msg.wire());
        if (!accept || (msg.type != "progress" && msg.type != "inventory")) return false;
        delivered_.push_back(msg.wire());
        return true;
    }

    std::vector<std::string> delivered() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return delivered_;
    }

    std::vector<std::string> attempted() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return attempted_;
    }

    std::atomic<bool> accept{true};

private:
    mutable std::mutex mtx_;
    std::vector<std::string> delivered_;
    std::vector<std::string> attempted_;
};

class FakeFetcher : public ArtifactFetcher {
public:
    void fetch(const std::string& url, const fs::path& dest, const FetchProgress& progress,
               const CancellationSignal&) override {
        std::lock_guard<std::mutex> lock(mtx_);
        urls.push_back(url);
        ++calls;
        if (calls <= fail_first) {
            write_file(dest, "partial");
            throw std::runtime_error("connection reset");
        }
        saw_part_name = dest.extension() == ".part";
        progress(0.1);
        progress(0.5);
        write_file(dest, payload);
        progress(1.0);
    }

    std::string payload{"model-bytes"};
    int fail_first{0};
    int calls{0};
    bool saw_part_name{false};
    std::vector<std::string> urls;

private:
    std::mutex mtx_;
};

class RecordingSidecars : public SidecarWriter {
public:
    void write(const SidecarRequest& req) override {
        ++attempts;
        if (fail) throw std::runtime_error("sidecar failed");
        requests.push_back(req);
    }

    bool fail{false};
    int attempts{0};
    std::vector<SidecarRequest> requests;
};
