#include "../include/cancellation.hpp"

namespace {
constexpr auto kGateRecheck = std::chrono::milliseconds(250);
}

void CancellationSignal::cancel() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationSignal::cancelled() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cancelled_;
}

bool CancellationSignal::wait_for(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lock(mtx_);
    if (d.count() > 0) cv_.wait_for(lock, d, [this] { return cancelled_; });
    return cancelled_;
}

void RunGate::open() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        open_ = true;
    }
    cv_.notify_all();
}

void RunGate::close() {
    std::lock_guard<std::mutex> lock(mtx_);
    open_ = false;
}

bool RunGate::is_open() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return open_;
}

void RunGate::wait(const CancellationSignal& stop) const {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!open_) {
        cv_.wait_for(lock, kGateRecheck, [this] { return open_; });
        if (open_) break;
        lock.unlock();
        bool stopping = stop.cancelled();
        lock.lock();
        if (stopping) break;
    }
}
