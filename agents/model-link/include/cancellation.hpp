#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

// Shared shutdown flag. Every blocking wait in the worker goes through wait_for so it stays bounded.
class CancellationSignal {
public:
    void cancel();
    bool cancelled() const;
    // Sleeps up to d; returns true if cancelled before or during the wait.
    bool wait_for(std::chrono::milliseconds d) const;

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    bool cancelled_{false};
};

// Enable/disable gate the dispatch and inventory loops block on while the worker is paused.
class RunGate {
public:
    void open();
    void close();
    bool is_open() const;
    // Returns once the gate is open or stop is cancelled.
    void wait(const CancellationSignal& stop) const;

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    bool open_{false};
};
