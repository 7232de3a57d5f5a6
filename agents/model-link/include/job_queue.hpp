#pragma once
#include "messages.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// FIFO fed by the link's receive loop and drained by the dispatcher, one job per wake-up.
class JobQueue {
public:
    void push(Job job);
    // Waits up to `wait` for a job. Returns nothing on timeout or once waiters were released.
    std::optional<Job> pop_for(std::chrono::milliseconds wait);
    // Wakes every waiter for shutdown; later pops no longer block.
    void release_waiters();
    std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool released_{false};
};
