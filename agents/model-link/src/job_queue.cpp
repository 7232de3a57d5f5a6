#include "../include/job_queue.hpp"

void JobQueue::push(Job job) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

std::optional<Job> JobQueue::pop_for(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait_for(lock, wait, [this] { return !jobs_.empty() || released_; });
    if (jobs_.empty() || released_) return std::nullopt;
    Job j = std::move(jobs_.front());
    jobs_.pop_front();
    return j;
}

void JobQueue::release_waiters() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        released_ = true;
    }
    cv_.notify_all();
}

std::size_t JobQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return jobs_.size();
}
