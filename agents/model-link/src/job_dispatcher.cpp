#include "../include/job_dispatcher.hpp"
#include "../include/log.hpp"

JobDispatcher::JobDispatcher(JobQueue& queue, const RunGate& gate, JobHandler handler, IdleHandler idle,
                             std::chrono::milliseconds idle_window)
    : queue_(queue), gate_(gate), handler_(std::move(handler)), idle_(std::move(idle)), idle_window_(idle_window) {}

void JobDispatcher::run(const CancellationSignal& stop) {
    while (!stop.cancelled()) {
        try {
            run_once(stop);
        } catch (const std::exception& e) {
            log_error(std::string("Dispatch loop error: ") + e.what());
            stop.wait_for(std::chrono::seconds(1));
        }
    }
}

bool JobDispatcher::run_once(const CancellationSignal& stop) {
    gate_.wait(stop);
    if (stop.cancelled()) return false;

    std::optional<Job> job = queue_.pop_for(idle_window_);
    if (stop.cancelled()) return false;
    if (!job) {
        if (idle_) idle_();
        return false;
    }
    handler_(*job);
    return true;
}
