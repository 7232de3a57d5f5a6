#pragma once
#include <chrono>
#include <functional>
#include "cancellation.hpp"
#include "job_queue.hpp"

// Single consumer of the job queue. Blocks while the gate is closed; otherwise runs one job per
// wake-up, or calls idle() when nothing arrived within the window.
class JobDispatcher {
public:
    using JobHandler = std::function<void(const Job&)>;
    using IdleHandler = std::function<void()>;

    JobDispatcher(JobQueue& queue, const RunGate& gate, JobHandler handler, IdleHandler idle,
                  std::chrono::milliseconds idle_window = std::chrono::seconds(5));

    void run(const CancellationSignal& stop);

    // One gate wait plus one queue wait. Returns true when a job was handled.
    bool run_once(const CancellationSignal& stop);

private:
    JobQueue& queue_;
    const RunGate& gate_;
    JobHandler handler_;
    IdleHandler idle_;
    std::chrono::milliseconds idle_window_;
};
