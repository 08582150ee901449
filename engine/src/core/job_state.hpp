#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "core/bandwidth_limiter.hpp"
#include "core/destination_file.hpp"
#include "core/job.hpp"

// Exponential moving average of a byte rate, sampled once per window. The first
// few samples are averaged plainly so the figure settles quickly.
class speed_meter {
public:
    using clock = std::chrono::steady_clock;

    speed_meter(std::chrono::milliseconds window, double alpha);

    // Returns true when a new sample was folded into the rate.
    bool add(std::uint64_t bytes, clock::time_point now);
    double rate() const {
        return m_rate;
    }
    void reset();

private:
    static constexpr int warmup_samples = 3;

    std::chrono::milliseconds m_window;
    double m_alpha;
    double m_rate = 0.0;
    int m_samples = 0;
    bool m_started = false;
    std::uint64_t m_accumulated = 0;
    clock::time_point m_window_start;
};

// Runtime companion of a job. `data` and everything not atomic is guarded by `mutex`.
struct job_state {
    job_state(job j, std::chrono::milliseconds speed_window, double speed_alpha);

    std::mutex mutex;
    job data;

    // Read by the worker pool when ordering tasks, without taking `mutex`.
    std::atomic<int> priority;
    const wall_clock::time_point created_at;

    // Bumped on every pause, cancel, schedule and failure. A task whose generation
    // differs from the current one stops at its next chunk.
    std::atomic<std::uint64_t> generation{0};

    speed_meter speed;
    std::shared_ptr<destination_file> file;
    bandwidth_limiter* limiter = nullptr;

    // A task for this segment is queued or running.
    std::vector<bool> busy;

    speed_meter::clock::time_point last_progress_event;
    bool dirty = false;
    bool finalizing = false; // whole-file checks running outside the locks

    // Caller holds `mutex`.
    void touch();
};
