#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "core/bandwidth_limiter.hpp"
#include "core/errors.hpp"
#include "core/job_state.hpp"
#include "net/transport.hpp"

// Drives one segment of one job to completion: ranged request from the resume
// cursor, throttled positioned writes, bounded retries with exponential backoff.
class segment_fetcher {
public:
    struct policy {
        int max_retries;
        std::chrono::milliseconds retry_base_delay;
        std::chrono::milliseconds retry_max_delay;
        long inactivity_timeout_seconds;
        long connect_timeout_seconds;

        policy();
    };

    enum class outcome {
        completed,
        stopped, // pause, cancel, schedule or shutdown; cursor retained
        failed,  // retries exhausted
    };

    struct report {
        outcome result = outcome::stopped;
        engine_error error;
    };

    using progress_callback_t = std::function<void(job_state&)>;
    using stop_predicate_t = std::function<bool()>;

    segment_fetcher(transport& net, bandwidth_limiter* global_limiter, const policy& opts);

    report run(job_state& js, std::size_t segment_index, std::uint64_t generation,
               const progress_callback_t& on_progress, const stop_predicate_t& shutting_down);

    // Backoff before attempt n+1 after n consecutive failures.
    std::chrono::milliseconds retry_delay(int failures) const;

private:
    enum class attempt_result {
        completed,
        stopped,
        failed,
    };

    attempt_result attempt(job_state& js, std::size_t index, const stop_predicate_t& stopped,
                           const progress_callback_t& on_progress, std::string& out_error);
    bool finish_segment(job_state& js, std::size_t index, std::string& out_error);
    bool sleep_interruptible(std::chrono::milliseconds delay, const stop_predicate_t& stopped);

    transport& m_transport;
    bandwidth_limiter* m_global_limiter;
    policy m_policy;
};
