#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>

// Token bucket shared by every transfer of a profile (or of the whole process).
// Capacity equals the limit, so at most one second worth of bytes may burst, and
// the bucket starts full. Waiters are served first-come first-served one quantum
// at a time, which interleaves competing transfers round-robin.
class bandwidth_limiter {
public:
    using cancel_predicate_t = std::function<bool()>;

    explicit bandwidth_limiter(std::uint64_t bytes_per_second = 0);

    bandwidth_limiter(const bandwidth_limiter&) = delete;
    bandwidth_limiter& operator=(const bandwidth_limiter&) = delete;

    // 0 means unbounded. Waiting consumers pick up the new rate immediately.
    void set_limit(std::uint64_t bytes_per_second);
    std::uint64_t limit() const;

    // Blocks until `bytes` tokens were granted. Returns false if `cancelled`
    // turned true while waiting; tokens granted before that stay consumed.
    bool acquire(std::size_t bytes, const cancel_predicate_t& cancelled = nullptr);

    // Tokens currently available (for diagnostics and tests).
    double available();

private:
    using clock = std::chrono::steady_clock;

    static constexpr std::uint64_t max_quantum = 64 * 1024;
    static constexpr std::chrono::milliseconds max_wait_slice{20};

    void refill(clock::time_point now);
    std::uint64_t quantum() const;
    void leave_queue(std::uint64_t ticket);

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::uint64_t m_limit;
    double m_tokens;
    clock::time_point m_last_refill;
    std::deque<std::uint64_t> m_waiters;
    std::uint64_t m_next_ticket = 0;
};
