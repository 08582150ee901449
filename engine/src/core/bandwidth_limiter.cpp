#include "core/bandwidth_limiter.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

bandwidth_limiter::bandwidth_limiter(std::uint64_t bytes_per_second)
    : m_limit(bytes_per_second), m_tokens(static_cast<double>(bytes_per_second)),
      m_last_refill(clock::now()) {}

void bandwidth_limiter::set_limit(std::uint64_t bytes_per_second) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto now = clock::now();
        refill(now);
        bool was_unbounded = m_limit == 0;
        m_limit = bytes_per_second;
        if (was_unbounded)
            m_tokens = static_cast<double>(bytes_per_second);
        else
            m_tokens = std::min(m_tokens, static_cast<double>(bytes_per_second));
        m_last_refill = now;
    }
    std::cout << "[bandwidth_limiter] Limit set to "
              << (bytes_per_second == 0 ? std::string("unbounded")
                                        : std::to_string(bytes_per_second) + " B/s")
              << std::endl;
    m_cv.notify_all();
}

std::uint64_t bandwidth_limiter::limit() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_limit;
}

double bandwidth_limiter::available() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_limit == 0)
        return 0.0;
    refill(clock::now());
    return m_tokens;
}

bool bandwidth_limiter::acquire(std::size_t bytes, const cancel_predicate_t& cancelled) {
    std::unique_lock<std::mutex> lock(m_mutex);
    std::uint64_t remaining = bytes;

    while (remaining > 0) {
        if (m_limit == 0)
            return true;

        // Each quantum takes a fresh place at the back of the line
        std::uint64_t ticket = m_next_ticket++;
        m_waiters.push_back(ticket);

        for (;;) {
            if (cancelled && cancelled()) {
                leave_queue(ticket);
                return false;
            }
            if (m_limit == 0) {
                leave_queue(ticket);
                return true;
            }

            refill(clock::now());
            std::uint64_t grant = std::min(remaining, quantum());
            bool first = m_waiters.front() == ticket;
            if (first && m_tokens >= static_cast<double>(grant)) {
                m_tokens -= static_cast<double>(grant);
                m_waiters.pop_front();
                remaining -= grant;
                m_cv.notify_all();
                break;
            }

            auto wait = max_wait_slice;
            if (first) {
                double deficit = static_cast<double>(grant) - m_tokens;
                auto needed_ms = static_cast<long long>(
                    std::ceil(deficit * 1000.0 / static_cast<double>(m_limit)));
                wait = std::min(wait, std::chrono::milliseconds(std::max(1LL, needed_ms)));
            }
            m_cv.wait_for(lock, wait);
        }
    }
    return true;
}

void bandwidth_limiter::refill(clock::time_point now) {
    if (now <= m_last_refill)
        return;
    double elapsed = std::chrono::duration<double>(now - m_last_refill).count();
    m_last_refill = now;
    if (m_limit == 0)
        return;
    double capacity = static_cast<double>(m_limit);
    m_tokens = std::min(capacity, m_tokens + elapsed * static_cast<double>(m_limit));
}

std::uint64_t bandwidth_limiter::quantum() const {
    return std::max<std::uint64_t>(1, std::min(m_limit, max_quantum));
}

void bandwidth_limiter::leave_queue(std::uint64_t ticket) {
    auto it = std::find(m_waiters.begin(), m_waiters.end(), ticket);
    if (it != m_waiters.end())
        m_waiters.erase(it);
    m_cv.notify_all();
}
