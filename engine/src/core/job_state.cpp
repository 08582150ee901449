#include "core/job_state.hpp"

speed_meter::speed_meter(std::chrono::milliseconds window, double alpha)
    : m_window(window), m_alpha(alpha) {}

bool speed_meter::add(std::uint64_t bytes, clock::time_point now) {
    if (!m_started) {
        m_started = true;
        m_window_start = now;
    }
    m_accumulated += bytes;

    auto elapsed = now - m_window_start;
    if (elapsed < m_window)
        return false;

    double seconds = std::chrono::duration<double>(elapsed).count();
    double instant = static_cast<double>(m_accumulated) / seconds;
    if (m_samples < warmup_samples)
        m_rate = (m_rate * m_samples + instant) / (m_samples + 1);
    else
        m_rate = m_alpha * instant + (1.0 - m_alpha) * m_rate;
    ++m_samples;

    m_accumulated = 0;
    m_window_start = now;
    return true;
}

void speed_meter::reset() {
    m_rate = 0.0;
    m_samples = 0;
    m_started = false;
    m_accumulated = 0;
}

job_state::job_state(job j, std::chrono::milliseconds speed_window, double speed_alpha)
    : data(std::move(j)), priority(data.priority), created_at(data.created_at),
      speed(speed_window, speed_alpha), busy(data.segments.size(), false) {}

void job_state::touch() {
    data.updated_at = wall_clock::now();
    dirty = true;
}
