#include "core/segment_fetcher.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <thread>

#include "core/checksum.hpp"
#include "core/segment_planner.hpp"

namespace {
constexpr std::chrono::milliseconds SLEEP_SLICE{50};
constexpr int MAX_BACKOFF_EXPONENT = 20;
} // namespace

segment_fetcher::policy::policy()
    : max_retries(3), retry_base_delay(500), retry_max_delay(30000),
      inactivity_timeout_seconds(30), connect_timeout_seconds(30) {}

segment_fetcher::segment_fetcher(transport& net, bandwidth_limiter* global_limiter,
                                 const policy& opts)
    : m_transport(net), m_global_limiter(global_limiter), m_policy(opts) {}

std::chrono::milliseconds segment_fetcher::retry_delay(int failures) const {
    int exponent = std::min(std::max(failures - 1, 0), MAX_BACKOFF_EXPONENT);
    auto delay = m_policy.retry_base_delay * (1LL << exponent);
    return std::min<std::chrono::milliseconds>(delay, m_policy.retry_max_delay);
}

segment_fetcher::report segment_fetcher::run(job_state& js, std::size_t segment_index,
                                             std::uint64_t generation,
                                             const progress_callback_t& on_progress,
                                             const stop_predicate_t& shutting_down) {
    auto stopped = [&]() {
        return js.generation.load() != generation || (shutting_down && shutting_down());
    };

    std::string job_id;
    std::string segment_id;
    {
        std::lock_guard<std::mutex> lock(js.mutex);
        job_id = js.data.id;
        segment_id = js.data.segments[segment_index].id;
    }

    report rep;
    for (;;) {
        if (stopped())
            break;

        std::string error;
        auto result = attempt(js, segment_index, stopped, on_progress, error);
        if (result == attempt_result::completed) {
            rep.result = outcome::completed;
            return rep;
        }
        if (result == attempt_result::stopped)
            break;

        int failures = 0;
        {
            std::lock_guard<std::mutex> lock(js.mutex);
            auto& seg = js.data.segments[segment_index];
            failures = ++seg.retries;
            if (failures >= m_policy.max_retries) {
                seg.status = segment_status::failed;
                js.touch();
            } else {
                seg.status = segment_status::pending;
                js.touch();
            }
        }

        if (failures >= m_policy.max_retries) {
            std::cerr << "[segment_fetcher] Job " << job_id << " segment " << segment_id
                      << " failed after " << failures << " attempts: " << error << std::endl;
            rep.result = outcome::failed;
            rep.error = engine_error::transport("segment " + segment_id + ": " + error);
            return rep;
        }

        auto delay = retry_delay(failures);
        std::cerr << "[segment_fetcher] Job " << job_id << " segment " << segment_id
                  << " attempt " << failures << "/" << m_policy.max_retries
                  << " failed: " << error << "; retrying in " << delay.count() << " ms"
                  << std::endl;
        if (!sleep_interruptible(delay, stopped))
            break;
    }

    {
        std::lock_guard<std::mutex> lock(js.mutex);
        auto& seg = js.data.segments[segment_index];
        if (seg.status == segment_status::downloading)
            seg.status = segment_status::pending;
    }
    rep.result = outcome::stopped;
    return rep;
}

segment_fetcher::attempt_result segment_fetcher::attempt(job_state& js, std::size_t index,
                                                         const stop_predicate_t& stopped,
                                                         const progress_callback_t& on_progress,
                                                         std::string& out_error) {
    transfer_request req;
    std::shared_ptr<destination_file> file;
    std::uint64_t cursor = 0;
    std::uint64_t end = 0;
    bool open_ended = false;
    bool already_written = false;
    {
        std::lock_guard<std::mutex> lock(js.mutex);
        auto& seg = js.data.segments[index];
        if (seg.status == segment_status::completed)
            return attempt_result::completed;

        // Without range support every attempt restarts from the first byte
        if (!js.data.accepts_ranges && seg.bytes_written > 0) {
            seg.bytes_written = 0;
            seg.checksum.clear();
        }
        seg.status = segment_status::downloading;

        file = js.file;
        open_ended = seg.is_open_ended();
        cursor = segment_planner::next_offset(seg);
        end = seg.end_byte;
        already_written = !open_ended && segment_planner::remaining(seg) == 0;

        req.url = js.data.url;
        req.headers = js.data.headers;
        if (js.data.accepts_ranges) {
            req.use_range = true;
            req.range_start = cursor;
            if (!open_ended)
                req.range_end = end;
        }
    }

    if (!file || !file->is_open()) {
        out_error = "destination file is not open";
        return attempt_result::failed;
    }

    if (already_written)
        return finish_segment(js, index, out_error) ? attempt_result::completed
                                                    : attempt_result::failed;

    req.inactivity_timeout_seconds = m_policy.inactivity_timeout_seconds;
    req.connect_timeout_seconds = m_policy.connect_timeout_seconds;

    bool reached_end = false;
    bool write_failed = false;

    auto on_chunk = [&](const char* data, std::size_t size) -> bool {
        if (stopped())
            return false;
        if (js.limiter && !js.limiter->acquire(size, stopped))
            return false;
        if (m_global_limiter && !m_global_limiter->acquire(size, stopped))
            return false;

        bool overran = false;
        if (!open_ended) {
            std::uint64_t left = end - cursor + 1;
            if (size >= left) {
                overran = size > left;
                size = static_cast<std::size_t>(left);
                reached_end = true;
            }
        }

        if (!file->write_at(cursor, data, size, out_error)) {
            write_failed = true;
            return false;
        }
        cursor += size;

        {
            std::lock_guard<std::mutex> lock(js.mutex);
            js.data.segments[index].bytes_written += size;
            if (js.speed.add(size, speed_meter::clock::now()))
                js.data.speed = js.speed.rate();
            js.data.refresh_derived();
            js.dirty = true;
        }
        if (on_progress)
            on_progress(js);

        // Bytes past the end of the range are not ours
        return !overran;
    };

    auto res = m_transport.fetch(req, on_chunk, stopped);

    if (write_failed)
        return attempt_result::failed;
    if (reached_end)
        return finish_segment(js, index, out_error) ? attempt_result::completed
                                                    : attempt_result::failed;
    if (stopped())
        return attempt_result::stopped;
    if (res.aborted) {
        out_error = "transfer aborted";
        return attempt_result::failed;
    }
    if (!res.ok) {
        out_error = res.error.empty() ? "http status " + std::to_string(res.status_code)
                                      : res.error;
        return attempt_result::failed;
    }
    if (!open_ended) {
        out_error = "body ended at byte " + std::to_string(cursor) + ", expected up to " +
                    std::to_string(end);
        return attempt_result::failed;
    }
    return finish_segment(js, index, out_error) ? attempt_result::completed
                                                : attempt_result::failed;
}

bool segment_fetcher::finish_segment(job_state& js, std::size_t index, std::string& out_error) {
    std::shared_ptr<destination_file> file;
    std::uint64_t start = 0;
    std::uint64_t length = 0;
    std::string declared;
    {
        std::lock_guard<std::mutex> lock(js.mutex);
        auto& seg = js.data.segments[index];
        if (seg.is_open_ended()) {
            // The transfer ended, so now the size is known
            if (seg.bytes_written > 0)
                seg.end_byte = seg.start_byte + seg.bytes_written - 1;
            js.data.file_size = seg.start_byte + seg.bytes_written;
        }
        start = seg.start_byte;
        length = seg.bytes_written;
        declared = seg.checksum;
        file = js.file;
    }

    std::string digest;
    if (!checksum::sha256_range(*file, start, length, digest, out_error))
        return false;

    std::lock_guard<std::mutex> lock(js.mutex);
    auto& seg = js.data.segments[index];
    if (!declared.empty() && !checksum::matches(declared, digest)) {
        seg.bytes_written = 0;
        seg.checksum.clear();
        js.data.refresh_derived();
        js.touch();
        out_error = "segment checksum mismatch";
        return false;
    }
    seg.checksum = digest;
    seg.status = segment_status::completed;
    js.data.refresh_derived();
    js.touch();
    return true;
}

bool segment_fetcher::sleep_interruptible(std::chrono::milliseconds delay,
                                          const stop_predicate_t& stopped) {
    auto deadline = std::chrono::steady_clock::now() + delay;
    for (;;) {
        if (stopped())
            return false;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return true;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left + std::chrono::milliseconds(1), SLEEP_SLICE));
    }
}
