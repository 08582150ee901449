#include "fake_transport.hpp"

#include <algorithm>
#include <thread>

namespace {
struct in_flight_guard {
    explicit in_flight_guard(std::atomic<int>& counter) : m_counter(counter) {
        ++m_counter;
    }
    ~in_flight_guard() {
        --m_counter;
    }

    std::atomic<int>& m_counter;
};
} // namespace

std::string fake_transport::pattern(std::size_t size) {
    std::string out(size, '\0');
    for (std::size_t i = 0; i < size; ++i)
        out[i] = static_cast<char>((i * 31 + i / 251 + 7) % 256);
    return out;
}

void fake_transport::add(const std::string& url, const resource& res) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_resources[url] = res;
}

void fake_transport::fail_next(const std::string& url, int count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_resources[url].failing_fetches = count;
}

probe_result fake_transport::probe(const std::string& url,
                                   const std::map<std::string, std::string>&) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_probes[url];

    probe_result result;
    auto it = m_resources.find(url);
    if (it == m_resources.end()) {
        result.status_code = 404;
        result.error = "http status 404";
        return result;
    }

    const auto& res = it->second;
    result.status_code = res.status_code ? res.status_code : (res.accepts_ranges ? 206 : 200);
    result.ok = result.status_code >= 200 && result.status_code < 300;
    if (!result.ok) {
        result.error = "http status " + std::to_string(result.status_code);
        return result;
    }
    if (res.report_length)
        result.content_length = res.body.size();
    result.accepts_ranges = res.accepts_ranges;
    result.content_type = res.content_type;
    result.headers = res.headers;
    return result;
}

transfer_result fake_transport::fetch(const transfer_request& request,
                                      const chunk_callback_t& on_chunk,
                                      const abort_callback_t& should_abort) {
    in_flight_guard guard(m_in_flight);

    resource res;
    bool fail = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requests[request.url].push_back(request);
        auto it = m_resources.find(request.url);
        if (it == m_resources.end()) {
            transfer_result missing;
            missing.status_code = 404;
            missing.error = "http status 404";
            return missing;
        }
        if (it->second.failing_fetches > 0) {
            --it->second.failing_fetches;
            fail = true;
        }
        fail = fail || it->second.always_fail;
        res = it->second;
    }

    transfer_result result;
    if (fail) {
        result.error = "connection reset by peer";
        return result;
    }
    if (res.status_code && (res.status_code < 200 || res.status_code >= 300)) {
        result.status_code = res.status_code;
        return result;
    }

    std::uint64_t size = res.body.size();
    bool ranged = request.use_range && res.accepts_ranges;
    std::uint64_t start = ranged ? request.range_start : 0;
    std::uint64_t end = size;
    if (ranged && request.range_end)
        end = std::min<std::uint64_t>(size, *request.range_end + 1);
    if (start > size || (ranged && start == size && size > 0)) {
        result.status_code = 416;
        return result;
    }

    result.status_code = ranged ? 206 : 200;
    std::uint64_t offset = start;
    while (offset < end) {
        if (should_abort && should_abort()) {
            result.aborted = true;
            return result;
        }
        auto n = static_cast<std::size_t>(std::min<std::uint64_t>(res.chunk_size, end - offset));
        if (!on_chunk(res.body.data() + offset, n)) {
            result.aborted = true;
            return result;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_delivered[request.url] += n;
        }
        offset += n;
        if (res.chunk_delay.count() > 0)
            std::this_thread::sleep_for(res.chunk_delay);
    }
    result.ok = true;
    return result;
}

std::size_t fake_transport::probe_count(const std::string& url) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_probes.find(url);
    return it == m_probes.end() ? 0 : it->second;
}

std::size_t fake_transport::fetch_count(const std::string& url) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_requests.find(url);
    return it == m_requests.end() ? 0 : it->second.size();
}

std::vector<transfer_request> fake_transport::requests(const std::string& url) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_requests.find(url);
    return it == m_requests.end() ? std::vector<transfer_request>() : it->second;
}

std::uint64_t fake_transport::bytes_delivered(const std::string& url) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_delivered.find(url);
    return it == m_delivered.end() ? 0 : it->second;
}

bool fake_transport::wait_idle(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (m_in_flight.load() > 0) {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}
