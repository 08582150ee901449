#include "net/curl_transport.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "util/url.hpp"

curl_transport::curl_transport(std::string user_agent) : m_user_agent(std::move(user_agent)) {}

bool curl_transport::server_supports_ranges(const http_client::response& resp) {
    // If we received a 206 Partial Content or a Content-Range header, ranges are supported
    if (resp.status_code == 206)
        return true;
    auto it_cr = resp.headers.find("content-range");
    if (it_cr != resp.headers.end())
        return true;
    // Otherwise, rely on Accept-Ranges if provided
    auto it = resp.headers.find("accept-ranges");
    if (it == resp.headers.end())
        return false;
    std::string v = url_utils::to_lower(it->second);
    return v.find("bytes") != std::string::npos;
}

std::optional<std::uint64_t> curl_transport::parse_content_length(
    const http_client::response& resp) {
    // Prefer Content-Range total size if present (e.g., "bytes 0-0/2398523392")
    auto it_cr = resp.headers.find("content-range");
    if (it_cr != resp.headers.end()) {
        const std::string& v = it_cr->second;
        auto slash_pos = v.rfind('/');
        if (slash_pos != std::string::npos && slash_pos + 1 < v.size()) {
            std::string total_str = v.substr(slash_pos + 1);
            if (total_str == "*")
                return std::nullopt;
            try {
                return static_cast<std::uint64_t>(std::stoull(total_str));
            } catch (const std::logic_error& e) {
                std::cerr << "[curl_transport] Error parsing content-range total: " << e.what()
                          << std::endl;
            }
        }
    }

    // A partial answer's Content-Length is the window, not the resource
    if (resp.status_code == 206)
        return std::nullopt;

    // Fallback to Content-Length (works for non-range full responses)
    auto it = resp.headers.find("content-length");
    if (it == resp.headers.end())
        return std::nullopt;
    try {
        return static_cast<std::uint64_t>(std::stoull(it->second));
    } catch (const std::logic_error& e) {
        std::cerr << "[curl_transport] Error parsing content length: " << e.what() << std::endl;
        return std::nullopt;
    }
}

probe_result curl_transport::probe(const std::string& url,
                                   const std::map<std::string, std::string>& headers) {
    probe_result result;

    http_client client;
    client.set_user_agent(m_user_agent);
    client.set_connect_timeout(m_probe_timeout_seconds);
    client.set_inactivity_timeout(m_probe_timeout_seconds);

    // Probe with a tiny ranged GET (bytes=0-0) to fetch headers quickly
    http_client::request probe_req(url);
    probe_req.headers = headers;
    probe_req.headers["Range"] = "bytes=0-0";

    // The body is not needed; stop at the first chunk
    auto head_like = client.get_stream(
        probe_req, [](int, const char*, std::size_t) { return false; });

    result.status_code = head_like.status_code;
    result.headers = head_like.headers;
    if (!head_like.error.empty()) {
        result.error = head_like.error;
        return result;
    }
    if (head_like.status_code < 200 || head_like.status_code >= 300) {
        result.error = "http status " + std::to_string(head_like.status_code);
        return result;
    }

    result.ok = true;
    result.content_length = parse_content_length(head_like);
    result.accepts_ranges = server_supports_ranges(head_like);
    auto ct = head_like.headers.find("content-type");
    if (ct != head_like.headers.end())
        result.content_type = ct->second;
    return result;
}

transfer_result curl_transport::fetch(const transfer_request& request,
                                      const chunk_callback_t& on_chunk,
                                      const abort_callback_t& should_abort) {
    transfer_result result;

    http_client client;
    client.set_user_agent(m_user_agent);
    client.set_connect_timeout(request.connect_timeout_seconds);
    client.set_inactivity_timeout(request.inactivity_timeout_seconds);

    http_client::request req(request.url);
    req.headers = request.headers;
    if (request.use_range) {
        std::string range = "bytes=" + std::to_string(request.range_start) + "-";
        if (request.range_end)
            range += std::to_string(*request.range_end);
        req.headers["Range"] = range;
    }

    // Bytes to drop when the server answers a ranged request with the full body
    std::uint64_t skip = 0;
    bool skip_decided = false;

    auto resp = client.get_stream(
        req,
        [&](int status_code, const char* data, std::size_t size) {
            if (status_code < 200 || status_code >= 300)
                return true; // error body, discarded
            if (!skip_decided) {
                skip_decided = true;
                if (status_code == 200 && request.use_range)
                    skip = request.range_start;
            }
            if (skip > 0) {
                std::uint64_t drop = std::min<std::uint64_t>(skip, size);
                skip -= drop;
                data += drop;
                size -= static_cast<std::size_t>(drop);
                if (size == 0)
                    return true;
            }
            return on_chunk(data, size);
        },
        should_abort);

    result.status_code = resp.status_code;
    if (resp.aborted) {
        result.aborted = true;
        return result;
    }
    if (!resp.error.empty()) {
        result.error = resp.error;
        return result;
    }
    if (resp.status_code < 200 || resp.status_code >= 300) {
        result.error = "http status " + std::to_string(resp.status_code);
        return result;
    }
    if (skip > 0) {
        result.error = "unexpected short 200 body";
        return result;
    }
    result.ok = true;
    return result;
}
