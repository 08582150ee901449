#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

struct probe_result {
    bool ok = false;
    int status_code = 0;
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges = false;
    std::string content_type;
    std::map<std::string, std::string> headers; // names lowercased
    std::string error;
};

struct transfer_request {
    std::string url;
    std::map<std::string, std::string> headers;
    bool use_range = false;
    std::uint64_t range_start = 0;
    std::optional<std::uint64_t> range_end; // inclusive, open-ended when absent
    long inactivity_timeout_seconds = 30;
    long connect_timeout_seconds = 30;
};

struct transfer_result {
    bool ok = false;
    int status_code = 0;
    bool aborted = false; // stopped by on_chunk or should_abort
    std::string error;
};

// HTTP collaborator of the engine. Implementations must be callable from several
// worker threads at once.
class transport {
public:
    using chunk_callback_t = std::function<bool(const char* data, std::size_t size)>;
    using abort_callback_t = std::function<bool()>;

    virtual ~transport() = default;

    // Reads size, range support and content type without downloading the body.
    virtual probe_result probe(const std::string& url,
                               const std::map<std::string, std::string>& headers) = 0;

    // Streams the requested byte window to `on_chunk`. Chunks always start at
    // `range_start` of the resource, even if the server ignored the Range header.
    virtual transfer_result fetch(const transfer_request& request,
                                  const chunk_callback_t& on_chunk,
                                  const abort_callback_t& should_abort) = 0;

    // Small whole-body GET, used for manifests. Fails beyond `max_bytes`.
    virtual bool fetch_text(const std::string& url,
                            const std::map<std::string, std::string>& headers,
                            std::size_t max_bytes, std::string& out_body,
                            std::string& out_error);
};
