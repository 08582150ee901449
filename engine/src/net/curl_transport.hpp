#pragma once

#include <string>

#include "net/http.hpp"
#include "net/transport.hpp"

// libcurl-backed transport. Every call uses its own easy handle, so one instance
// serves all worker threads.
class curl_transport : public transport {
public:
    explicit curl_transport(std::string user_agent = "");

    probe_result probe(const std::string& url,
                       const std::map<std::string, std::string>& headers) override;

    transfer_result fetch(const transfer_request& request, const chunk_callback_t& on_chunk,
                          const abort_callback_t& should_abort) override;

    static bool server_supports_ranges(const http_client::response& head_like_response);
    static std::optional<std::uint64_t> parse_content_length(
        const http_client::response& response);

private:
    std::string m_user_agent;
    long m_probe_timeout_seconds = 30;
};
