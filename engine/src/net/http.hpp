#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

// Logging control: define HTTP_CLIENT_ENABLE_LOG to enable client logs
#ifdef HTTP_CLIENT_ENABLE_LOG
#include <iostream>
#define HTTP_CLIENT_LOG(stmt)                                                                      \
    do {                                                                                           \
        stmt;                                                                                      \
    } while (0)
#else
#define HTTP_CLIENT_LOG(stmt)                                                                      \
    do {                                                                                           \
    } while (0)
#endif

class http_client {
public:
    struct response {
        int status_code;
        std::map<std::string, std::string> headers; // names lowercased
        std::string error;                          // transport-level failure, empty on success
        bool aborted;                               // stopped by a callback

        response() : status_code(0), aborted(false) {}
    };

    struct request {
        std::string url;
        std::map<std::string, std::string> headers;

        request(const std::string& url) : url(url) {}
    };

    // Receives each body chunk with the status code of the response it belongs to.
    // Returning false stops the transfer.
    using chunk_callback_t =
        std::function<bool(int status_code, const char* data, std::size_t size)>;
    // Polled while the transfer is idle or between chunks; returning true stops it.
    using abort_callback_t = std::function<bool()>;

    http_client();
    ~http_client();

    // Disable copy constructor and assignment operator
    http_client(const http_client&) = delete;
    http_client& operator=(const http_client&) = delete;

    // Enable move constructor and assignment operator
    http_client(http_client&&) noexcept;
    http_client& operator=(http_client&&) noexcept;

    // Streams the body to `on_chunk` without buffering it.
    response get_stream(const request& req, const chunk_callback_t& on_chunk,
                        const abort_callback_t& should_abort = nullptr);

    // Session management
    void set_user_agent(const std::string& user_agent);
    void set_connect_timeout(long timeout_seconds);
    // Fails a transfer that moves no bytes for `timeout_seconds`.
    void set_inactivity_timeout(long timeout_seconds);

private:
    class impl;
    std::unique_ptr<impl> pimpl;

    response perform_request(const request& req, const chunk_callback_t& on_chunk,
                             const abort_callback_t& should_abort);
    void parse_response_headers(const std::string& header_string, response& resp);
    void print_request_details(const request& req);
    void print_response_details(const response& resp);
};
