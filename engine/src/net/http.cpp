#include "net/http.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <curl/curl.h>

constexpr const char* DEFAULT_USER_AGENT = "segdl/1.0";
constexpr long MAX_REDIRECTS = 10;

namespace {
std::once_flag curl_init_flag;

struct transfer_context {
    CURL* handle = nullptr;
    const http_client::chunk_callback_t* on_chunk = nullptr;
    const http_client::abort_callback_t* should_abort = nullptr;
    bool stopped_by_callback = false;
};

// Callback function to write response data
size_t write_callback(void* contents, size_t size, size_t nmemb, transfer_context* ctx) {
    size_t total_size = size * nmemb;
    long status_code = 0;
    curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &status_code);
    if (!(*ctx->on_chunk)(static_cast<int>(status_code), static_cast<const char*>(contents),
                          total_size)) {
        ctx->stopped_by_callback = true;
        return 0; // makes libcurl fail the transfer with CURLE_WRITE_ERROR
    }
    return total_size;
}

// Callback function to write response headers
size_t header_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    std::string line(static_cast<char*>(contents), total_size);
    // A new status line starts a new response (redirect hops); keep only the final one
    if (line.rfind("HTTP/", 0) == 0)
        userp->clear();
    userp->append(line);
    return total_size;
}

int xferinfo_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<transfer_context*>(clientp);
    if (ctx->should_abort && *ctx->should_abort && (*ctx->should_abort)()) {
        ctx->stopped_by_callback = true;
        return 1;
    }
    return 0;
}

// Helper function to convert string to lowercase
std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

// Helper function to trim whitespace
std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(' ');
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(' ');
    return str.substr(first, (last - first + 1));
}
} // namespace

class http_client::impl {
public:
    impl() : curl_handle(nullptr), connect_timeout_seconds(30), inactivity_timeout_seconds(30) {
        std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
        curl_handle = curl_easy_init();
        if (!curl_handle) {
            throw std::runtime_error("Failed to initialize curl handle");
        }

        // Set up common curl options
        curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_handle, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl_handle, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
        curl_easy_setopt(curl_handle, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_MAXREDIRS, MAX_REDIRECTS);
        curl_easy_setopt(curl_handle, CURLOPT_USERAGENT, DEFAULT_USER_AGENT);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, 2L);
        // Prefer HTTP/2 over TLS if available (falls back automatically)
        curl_easy_setopt(curl_handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
        // Byte offsets must refer to the stored representation, so no content decoding
        curl_easy_setopt(curl_handle, CURLOPT_ACCEPT_ENCODING, nullptr);
        apply_timeouts();
    }

    ~impl() {
        if (curl_handle) {
            curl_easy_cleanup(curl_handle);
        }
    }

    // Disable copy constructor and assignment operator
    impl(const impl&) = delete;
    impl& operator=(const impl&) = delete;

    void apply_timeouts() {
        curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds);
        curl_easy_setopt(curl_handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_LOW_SPEED_TIME, inactivity_timeout_seconds);
    }

    CURL* curl_handle;
    long connect_timeout_seconds;
    long inactivity_timeout_seconds;
};

http_client::http_client() : pimpl(std::make_unique<impl>()) {}

http_client::~http_client() = default;

http_client::http_client(http_client&&) noexcept = default;
http_client& http_client::operator=(http_client&&) noexcept = default;

http_client::response http_client::get_stream(const request& req, const chunk_callback_t& on_chunk,
                                              const abort_callback_t& should_abort) {
    return perform_request(req, on_chunk, should_abort);
}

void http_client::set_user_agent(const std::string& user_agent) {
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_USERAGENT,
                     user_agent.empty() ? DEFAULT_USER_AGENT : user_agent.c_str());
}

void http_client::set_connect_timeout(long timeout_seconds) {
    pimpl->connect_timeout_seconds = timeout_seconds;
    pimpl->apply_timeouts();
}

void http_client::set_inactivity_timeout(long timeout_seconds) {
    pimpl->inactivity_timeout_seconds = timeout_seconds;
    pimpl->apply_timeouts();
}

http_client::response http_client::perform_request(const request& req,
                                                   const chunk_callback_t& on_chunk,
                                                   const abort_callback_t& should_abort) {
    response resp;
    std::string response_headers;

    // Print request details
    print_request_details(req);

    transfer_context ctx;
    ctx.handle = pimpl->curl_handle;
    ctx.on_chunk = &on_chunk;
    ctx.should_abort = &should_abort;

    // Set URL
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_URL, req.url.c_str());

    // Set write callbacks
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_HTTPGET, 1L);

    // Set custom headers
    struct curl_slist* header_list = nullptr;
    for (const auto& header : req.headers) {
        std::string header_string = header.first + ": " + header.second;
        header_list = curl_slist_append(header_list, header_string.c_str());
    }
    if (header_list) {
        curl_easy_setopt(pimpl->curl_handle, CURLOPT_HTTPHEADER, header_list);
    }

    // Perform the request
    CURLcode res = curl_easy_perform(pimpl->curl_handle);

    // Clean up headers and clear from handle to avoid dangling pointer across requests
    if (header_list) {
        curl_easy_setopt(pimpl->curl_handle, CURLOPT_HTTPHEADER, nullptr);
        curl_slist_free_all(header_list);
        header_list = nullptr;
    }

    long status_code = 0;
    curl_easy_getinfo(pimpl->curl_handle, CURLINFO_RESPONSE_CODE, &status_code);
    resp.status_code = static_cast<int>(status_code);
    parse_response_headers(response_headers, resp);

    if (res != CURLE_OK) {
        if (ctx.stopped_by_callback &&
            (res == CURLE_WRITE_ERROR || res == CURLE_ABORTED_BY_CALLBACK)) {
            resp.aborted = true;
        } else if (res == CURLE_OPERATION_TIMEDOUT) {
            resp.error = "no data received within the inactivity timeout";
        } else {
            resp.error = curl_easy_strerror(res);
        }
        HTTP_CLIENT_LOG(std::cerr << "curl_easy_perform() failed: " << curl_easy_strerror(res)
                                  << std::endl);
        return resp;
    }

    // Log effective URL after redirects
    char* effective_url = nullptr;
    if (curl_easy_getinfo(pimpl->curl_handle, CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK &&
        effective_url) {
        HTTP_CLIENT_LOG(std::cout << "Effective URL: " << effective_url << std::endl);
    }

    // Print response details
    print_response_details(resp);

    return resp;
}

void http_client::parse_response_headers(const std::string& header_string, response& resp) {
    std::istringstream stream(header_string);
    std::string line;

    while (std::getline(stream, line)) {
        // Remove carriage return if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        size_t colon_pos = line.find(':');
        if (colon_pos != std::string::npos) {
            std::string header_name = trim(line.substr(0, colon_pos));
            std::string header_value = trim(line.substr(colon_pos + 1));

            // Convert header name to lowercase for case-insensitive comparison
            std::string lower_header_name = to_lower(header_name);
            resp.headers[lower_header_name] = header_value;
        }
    }
}

void http_client::print_request_details(const request& req) {
    HTTP_CLIENT_LOG(std::cout << "\n=== HTTP REQUEST ===" << std::endl);
    HTTP_CLIENT_LOG(std::cout << "Method: GET" << std::endl);
    HTTP_CLIENT_LOG(std::cout << "URL: " << req.url << std::endl);

    if (!req.headers.empty()) {
        HTTP_CLIENT_LOG(std::cout << "Headers:" << std::endl);
        for (const auto& header : req.headers) {
            HTTP_CLIENT_LOG(std::cout << "  " << header.first << ": " << header.second
                                      << std::endl);
        }
    }
    HTTP_CLIENT_LOG(std::cout << "===================\n" << std::endl);
}

void http_client::print_response_details(const response& resp) {
    HTTP_CLIENT_LOG(std::cout << "\n=== HTTP RESPONSE ===" << std::endl);
    HTTP_CLIENT_LOG(std::cout << "Status Code: " << resp.status_code << std::endl);

    if (!resp.headers.empty()) {
        HTTP_CLIENT_LOG(std::cout << "Headers:" << std::endl);
        for (const auto& header : resp.headers) {
            HTTP_CLIENT_LOG(std::cout << "  " << header.first << ": " << header.second
                                      << std::endl);
        }
    }
    HTTP_CLIENT_LOG(std::cout << "====================\n" << std::endl);
}
