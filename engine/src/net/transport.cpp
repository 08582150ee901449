#include "net/transport.hpp"

bool transport::fetch_text(const std::string& url,
                           const std::map<std::string, std::string>& headers,
                           std::size_t max_bytes, std::string& out_body, std::string& out_error) {
    transfer_request req;
    req.url = url;
    req.headers = headers;

    out_body.clear();
    bool too_large = false;
    auto res = fetch(
        req,
        [&](const char* data, std::size_t size) {
            if (out_body.size() + size > max_bytes) {
                too_large = true;
                return false;
            }
            out_body.append(data, size);
            return true;
        },
        nullptr);

    if (too_large) {
        out_error = "document larger than " + std::to_string(max_bytes) + " bytes";
        return false;
    }
    if (!res.ok) {
        out_error = res.error.empty() ? "http status " + std::to_string(res.status_code)
                                      : res.error;
        return false;
    }
    return true;
}
