#pragma once

#include <optional>
#include <string>

namespace url_utils {

struct url_parts {
    std::string scheme; // lowercased
    std::string host;
    std::string port;
    std::string path;   // always starts with '/'
    std::string query;  // without '?'
};

// Accepts absolute http(s) URLs only.
std::optional<url_parts> parse(const std::string& url);

// Last path component without query or fragment, percent-decoded; empty when the path ends in '/'.
std::string basename(const std::string& url);

// Resolves `reference` against `base` (absolute, root-relative and path-relative references).
std::string resolve(const std::string& reference, const std::string& base);

std::string to_lower(const std::string& str);
std::string trim(const std::string& str);

} // namespace url_utils
