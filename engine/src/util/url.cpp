#include "util/url.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace url_utils {

namespace {
int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string percent_decode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

// Collapses "." and ".." segments of an absolute path.
std::string normalize_path(const std::string& path) {
    size_t pos = 0;
    std::string result;
    std::vector<std::string> stack;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos)
            next = path.size();
        std::string part = path.substr(pos, next - pos);
        if (part == "..") {
            if (!stack.empty())
                stack.pop_back();
        } else if (!part.empty() && part != ".") {
            stack.push_back(part);
        }
        pos = next + 1;
    }
    for (const auto& part : stack)
        result += "/" + part;
    if (result.empty() || (!path.empty() && path.back() == '/'))
        result += "/";
    return result;
}
} // namespace

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t");
    return str.substr(first, (last - first + 1));
}

std::optional<url_parts> parse(const std::string& url) {
    // Find the protocol separator
    size_t protocol_pos = url.find("://");
    if (protocol_pos == std::string::npos || protocol_pos == 0)
        return std::nullopt;

    url_parts parts;
    parts.scheme = to_lower(url.substr(0, protocol_pos));
    if (parts.scheme != "http" && parts.scheme != "https")
        return std::nullopt;

    size_t authority_start = protocol_pos + 3;
    size_t authority_end = url.find_first_of("/?#", authority_start);
    if (authority_end == std::string::npos)
        authority_end = url.size();

    std::string authority = url.substr(authority_start, authority_end - authority_start);
    size_t at = authority.rfind('@');
    if (at != std::string::npos)
        authority = authority.substr(at + 1);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        parts.port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (parts.port.empty() ||
            !std::all_of(parts.port.begin(), parts.port.end(), ::isdigit))
            return std::nullopt;
    }
    parts.host = authority;
    if (parts.host.empty())
        return std::nullopt;
    if (std::any_of(parts.host.begin(), parts.host.end(),
                    [](unsigned char c) { return std::isspace(c) != 0; }))
        return std::nullopt;

    std::string rest = url.substr(authority_end);
    size_t fragment = rest.find('#');
    if (fragment != std::string::npos)
        rest = rest.substr(0, fragment);
    size_t query = rest.find('?');
    if (query != std::string::npos) {
        parts.query = rest.substr(query + 1);
        rest = rest.substr(0, query);
    }
    parts.path = rest.empty() ? "/" : rest;
    return parts;
}

std::string basename(const std::string& url) {
    auto parts = parse(url);
    std::string path = parts ? parts->path : url;
    size_t slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return percent_decode(name);
}

std::string resolve(const std::string& reference, const std::string& base) {
    if (parse(reference))
        return reference;

    auto base_parts = parse(base);
    if (!base_parts)
        return reference;

    std::string origin = base_parts->scheme + "://" + base_parts->host;
    if (!base_parts->port.empty())
        origin += ":" + base_parts->port;

    if (reference.rfind("//", 0) == 0)
        return base_parts->scheme + ":" + reference;

    std::string ref_path = reference;
    std::string ref_query;
    size_t q = ref_path.find('?');
    if (q != std::string::npos) {
        ref_query = ref_path.substr(q);
        ref_path = ref_path.substr(0, q);
    }

    std::string path;
    if (!ref_path.empty() && ref_path.front() == '/') {
        path = ref_path;
    } else {
        std::string dir = base_parts->path.substr(0, base_parts->path.rfind('/') + 1);
        path = dir + ref_path;
    }
    return origin + normalize_path(path) + ref_query;
}

} // namespace url_utils
