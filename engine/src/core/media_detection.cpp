#include "core/media_detection.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "util/url.hpp"

namespace {
const std::map<std::string, std::string> extension_types = {
    {"mp4", "video/mp4"},
    {"m4v", "video/mp4"},
    {"webm", "video/webm"},
    {"ogv", "video/ogg"},
    {"ogg", "audio/ogg"},
    {"mov", "video/quicktime"},
    {"avi", "video/x-msvideo"},
    {"mkv", "video/x-matroska"},
    {"mp3", "audio/mpeg"},
    {"wav", "audio/wav"},
    {"flac", "audio/flac"},
    {"aac", "audio/aac"},
    {"m4a", "audio/mp4"},
    {"m3u8", "application/vnd.apple.mpegurl"},
    {"mpd", "application/dash+xml"},
    {"zip", "application/zip"},
    {"pdf", "application/pdf"},
    {"json", "application/json"},
    {"txt", "text/plain"},
    {"html", "text/html"},
    {"png", "image/png"},
    {"jpg", "image/jpeg"},
    {"gif", "image/gif"},
    {"iso", "application/x-iso9660-image"},
};

const std::map<std::string, std::string> type_extensions = {
    {"video/mp4", ".mp4"},
    {"video/webm", ".webm"},
    {"video/ogg", ".ogv"},
    {"video/quicktime", ".mov"},
    {"video/x-msvideo", ".avi"},
    {"video/x-matroska", ".mkv"},
    {"audio/mpeg", ".mp3"},
    {"audio/mp3", ".mp3"},
    {"audio/wav", ".wav"},
    {"audio/ogg", ".ogg"},
    {"audio/flac", ".flac"},
    {"audio/aac", ".aac"},
    {"audio/mp4", ".m4a"},
    {"application/vnd.apple.mpegurl", ".m3u8"},
    {"application/x-mpegurl", ".m3u8"},
    {"application/dash+xml", ".mpd"},
    {"application/zip", ".zip"},
    {"application/pdf", ".pdf"},
    {"application/json", ".json"},
    {"text/plain", ".txt"},
    {"text/html", ".html"},
    {"image/png", ".png"},
    {"image/jpeg", ".jpg"},
    {"image/gif", ".gif"},
};

const std::set<std::string> drm_words = {
    "drm", "encrypted", "widevine", "fairplay", "playready", "eme", "encryption",
};

// Narrower for headers: "encrypted-media" shows up in ordinary Permissions-Policy values
const std::set<std::string> drm_header_words = {
    "drm", "widevine", "fairplay", "playready", "encryption",
};

bool contains_token(const std::string& text, const std::set<std::string>& words) {
    std::string token;
    for (std::size_t i = 0; i <= text.size(); ++i) {
        unsigned char c = i < text.size() ? static_cast<unsigned char>(text[i]) : ' ';
        if (std::isalnum(c)) {
            token.push_back(static_cast<char>(std::tolower(c)));
            continue;
        }
        if (!token.empty() && words.count(token) > 0)
            return true;
        token.clear();
    }
    return false;
}

std::string path_extension(const std::string& url) {
    std::string name = url_utils::basename(url);
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 >= name.size())
        return "";
    return url_utils::to_lower(name.substr(dot + 1));
}

// Splits `NAME=value,NAME="quoted, value"` attribute lists.
std::map<std::string, std::string> parse_attribute_list(const std::string& list) {
    std::map<std::string, std::string> attrs;
    std::size_t pos = 0;
    while (pos < list.size()) {
        auto eq = list.find('=', pos);
        if (eq == std::string::npos)
            break;
        std::string key = url_utils::trim(list.substr(pos, eq - pos));
        std::string value;
        std::size_t next = eq + 1;
        if (next < list.size() && list[next] == '"') {
            auto close = list.find('"', next + 1);
            if (close == std::string::npos)
                close = list.size();
            value = list.substr(next + 1, close - next - 1);
            next = list.find(',', close);
        } else {
            auto comma = list.find(',', next);
            std::size_t length = comma == std::string::npos ? std::string::npos : comma - next;
            value = list.substr(next, length);
            next = comma;
        }
        attrs[key] = value;
        if (next == std::string::npos)
            break;
        pos = next + 1;
    }
    return attrs;
}

// Value of attribute `name` inside an XML start tag, case-insensitive.
std::optional<std::string> xml_attribute(const std::string& tag, const std::string& name) {
    std::string lower = url_utils::to_lower(tag);
    std::string needle = url_utils::to_lower(name) + "=\"";
    std::size_t pos = 0;
    while ((pos = lower.find(needle, pos)) != std::string::npos) {
        if (pos > 0 && std::isspace(static_cast<unsigned char>(lower[pos - 1]))) {
            std::size_t start = pos + needle.size();
            auto end = tag.find('"', start);
            if (end == std::string::npos)
                return std::nullopt;
            return tag.substr(start, end - start);
        }
        pos += needle.size();
    }
    return std::nullopt;
}

std::optional<std::uint64_t> parse_number(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), ::isdigit))
        return std::nullopt;
    try {
        return static_cast<std::uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}
} // namespace

void to_json(nlohmann::json& out, const media_quality& q) {
    out = nlohmann::json{{"bitrate", q.bitrate}, {"url", q.url}};
    if (!q.resolution.empty())
        out["resolution"] = q.resolution;
    if (!q.codec.empty())
        out["codec"] = q.codec;
}

void to_json(nlohmann::json& out, const media_detection_result& r) {
    out = nlohmann::json{
        {"url", r.url},
        {"contentType", r.content_type},
        {"mediaType", to_string(r.type)},
        {"isStreamable", r.streamable},
        {"isDRMProtected", r.drm_protected},
    };
    if (r.file_size)
        out["fileSize"] = *r.file_size;
    if (!r.qualities.empty())
        out["qualities"] = r.qualities;
}

namespace media_detection {

std::string normalize_content_type(const std::string& content_type) {
    auto semi = content_type.find(';');
    return url_utils::to_lower(url_utils::trim(content_type.substr(0, semi)));
}

std::string guess_content_type(const std::string& url) {
    auto it = extension_types.find(path_extension(url));
    return it == extension_types.end() ? "application/octet-stream" : it->second;
}

std::string extension_for(const std::string& content_type) {
    auto it = type_extensions.find(normalize_content_type(content_type));
    return it == type_extensions.end() ? "" : it->second;
}

media_type classify(const std::string& content_type, const std::string& url) {
    std::string ct = normalize_content_type(content_type);
    std::string ext = path_extension(url);

    if (ct.find("mpegurl") != std::string::npos || ext == "m3u8")
        return media_type::hls;
    if (ct == "application/dash+xml" || ext == "mpd")
        return media_type::dash;
    if (ct.rfind("video/", 0) == 0)
        return media_type::video;
    if (ct.rfind("audio/", 0) == 0)
        return media_type::audio;
    return media_type::file;
}

bool is_streamable(media_type type) {
    return type == media_type::hls || type == media_type::dash;
}

bool has_drm_indicators(const std::string& text) {
    return contains_token(text, drm_words);
}

bool headers_indicate_drm(const std::map<std::string, std::string>& headers) {
    for (const auto& header : headers) {
        if (contains_token(header.first, drm_header_words) ||
            contains_token(header.second, drm_header_words))
            return true;
    }
    return false;
}

std::vector<media_quality> parse_hls_master(const std::string& manifest,
                                            const std::string& base_url) {
    std::vector<media_quality> qualities;
    std::vector<std::string> lines;
    std::istringstream stream(manifest);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(url_utils::trim(line));
    }

    const std::string tag = "#EXT-X-STREAM-INF:";
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].rfind(tag, 0) != 0)
            continue;

        auto attrs = parse_attribute_list(lines[i].substr(tag.size()));
        auto bandwidth = attrs.find("BANDWIDTH");
        if (bandwidth == attrs.end())
            continue;
        auto bitrate = parse_number(bandwidth->second);
        if (!bitrate)
            continue;

        // The variant URI is the next line that is neither blank nor a tag
        std::size_t j = i + 1;
        while (j < lines.size() && (lines[j].empty() || lines[j][0] == '#'))
            ++j;
        if (j >= lines.size())
            break;

        media_quality q;
        q.bitrate = *bitrate;
        q.resolution = attrs.count("RESOLUTION") ? attrs["RESOLUTION"] : "";
        q.codec = attrs.count("CODECS") ? attrs["CODECS"] : "";
        q.url = url_utils::resolve(lines[j], base_url);
        qualities.push_back(std::move(q));
        i = j;
    }
    return qualities;
}

std::vector<media_quality> parse_dash_manifest(const std::string& manifest,
                                               const std::string& base_url) {
    std::vector<media_quality> qualities;
    std::string lower = url_utils::to_lower(manifest);
    const std::string open_tag = "<representation";
    const std::string close_tag = "</representation>";

    std::size_t pos = 0;
    while ((pos = lower.find(open_tag, pos)) != std::string::npos) {
        auto tag_end = lower.find('>', pos);
        if (tag_end == std::string::npos)
            break;
        std::string start_tag = manifest.substr(pos, tag_end - pos);
        bool self_closing = tag_end > 0 && manifest[tag_end - 1] == '/';
        pos = tag_end + 1;
        if (self_closing)
            continue;

        auto body_end = lower.find(close_tag, pos);
        if (body_end == std::string::npos)
            break;
        std::string body = manifest.substr(pos, body_end - pos);
        std::string body_lower = lower.substr(pos, body_end - pos);
        pos = body_end + close_tag.size();

        auto bandwidth = xml_attribute(start_tag, "bandwidth");
        auto base_open = body_lower.find("<baseurl>");
        auto base_close = body_lower.find("</baseurl>");
        if (!bandwidth || base_open == std::string::npos || base_close == std::string::npos ||
            base_close < base_open)
            continue;
        auto bitrate = parse_number(*bandwidth);
        if (!bitrate)
            continue;

        std::size_t url_start = base_open + std::string("<baseurl>").size();
        media_quality q;
        q.bitrate = *bitrate;
        auto width = xml_attribute(start_tag, "width");
        auto height = xml_attribute(start_tag, "height");
        if (width && height)
            q.resolution = *width + "x" + *height;
        q.codec = xml_attribute(start_tag, "codecs").value_or("");
        q.url = url_utils::resolve(url_utils::trim(body.substr(url_start, base_close - url_start)),
                                   base_url);
        qualities.push_back(std::move(q));
    }
    return qualities;
}

media_detection_result analyze(const std::string& url, const probe_result& probe) {
    media_detection_result r;
    r.url = url;
    r.file_size = probe.content_length;

    r.content_type = normalize_content_type(probe.content_type);
    if (r.content_type.empty() || r.content_type == "application/octet-stream")
        r.content_type = guess_content_type(url);

    r.type = classify(r.content_type, url);
    r.streamable = is_streamable(r.type);
    r.drm_protected = has_drm_indicators(url) || has_drm_indicators(r.content_type) ||
                      headers_indicate_drm(probe.headers);
    return r;
}

} // namespace media_detection

result<media_detection_result> media_detector::detect(
    const std::string& url, const std::map<std::string, std::string>& headers) {
    if (!url_utils::parse(url))
        return engine_error::validation("not an absolute http(s) URL: " + url);

    auto probe = m_transport.probe(url, headers);
    if (!probe.ok)
        return engine_error::transport("probe failed: " + probe.error);

    auto r = media_detection::analyze(url, probe);
    if (!r.streamable)
        return r;

    std::string manifest;
    std::string error;
    if (!m_transport.fetch_text(url, headers, max_manifest_bytes, manifest, error)) {
        std::cerr << "[media_detector] Cannot read manifest " << url << ": " << error
                  << std::endl;
        return r;
    }

    if (r.type == media_type::hls)
        r.qualities = media_detection::parse_hls_master(manifest, url);
    else
        r.qualities = media_detection::parse_dash_manifest(manifest, url);
    return r;
}
