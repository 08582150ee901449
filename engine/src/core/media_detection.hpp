#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "core/job.hpp"
#include "net/transport.hpp"

struct media_quality {
    std::uint64_t bitrate = 0;
    std::string resolution; // "1280x720", empty if not advertised
    std::string codec;
    std::string url;
};

struct media_detection_result {
    std::string url;
    std::string content_type;
    std::optional<std::uint64_t> file_size;
    media_type type = media_type::file;
    bool streamable = false;
    bool drm_protected = false;
    std::vector<media_quality> qualities;
};

void to_json(nlohmann::json& out, const media_quality& q);
void to_json(nlohmann::json& out, const media_detection_result& r);

namespace media_detection {

// Lowercased media type without parameters ("Video/MP4; codecs=x" -> "video/mp4").
std::string normalize_content_type(const std::string& content_type);

// From the URL path extension; "application/octet-stream" when unknown.
std::string guess_content_type(const std::string& url);

// File extension with the dot for a content type, empty when there is no usual one.
std::string extension_for(const std::string& content_type);

media_type classify(const std::string& content_type, const std::string& url);
bool is_streamable(media_type type);

// Looks for DRM words (drm, encrypted, widevine, ...) as whole tokens of `text`.
bool has_drm_indicators(const std::string& text);
bool headers_indicate_drm(const std::map<std::string, std::string>& headers);

// Variant streams of an HLS master playlist, URLs resolved against `base_url`.
std::vector<media_quality> parse_hls_master(const std::string& manifest,
                                            const std::string& base_url);
// Representations of a DASH MPD that carry their own BaseURL.
std::vector<media_quality> parse_dash_manifest(const std::string& manifest,
                                               const std::string& base_url);

// Classification of an already probed resource, without further requests.
media_detection_result analyze(const std::string& url, const probe_result& probe);

} // namespace media_detection

class media_detector {
public:
    static constexpr std::size_t max_manifest_bytes = 4 * 1024 * 1024;

    explicit media_detector(transport& net) : m_transport(net) {}

    // Probes the resource and, for stream manifests, lists the available qualities.
    result<media_detection_result> detect(const std::string& url,
                                          const std::map<std::string, std::string>& headers);

private:
    transport& m_transport;
};
