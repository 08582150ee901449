#include "core/job.hpp"

#include <algorithm>
#include <stdexcept>

const char* to_string(job_status status) {
    switch (status) {
    case job_status::queued:
        return "queued";
    case job_status::scheduled:
        return "scheduled";
    case job_status::downloading:
        return "downloading";
    case job_status::paused:
        return "paused";
    case job_status::completed:
        return "completed";
    case job_status::failed:
        return "failed";
    case job_status::cancelled:
        return "cancelled";
    }
    return "queued";
}

const char* to_string(segment_status status) {
    switch (status) {
    case segment_status::pending:
        return "pending";
    case segment_status::downloading:
        return "downloading";
    case segment_status::completed:
        return "completed";
    case segment_status::failed:
        return "failed";
    }
    return "pending";
}

const char* to_string(media_type type) {
    switch (type) {
    case media_type::file:
        return "file";
    case media_type::video:
        return "video";
    case media_type::audio:
        return "audio";
    case media_type::hls:
        return "hls";
    case media_type::dash:
        return "dash";
    }
    return "file";
}

std::optional<job_status> job_status_from_string(const std::string& name) {
    static const std::map<std::string, job_status> names = {
        {"queued", job_status::queued},       {"scheduled", job_status::scheduled},
        {"downloading", job_status::downloading}, {"paused", job_status::paused},
        {"completed", job_status::completed}, {"failed", job_status::failed},
        {"cancelled", job_status::cancelled},
    };
    auto it = names.find(name);
    if (it == names.end())
        return std::nullopt;
    return it->second;
}

std::optional<segment_status> segment_status_from_string(const std::string& name) {
    if (name == "pending")
        return segment_status::pending;
    if (name == "downloading")
        return segment_status::downloading;
    if (name == "completed")
        return segment_status::completed;
    if (name == "failed")
        return segment_status::failed;
    return std::nullopt;
}

media_type media_type_from_string(const std::string& name) {
    if (name == "video")
        return media_type::video;
    if (name == "audio")
        return media_type::audio;
    if (name == "hls")
        return media_type::hls;
    if (name == "dash")
        return media_type::dash;
    return media_type::file;
}

bool is_terminal(job_status status) {
    return status == job_status::completed || status == job_status::failed ||
           status == job_status::cancelled;
}

std::uint64_t job::bytes_downloaded() const {
    std::uint64_t total = 0;
    for (const auto& s : segments)
        total += s.bytes_written;
    return total;
}

void job::refresh_derived() {
    std::uint64_t done = bytes_downloaded();
    if (status == job_status::completed) {
        progress = 1.0;
        eta = 0.0;
        return;
    }
    if (!file_size || *file_size == 0) {
        progress = 0.0;
        eta = 0.0;
        return;
    }
    progress = std::min(1.0, static_cast<double>(done) / static_cast<double>(*file_size));
    std::uint64_t remaining = done < *file_size ? *file_size - done : 0;
    eta = speed > 0.0 ? static_cast<double>(remaining) / speed : 0.0;
}

progress_snapshot make_progress_snapshot(const job& j) {
    progress_snapshot p;
    p.job_id = j.id;
    p.url = j.url;
    p.filename = j.filename;
    p.status = j.status;
    p.progress = j.progress;
    p.speed = j.speed;
    p.eta = j.eta;
    p.bytes_downloaded = j.bytes_downloaded();
    p.file_size = j.file_size;
    p.last_error = j.last_error;
    p.last_error_message = j.last_error_message;
    p.max_connections = j.max_connections;
    p.priority = j.priority;
    p.scheduled_at = j.scheduled_at;
    p.segments.reserve(j.segments.size());
    for (const auto& s : j.segments) {
        p.segments.push_back({s.id, s.start_byte, s.end_byte, s.bytes_written, s.status,
                              s.retries});
    }
    return p;
}

std::int64_t to_epoch_ms(wall_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

wall_clock::time_point from_epoch_ms(std::int64_t ms) {
    return wall_clock::time_point(std::chrono::milliseconds(ms));
}

namespace {
// Open-ended bounds are written as -1 so the documents stay valid JSON numbers for callers.
nlohmann::json end_byte_json(std::uint64_t end_byte) {
    if (end_byte == segment::open_end)
        return -1;
    return end_byte;
}
} // namespace

void to_json(nlohmann::json& out, const segment& s) {
    out = nlohmann::json{
        {"id", s.id},
        {"startByte", s.start_byte},
        {"endByte", end_byte_json(s.end_byte)},
        {"size", s.size()},
        {"status", to_string(s.status)},
        {"retries", s.retries},
        {"bytesWritten", s.bytes_written},
    };
    if (!s.checksum.empty())
        out["checksum"] = s.checksum;
}

void from_json(const nlohmann::json& in, segment& s) {
    s.id = in.at("id").get<std::string>();
    s.start_byte = in.at("startByte").get<std::uint64_t>();
    const auto& end = in.at("endByte");
    s.end_byte = end.is_number_integer() && end.get<std::int64_t>() < 0
                     ? segment::open_end
                     : end.get<std::uint64_t>();
    auto status = segment_status_from_string(in.value("status", "pending"));
    if (!status)
        throw std::invalid_argument("unknown segment status: " + in.value("status", ""));
    s.status = *status;
    s.retries = in.value("retries", 0);
    s.bytes_written = in.value("bytesWritten", std::uint64_t{0});
    s.checksum = in.value("checksum", "");
}

void to_json(nlohmann::json& out, const job& j) {
    out = nlohmann::json{
        {"id", j.id},
        {"profileId", j.profile_id},
        {"url", j.url},
        {"filename", j.filename},
        {"destinationPath", j.destination_path},
        {"contentType", j.content_type},
        {"mediaType", to_string(j.media)},
        {"acceptsRanges", j.accepts_ranges},
        {"status", to_string(j.status)},
        {"progress", j.progress},
        {"speed", j.speed},
        {"eta", j.eta},
        {"maxConnections", j.max_connections},
        {"headers", j.headers},
        {"priority", j.priority},
        {"createdAt", to_epoch_ms(j.created_at)},
        {"updatedAt", to_epoch_ms(j.updated_at)},
        {"segments", j.segments},
    };
    out["fileSize"] = j.file_size ? nlohmann::json(*j.file_size) : nlohmann::json(nullptr);
    if (j.scheduled_at)
        out["scheduledAt"] = to_epoch_ms(*j.scheduled_at);
    if (!j.expected_checksum.empty())
        out["expectedChecksum"] = j.expected_checksum;
    if (j.last_error != error_kind::none) {
        out["lastError"] = to_string(j.last_error);
        out["lastErrorMessage"] = j.last_error_message;
    }
}

void from_json(const nlohmann::json& in, job& j) {
    j.id = in.at("id").get<std::string>();
    j.profile_id = in.at("profileId").get<std::string>();
    j.url = in.at("url").get<std::string>();
    j.filename = in.value("filename", "");
    j.destination_path = in.value("destinationPath", "");
    j.content_type = in.value("contentType", "");
    j.media = media_type_from_string(in.value("mediaType", "file"));
    j.accepts_ranges = in.value("acceptsRanges", false);
    auto status = job_status_from_string(in.at("status").get<std::string>());
    if (!status)
        throw std::invalid_argument("unknown job status: " + in.at("status").get<std::string>());
    j.status = *status;
    j.progress = in.value("progress", 0.0);
    j.speed = in.value("speed", 0.0);
    j.eta = in.value("eta", 0.0);
    j.max_connections = in.value("maxConnections", 1);
    j.headers = in.value("headers", std::map<std::string, std::string>{});
    j.priority = in.value("priority", 0);
    j.created_at = from_epoch_ms(in.value("createdAt", std::int64_t{0}));
    j.updated_at = from_epoch_ms(in.value("updatedAt", std::int64_t{0}));
    j.segments = in.value("segments", std::vector<segment>{});

    auto size_it = in.find("fileSize");
    if (size_it != in.end() && size_it->is_number())
        j.file_size = size_it->get<std::uint64_t>();
    else
        j.file_size.reset();

    auto sched_it = in.find("scheduledAt");
    if (sched_it != in.end() && sched_it->is_number())
        j.scheduled_at = from_epoch_ms(sched_it->get<std::int64_t>());
    else
        j.scheduled_at.reset();

    j.expected_checksum = in.value("expectedChecksum", "");
    j.last_error = error_kind_from_string(in.value("lastError", ""));
    j.last_error_message = in.value("lastErrorMessage", "");
}

void to_json(nlohmann::json& out, const progress_snapshot& p) {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& s : p.segments) {
        segments.push_back({
            {"id", s.id},
            {"startByte", s.start_byte},
            {"endByte", end_byte_json(s.end_byte)},
            {"bytesWritten", s.bytes_written},
            {"status", to_string(s.status)},
            {"retries", s.retries},
        });
    }
    out = nlohmann::json{
        {"id", p.job_id},
        {"url", p.url},
        {"filename", p.filename},
        {"status", to_string(p.status)},
        {"progress", p.progress},
        {"speed", p.speed},
        {"eta", p.eta},
        {"bytesDownloaded", p.bytes_downloaded},
        {"segments", segments},
        {"maxConnections", p.max_connections},
        {"priority", p.priority},
    };
    if (p.scheduled_at)
        out["scheduledAt"] = to_epoch_ms(*p.scheduled_at);
    out["fileSize"] = p.file_size ? nlohmann::json(*p.file_size) : nlohmann::json(nullptr);
    if (p.last_error != error_kind::none) {
        out["lastError"] = to_string(p.last_error);
        out["lastErrorMessage"] = p.last_error_message;
    }
}
