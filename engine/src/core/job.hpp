#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/errors.hpp"

using wall_clock = std::chrono::system_clock;

enum class job_status {
    queued,
    scheduled,
    downloading,
    paused,
    completed,
    failed,
    cancelled,
};

enum class segment_status {
    pending,
    downloading,
    completed,
    failed,
};

enum class media_type {
    file,
    video,
    audio,
    hls,
    dash,
};

const char* to_string(job_status status);
const char* to_string(segment_status status);
const char* to_string(media_type type);

std::optional<job_status> job_status_from_string(const std::string& name);
std::optional<segment_status> segment_status_from_string(const std::string& name);
media_type media_type_from_string(const std::string& name);

// Completed, failed and cancelled jobs never run again.
bool is_terminal(job_status status);

struct segment {
    // end_byte of a segment whose resource size was unknown at planning time.
    static constexpr std::uint64_t open_end = std::numeric_limits<std::uint64_t>::max();

    std::string id;
    std::uint64_t start_byte = 0;
    std::uint64_t end_byte = 0; // inclusive
    segment_status status = segment_status::pending;
    int retries = 0;
    std::uint64_t bytes_written = 0;
    std::string checksum; // sha-256 hex, empty until known

    bool is_open_ended() const {
        return end_byte == open_end;
    }

    // Zero for open-ended segments.
    std::uint64_t size() const {
        return is_open_ended() ? 0 : end_byte - start_byte + 1;
    }

    bool is_complete() const {
        return status == segment_status::completed;
    }
};

struct job {
    std::string id;
    std::string profile_id;
    std::string url;
    std::string filename;
    std::string destination_path;
    std::string content_type;
    media_type media = media_type::file;
    std::optional<std::uint64_t> file_size;
    bool accepts_ranges = false;
    job_status status = job_status::queued;
    double progress = 0.0;
    double speed = 0.0;
    double eta = 0.0;
    int max_connections = 1;
    std::map<std::string, std::string> headers;
    int priority = 0;
    std::optional<wall_clock::time_point> scheduled_at;
    wall_clock::time_point created_at;
    wall_clock::time_point updated_at;
    std::string expected_checksum; // whole-file sha-256 hex
    error_kind last_error = error_kind::none;
    std::string last_error_message;
    std::vector<segment> segments;

    std::uint64_t bytes_downloaded() const;
    // Recomputes progress and eta from the segment cursors and current speed.
    void refresh_derived();
};

struct segment_progress {
    std::string id;
    std::uint64_t start_byte = 0;
    std::uint64_t end_byte = 0;
    std::uint64_t bytes_written = 0;
    segment_status status = segment_status::pending;
    int retries = 0;
};

struct progress_snapshot {
    std::string job_id;
    std::string url;
    std::string filename;
    job_status status = job_status::queued;
    double progress = 0.0;
    double speed = 0.0;
    double eta = 0.0;
    std::uint64_t bytes_downloaded = 0;
    std::optional<std::uint64_t> file_size;
    error_kind last_error = error_kind::none;
    std::string last_error_message;
    std::vector<segment_progress> segments;
    int max_connections = 1;
    int priority = 0;
    std::optional<wall_clock::time_point> scheduled_at;
};

progress_snapshot make_progress_snapshot(const job& j);

std::int64_t to_epoch_ms(wall_clock::time_point tp);
wall_clock::time_point from_epoch_ms(std::int64_t ms);

void to_json(nlohmann::json& out, const segment& s);
void from_json(const nlohmann::json& in, segment& s);
void to_json(nlohmann::json& out, const job& j);
void from_json(const nlohmann::json& in, job& j);
void to_json(nlohmann::json& out, const progress_snapshot& p);
