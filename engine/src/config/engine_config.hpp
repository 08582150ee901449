#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

#include "core/segment_fetcher.hpp"
#include "core/segment_planner.hpp"

struct engine_config {
    std::size_t worker_count;
    int default_connections;
    int max_connections_cap;
    std::uint64_t min_segment_size;
    int max_retries;
    std::int64_t retry_base_delay_ms;
    std::int64_t retry_max_delay_ms;
    long inactivity_timeout_seconds;
    long connect_timeout_seconds;
    std::int64_t persist_interval_ms;
    std::int64_t scheduler_interval_ms;
    std::size_t closed_history_limit;
    std::uint64_t global_bandwidth_limit; // bytes/sec, 0 = unbounded
    std::int64_t speed_window_ms;
    double speed_smoothing;
    std::string download_directory;
    std::string state_directory;
    std::string user_agent;

    engine_config();

    // Overrides the fields named in `doc` (camelCase keys). Unknown keys are ignored;
    // a wrong type or out-of-range value fails naming the key and leaves *this untouched.
    bool apply(const nlohmann::json& doc, std::string& out_error);

    static bool load_file(const std::string& path, engine_config& out, std::string& out_error);

    segment_planner::options planner_options() const;
    segment_fetcher::policy fetch_policy() const;
};

void to_json(nlohmann::json& out, const engine_config& config);
