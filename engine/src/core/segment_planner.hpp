#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "core/job.hpp"

class segment_planner {
public:
    struct options {
        int max_connections_cap;       // hard upper bound on segments per job
        std::uint64_t min_segment_size; // no segment smaller than this unless the file is

        options();
    };

    segment_planner() = default;
    explicit segment_planner(const options& opts) : m_options(opts) {}

    // Number of ranges a job with this resource and parallelism hint gets.
    int connection_count(std::optional<std::uint64_t> file_size, bool accepts_ranges,
                         int requested) const;

    // Splits [0, file_size) into equal ranges, the last one absorbing the remainder.
    // An unknown size yields one open-ended segment, an empty file no segment at all.
    std::vector<segment> plan(std::optional<std::uint64_t> file_size, bool accepts_ranges,
                              int requested) const;

    // True when the segments cover [0, file_size) in order, without gaps or overlaps.
    static bool is_partition(const std::vector<segment>& segments, std::uint64_t file_size);

    // First byte the next request for this segment has to ask for.
    static std::uint64_t next_offset(const segment& s);
    // Bytes still missing; 0 for open-ended segments.
    static std::uint64_t remaining(const segment& s);

private:
    options m_options;
};
