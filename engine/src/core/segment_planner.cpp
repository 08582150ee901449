#include "core/segment_planner.hpp"

#include <algorithm>
#include <string>

segment_planner::options::options() : max_connections_cap(16), min_segment_size(512 * 1024) {}

int segment_planner::connection_count(std::optional<std::uint64_t> file_size, bool accepts_ranges,
                                      int requested) const {
    if (!file_size || !accepts_ranges)
        return 1;

    std::uint64_t wanted = static_cast<std::uint64_t>(std::max(1, requested));
    wanted = std::min<std::uint64_t>(wanted, std::max(1, m_options.max_connections_cap));

    // Size heuristic: small files do not get split into tiny ranges
    if (m_options.min_segment_size > 0)
        wanted = std::min(wanted,
                          std::max<std::uint64_t>(1, *file_size / m_options.min_segment_size));

    // Never more ranges than bytes
    wanted = std::min(wanted, std::max<std::uint64_t>(1, *file_size));
    return static_cast<int>(wanted);
}

std::vector<segment> segment_planner::plan(std::optional<std::uint64_t> file_size,
                                           bool accepts_ranges, int requested) const {
    std::vector<segment> parts;

    if (!file_size) {
        segment s;
        s.id = "0";
        s.start_byte = 0;
        s.end_byte = segment::open_end;
        parts.push_back(s);
        return parts;
    }

    std::uint64_t total_bytes = *file_size;
    if (total_bytes == 0)
        return parts;

    std::uint64_t count =
        static_cast<std::uint64_t>(connection_count(file_size, accepts_ranges, requested));
    std::uint64_t base = total_bytes / count;

    std::uint64_t offset = 0;
    for (std::uint64_t i = 0; i < count; ++i) {
        std::uint64_t size = i + 1 == count ? total_bytes - offset : base;
        segment s;
        s.id = std::to_string(i);
        s.start_byte = offset;
        s.end_byte = offset + size - 1;
        parts.push_back(s);
        offset += size;
    }
    return parts;
}

bool segment_planner::is_partition(const std::vector<segment>& segments,
                                   std::uint64_t file_size) {
    std::uint64_t expected_start = 0;
    for (const auto& s : segments) {
        if (s.is_open_ended() || s.start_byte != expected_start || s.end_byte < s.start_byte)
            return false;
        if (s.bytes_written > s.size())
            return false;
        expected_start = s.end_byte + 1;
    }
    return expected_start == file_size;
}

std::uint64_t segment_planner::next_offset(const segment& s) {
    return s.start_byte + s.bytes_written;
}

std::uint64_t segment_planner::remaining(const segment& s) {
    if (s.is_open_ended())
        return 0;
    return s.size() - std::min(s.bytes_written, s.size());
}
