#include "config/engine_config.hpp"

#include <fstream>
#include <limits>

namespace {
template <typename T>
bool read_integer(const nlohmann::json& doc, const char* key, std::int64_t min, std::int64_t max,
                  T& out, std::string& out_error) {
    auto it = doc.find(key);
    if (it == doc.end())
        return true;
    if (!it->is_number_integer()) {
        out_error = std::string("config key '") + key + "' must be an integer";
        return false;
    }
    bool too_large = it->is_number_unsigned() &&
                     it->get<std::uint64_t>() >
                         static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    std::int64_t value = too_large ? max : it->get<std::int64_t>();
    if (too_large || value < min || value > max) {
        out_error = std::string("config key '") + key + "' must be between " +
                    std::to_string(min) + " and " + std::to_string(max);
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

bool read_string(const nlohmann::json& doc, const char* key, bool allow_empty, std::string& out,
                 std::string& out_error) {
    auto it = doc.find(key);
    if (it == doc.end())
        return true;
    if (!it->is_string() || (!allow_empty && it->get<std::string>().empty())) {
        out_error = std::string("config key '") + key + "' must be a" +
                    (allow_empty ? "" : " non-empty") + " string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}
} // namespace

engine_config::engine_config()
    : worker_count(8), default_connections(4), max_connections_cap(16),
      min_segment_size(512 * 1024), max_retries(3), retry_base_delay_ms(500),
      retry_max_delay_ms(30000), inactivity_timeout_seconds(30), connect_timeout_seconds(30),
      persist_interval_ms(2000), scheduler_interval_ms(1000), closed_history_limit(100),
      global_bandwidth_limit(0), speed_window_ms(500), speed_smoothing(0.3),
      download_directory("downloads"), state_directory("state"), user_agent("segdl/1.0") {}

bool engine_config::apply(const nlohmann::json& doc, std::string& out_error) {
    if (!doc.is_object()) {
        out_error = "config must be a JSON object";
        return false;
    }

    constexpr std::int64_t HOUR_MS = 3600LL * 1000LL;
    engine_config next = *this;
    bool ok = read_integer(doc, "workerCount", 1, 256, next.worker_count, out_error) &&
              read_integer(doc, "defaultConnections", 1, 64, next.default_connections,
                           out_error) &&
              read_integer(doc, "maxConnectionsCap", 1, 64, next.max_connections_cap,
                           out_error) &&
              read_integer(doc, "minSegmentSize", 1, 1LL << 40, next.min_segment_size,
                           out_error) &&
              read_integer(doc, "maxRetries", 1, 100, next.max_retries, out_error) &&
              read_integer(doc, "retryBaseDelayMs", 0, HOUR_MS, next.retry_base_delay_ms,
                           out_error) &&
              read_integer(doc, "retryMaxDelayMs", 0, 24 * HOUR_MS, next.retry_max_delay_ms,
                           out_error) &&
              read_integer(doc, "inactivityTimeoutSeconds", 1, 3600,
                           next.inactivity_timeout_seconds, out_error) &&
              read_integer(doc, "connectTimeoutSeconds", 1, 3600, next.connect_timeout_seconds,
                           out_error) &&
              read_integer(doc, "persistIntervalMs", 10, HOUR_MS, next.persist_interval_ms,
                           out_error) &&
              read_integer(doc, "schedulerIntervalMs", 10, HOUR_MS, next.scheduler_interval_ms,
                           out_error) &&
              read_integer(doc, "closedHistoryLimit", 0, 100000, next.closed_history_limit,
                           out_error) &&
              read_integer(doc, "globalBandwidthLimit", 0,
                           std::numeric_limits<std::int64_t>::max(),
                           next.global_bandwidth_limit, out_error) &&
              read_integer(doc, "speedWindowMs", 10, 60000, next.speed_window_ms, out_error) &&
              read_string(doc, "downloadDirectory", false, next.download_directory,
                          out_error) &&
              read_string(doc, "stateDirectory", false, next.state_directory, out_error) &&
              read_string(doc, "userAgent", true, next.user_agent, out_error);
    if (!ok)
        return false;

    auto smoothing = doc.find("speedSmoothing");
    if (smoothing != doc.end()) {
        if (!smoothing->is_number() || smoothing->get<double>() <= 0.0 ||
            smoothing->get<double>() > 1.0) {
            out_error = "config key 'speedSmoothing' must be a number in (0, 1]";
            return false;
        }
        next.speed_smoothing = smoothing->get<double>();
    }

    if (next.max_connections_cap < next.default_connections) {
        out_error = "config key 'defaultConnections' exceeds 'maxConnectionsCap'";
        return false;
    }

    *this = next;
    return true;
}

bool engine_config::load_file(const std::string& path, engine_config& out,
                              std::string& out_error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        out_error = "cannot open config file " + path;
        return false;
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        out_error = "invalid JSON in " + path + ": " + e.what();
        return false;
    }
    return out.apply(doc, out_error);
}

segment_planner::options engine_config::planner_options() const {
    segment_planner::options opts;
    opts.max_connections_cap = max_connections_cap;
    opts.min_segment_size = min_segment_size;
    return opts;
}

segment_fetcher::policy engine_config::fetch_policy() const {
    segment_fetcher::policy policy;
    policy.max_retries = max_retries;
    policy.retry_base_delay = std::chrono::milliseconds(retry_base_delay_ms);
    policy.retry_max_delay = std::chrono::milliseconds(retry_max_delay_ms);
    policy.inactivity_timeout_seconds = inactivity_timeout_seconds;
    policy.connect_timeout_seconds = connect_timeout_seconds;
    return policy;
}

void to_json(nlohmann::json& out, const engine_config& config) {
    out = nlohmann::json{
        {"workerCount", config.worker_count},
        {"defaultConnections", config.default_connections},
        {"maxConnectionsCap", config.max_connections_cap},
        {"minSegmentSize", config.min_segment_size},
        {"maxRetries", config.max_retries},
        {"retryBaseDelayMs", config.retry_base_delay_ms},
        {"retryMaxDelayMs", config.retry_max_delay_ms},
        {"inactivityTimeoutSeconds", config.inactivity_timeout_seconds},
        {"connectTimeoutSeconds", config.connect_timeout_seconds},
        {"persistIntervalMs", config.persist_interval_ms},
        {"schedulerIntervalMs", config.scheduler_interval_ms},
        {"closedHistoryLimit", config.closed_history_limit},
        {"globalBandwidthLimit", config.global_bandwidth_limit},
        {"speedWindowMs", config.speed_window_ms},
        {"speedSmoothing", config.speed_smoothing},
        {"downloadDirectory", config.download_directory},
        {"stateDirectory", config.state_directory},
        {"userAgent", config.user_agent},
    };
}
