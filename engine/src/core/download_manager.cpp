#include "core/download_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <random>
#include <sstream>

#include "core/checksum.hpp"
#include "util/byte_utils.hpp"
#include "util/url.hpp"

namespace fs = std::filesystem;

namespace {
constexpr std::size_t MAX_PROFILE_ID_LENGTH = 64;
constexpr const char* FALLBACK_FILENAME = "download";

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);

    std::stringstream ss;
    int i;
    ss << std::hex;
    for (i = 0; i < 8; i++)
        ss << dis(gen);
    ss << "-";
    for (i = 0; i < 4; i++)
        ss << dis(gen);
    ss << "-4";
    for (i = 0; i < 3; i++)
        ss << dis(gen);
    ss << "-";
    ss << dis2(gen);
    for (i = 0; i < 3; i++)
        ss << dis(gen);
    ss << "-";
    for (i = 0; i < 12; i++)
        ss << dis(gen);
    return ss.str();
}

bool valid_profile_id(const std::string& id) {
    if (id.empty() || id.size() > MAX_PROFILE_ID_LENGTH)
        return false;
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '.' || c == '_' || c == '-';
    });
}

engine_error validate_headers(const std::map<std::string, std::string>& headers) {
    for (const auto& [name, value] : headers) {
        if (name.empty() || name.find_first_of(":\r\n") != std::string::npos)
            return engine_error::validation("invalid header name '" + name + "'");
        if (value.find_first_of("\r\n") != std::string::npos)
            return engine_error::validation("invalid value for header '" + name + "'");
    }
    return {};
}

bool valid_filename(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find_first_of("/\\") == std::string::npos &&
           std::none_of(name.begin(), name.end(),
                        [](char c) { return static_cast<unsigned char>(c) < 0x20; });
}

std::string sanitize_filename(std::string name) {
    for (auto& c : name) {
        if (c == '/' || c == '\\' || static_cast<unsigned char>(c) < 0x20)
            c = '_';
    }
    name = url_utils::trim(name);
    if (name == "." || name == "..")
        return "";
    return name;
}

// {"archive.tar", ".gz"}; dot files have no extension.
std::pair<std::string, std::string> split_extension(const std::string& name) {
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0)
        return {name, ""};
    return {name.substr(0, dot), name.substr(dot)};
}

bool is_running(job_status status) {
    return status == job_status::queued || status == job_status::downloading;
}

job_event make_event(const job& j, job_event_kind kind) {
    return job_event{j.profile_id, j.id, kind, j.status};
}

void reset_segment(segment& seg) {
    seg.bytes_written = 0;
    seg.checksum.clear();
    seg.retries = 0;
    seg.status = segment_status::pending;
}

// Drops progress the destination file can no longer back.
void reconcile_with_disk(job& j) {
    auto on_disk = destination_file::size_on_disk(j.destination_path);
    if (!on_disk) {
        if (j.bytes_downloaded() > 0)
            std::cerr << "[download_manager] Destination of job " << j.id << " is missing ("
                      << j.destination_path << "), restarting from zero" << std::endl;
        for (auto& seg : j.segments)
            reset_segment(seg);
        return;
    }

    for (auto& seg : j.segments) {
        if (seg.bytes_written == 0)
            continue;
        if (seg.start_byte + seg.bytes_written > *on_disk) {
            std::cerr << "[download_manager] Job " << j.id << " segment " << seg.id
                      << " extends past the end of " << j.destination_path << ", refetching"
                      << std::endl;
            reset_segment(seg);
        }
    }
}
} // namespace

const char* to_string(job_event_kind kind) {
    switch (kind) {
    case job_event_kind::added:
        return "added";
    case job_event_kind::status:
        return "status";
    case job_event_kind::progress:
        return "progress";
    case job_event_kind::removed:
        return "removed";
    }
    return "status";
}

void to_json(nlohmann::json& out, const download_stats& s) {
    out = nlohmann::json{
        {"total", s.total},
        {"queued", s.queued},
        {"scheduled", s.scheduled},
        {"downloading", s.downloading},
        {"paused", s.paused},
        {"completed", s.completed},
        {"failed", s.failed},
        {"cancelled", s.cancelled},
        {"bytesDownloaded", s.bytes_downloaded},
        {"speed", s.speed},
    };
}

download_manager::download_manager(const engine_config& config, secure_storage& storage,
                                   transport& net)
    : m_config(config), m_store(storage), m_transport(net),
      m_planner(config.planner_options()), m_detector(net),
      m_global_limiter(config.global_bandwidth_limit),
      m_pool(config.worker_count, net, &m_global_limiter, config.fetch_policy()) {
    m_pool.attach(this);
}

download_manager::~download_manager() {
    shutdown();
}

void download_manager::start() {
    m_shutting_down.store(false);
    m_pool.start();
    m_scheduler.start(std::chrono::milliseconds(m_config.scheduler_interval_ms),
                      [this](wall_clock::time_point now) { promote_due(now); });

    std::lock_guard<std::mutex> lock(m_flush_thread_mutex);
    if (!m_flush_running) {
        m_flush_running = true;
        m_flush_thread = std::thread(&download_manager::flush_loop, this);
    }
    std::cout << "[download_manager] Started with " << m_pool.size() << " workers" << std::endl;
}

void download_manager::shutdown() {
    if (m_shutting_down.exchange(true))
        return;

    m_scheduler.stop();
    {
        std::lock_guard<std::mutex> lock(m_flush_thread_mutex);
        m_flush_running = false;
    }
    m_flush_cv.notify_all();
    if (m_flush_thread.joinable())
        m_flush_thread.join();

    m_pool.stop();
    flush_all();
    std::cout << "[download_manager] Shut down" << std::endl;
}

download_manager::profile_ptr download_manager::find_profile(const std::string& profile_id) {
    std::lock_guard<std::mutex> lock(m_profiles_mutex);
    auto it = m_profiles.find(profile_id);
    return it == m_profiles.end() ? nullptr : it->second;
}

download_manager::profile_ptr download_manager::get_or_create_profile(
    const std::string& profile_id) {
    std::lock_guard<std::mutex> lock(m_profiles_mutex);
    auto& slot = m_profiles[profile_id];
    if (!slot)
        slot = std::make_shared<profile_state>(profile_id);
    return slot;
}

void download_manager::discard_if_empty(const profile_ptr& profile) {
    std::lock_guard<std::mutex> lock(m_profiles_mutex);
    std::lock_guard<std::mutex> profile_lock(profile->mutex);
    if (!profile->active.empty() || !profile->closed.empty() || profile->bandwidth_limit != 0 ||
        profile->settings_dirty || !profile->removed_documents.empty())
        return;
    auto it = m_profiles.find(profile->id);
    if (it != m_profiles.end() && it->second == profile)
        m_profiles.erase(it);
}

std::shared_ptr<job_state> download_manager::make_state(job j, profile_state& profile) {
    auto js = std::make_shared<job_state>(std::move(j),
                                          std::chrono::milliseconds(m_config.speed_window_ms),
                                          m_config.speed_smoothing);
    js->limiter = &profile.limiter;
    return js;
}

std::string download_manager::destination_for(const std::string& profile_id,
                                              const std::string& filename) const {
    return (fs::path(m_config.download_directory) / profile_id / filename).string();
}

std::string download_manager::unique_filename(const profile_state& profile,
                                              const std::string& wanted) const {
    auto taken = [&](const std::string& name) {
        for (const auto& entry : profile.active) {
            std::lock_guard<std::mutex> lock(entry.second->mutex);
            if (entry.second->data.filename == name)
                return true;
        }
        for (const auto& j : profile.closed) {
            if (j.filename == name)
                return true;
        }
        std::error_code ec;
        return fs::exists(destination_for(profile.id, name), ec);
    };

    if (!taken(wanted))
        return wanted;
    auto parts = split_extension(wanted);
    std::string stem = parts.first + "_" + std::to_string(to_epoch_ms(wall_clock::now()));
    std::string candidate = stem + parts.second;
    // Enqueues within the same millisecond share the stamp
    for (int n = 1; taken(candidate); ++n)
        candidate = stem + "_" + std::to_string(n) + parts.second;
    return candidate;
}

const job* download_manager::find_closed(const profile_state& profile,
                                         const std::string& job_id) const {
    for (auto it = profile.closed.rbegin(); it != profile.closed.rend(); ++it) {
        if (it->id == job_id)
            return &*it;
    }
    return nullptr;
}

bool download_manager::ensure_file_open(job_state& js, std::string& out_error) {
    if (js.file && js.file->is_open())
        return true;
    auto file = std::make_shared<destination_file>();
    if (!file->open(js.data.destination_path, js.data.file_size, out_error))
        return false;
    js.file = file;
    return true;
}

std::size_t download_manager::submit_pending(job_state& js,
                                             const std::shared_ptr<job_state>& ptr) {
    if (m_shutting_down.load())
        return 0;
    if (js.busy.size() != js.data.segments.size())
        js.busy.resize(js.data.segments.size(), false);

    std::size_t submitted = 0;
    std::uint64_t generation = js.generation.load();
    for (std::size_t i = 0; i < js.data.segments.size(); ++i) {
        const auto& seg = js.data.segments[i];
        if (seg.status == segment_status::completed || seg.status == segment_status::failed)
            continue;
        if (js.busy[i])
            continue;
        js.busy[i] = true;
        m_pool.submit(ptr, i, generation);
        ++submitted;
    }
    return submitted;
}

void download_manager::stop_tasks(job_state& js) {
    ++js.generation;
    for (auto index : m_pool.remove_job(&js)) {
        if (index < js.busy.size())
            js.busy[index] = false;
    }
    js.speed.reset();
    js.data.speed = 0.0;
    js.data.refresh_derived();
}

void download_manager::retire(profile_state& profile, job_state& js) {
    std::string id = js.data.id;
    m_scheduler.remove(profile.id, id);
    js.data.speed = 0.0;
    js.data.eta = 0.0;
    js.dirty = false;
    js.file.reset();

    profile.closed.push_back(js.data);
    if (profile.closed.size() > m_config.closed_history_limit) {
        auto excess = profile.closed.size() - m_config.closed_history_limit;
        profile.closed.erase(profile.closed.begin(),
                             profile.closed.begin() + static_cast<std::ptrdiff_t>(excess));
    }
    profile.active.erase(id);
    profile.removed_documents.push_back(id);
    profile.index_dirty = true;
    profile.closed_dirty = true;
}

result<job> download_manager::enqueue(const std::string& profile_id, const std::string& url,
                                      const enqueue_options& options) {
    if (!valid_profile_id(profile_id))
        return engine_error::validation("invalid profile id '" + profile_id + "'");
    if (!url_utils::parse(url))
        return engine_error::validation("not an absolute http(s) URL: " + url);
    if (options.priority < 0)
        return engine_error::validation("priority must not be negative");
    if (options.max_connections && *options.max_connections < 1)
        return engine_error::validation("maxConnections must be at least 1");
    if (!options.expected_sha256.empty() && !checksum::is_sha256_hex(options.expected_sha256))
        return engine_error::validation("expected checksum must be 64 hex digits");
    if (options.filename && !valid_filename(*options.filename))
        return engine_error::validation("invalid filename '" + *options.filename + "'");
    auto header_error = validate_headers(options.headers);
    if (!header_error.ok())
        return header_error;

    probe_result probe;
    if (options.file_size) {
        probe.ok = true;
        probe.content_length = options.file_size;
        probe.accepts_ranges = options.accepts_ranges.value_or(true);
        probe.content_type = options.content_type;
    } else {
        probe = m_transport.probe(url, options.headers);
        if (!probe.ok) {
            std::cerr << "[download_manager] Probe of " << url << " failed (" << probe.error
                      << "), continuing with unknown size" << std::endl;
            probe.content_length.reset();
            probe.accepts_ranges = false;
        }
        if (!options.content_type.empty())
            probe.content_type = options.content_type;
    }

    auto media = media_detection::analyze(url, probe);
    if (media.drm_protected)
        return engine_error::validation("DRM-protected content cannot be downloaded: " + url);

    std::string filename =
        options.filename ? *options.filename : sanitize_filename(url_utils::basename(url));
    if (filename.empty())
        filename = FALLBACK_FILENAME;
    if (split_extension(filename).second.empty())
        filename += media_detection::extension_for(media.content_type);

    int connections =
        std::min(options.max_connections.value_or(m_config.default_connections),
                 m_config.max_connections_cap);

    auto now = wall_clock::now();
    bool deferred = options.scheduled_at && *options.scheduled_at > now;

    job j;
    j.id = generate_uuid();
    j.profile_id = profile_id;
    j.url = url;
    j.content_type = media.content_type;
    j.media = media.type;
    j.file_size = probe.content_length;
    j.accepts_ranges = probe.accepts_ranges;
    j.max_connections = connections;
    j.headers = options.headers;
    j.priority = options.priority;
    j.created_at = now;
    j.updated_at = now;
    j.expected_checksum = url_utils::to_lower(options.expected_sha256);
    j.segments = m_planner.plan(j.file_size, j.accepts_ranges, connections);
    j.status = deferred ? job_status::scheduled : job_status::queued;
    if (deferred)
        j.scheduled_at = options.scheduled_at;

    bool new_profile = !find_profile(profile_id);
    auto profile = get_or_create_profile(profile_id);
    std::shared_ptr<job_state> js;
    job snapshot;
    std::string open_error;
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        j.filename = unique_filename(*profile, filename);
        j.destination_path = destination_for(profile_id, j.filename);
        js = make_state(std::move(j), *profile);

        std::lock_guard<std::mutex> job_lock(js->mutex);
        if (!ensure_file_open(*js, open_error))
            js.reset();
    }
    if (!js) {
        if (new_profile)
            discard_if_empty(profile);
        return engine_error::validation("cannot create destination: " + open_error);
    }
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        std::lock_guard<std::mutex> job_lock(js->mutex);

        profile->active[js->data.id] = js;
        profile->index_dirty = true;
        js->touch();
        if (deferred)
            m_scheduler.add(profile_id, js->data.id, *js->data.scheduled_at);
        else
            submit_pending(*js, js);
        snapshot = js->data;
    }

    std::string size_text =
        snapshot.file_size ? byte_utils::format_bytes(*snapshot.file_size) : "unknown size";
    std::cout << "[download_manager] Enqueued " << snapshot.id << " -> "
              << snapshot.destination_path << " (" << size_text << ", "
              << snapshot.segments.size() << " segments, " << to_string(snapshot.status)
              << ")" << std::endl;

    // A known-empty resource has nothing to fetch
    if (!deferred)
        try_finish(profile, js);
    flush_profile(profile);
    emit({make_event(snapshot, job_event_kind::added)});
    return snapshot;
}

result<std::vector<job>> download_manager::list(const std::string& profile_id) {
    auto profile = find_profile(profile_id);
    if (!profile)
        return engine_error::not_found("unknown profile '" + profile_id + "'");

    std::vector<job> jobs;
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        jobs.reserve(profile->active.size() + profile->closed.size());
        for (const auto& entry : profile->active) {
            std::lock_guard<std::mutex> job_lock(entry.second->mutex);
            jobs.push_back(entry.second->data);
        }
        jobs.insert(jobs.end(), profile->closed.begin(), profile->closed.end());
    }

    std::stable_sort(jobs.begin(), jobs.end(), [](const job& a, const job& b) {
        if (a.created_at != b.created_at)
            return a.created_at > b.created_at;
        return a.id < b.id;
    });
    return jobs;
}

result<job_page> download_manager::query(const std::string& profile_id, const job_query& query) {
    auto all = list(profile_id);
    if (!all.ok())
        return all.error();

    std::string needle = url_utils::to_lower(url_utils::trim(query.text));
    auto matches = [&](const job& j) {
        if (query.status && j.status != *query.status)
            return false;
        if (needle.empty())
            return true;
        for (const auto* field : {&j.filename, &j.url, &j.content_type}) {
            if (url_utils::to_lower(*field).find(needle) != std::string::npos)
                return true;
        }
        return false;
    };

    job_page page;
    for (auto& j : all.value()) {
        if (!matches(j))
            continue;
        ++page.total;
        if (page.total <= query.offset)
            continue;
        if (query.limit == 0 || page.jobs.size() < query.limit)
            page.jobs.push_back(std::move(j));
    }
    return page;
}

result<job> download_manager::get(const std::string& profile_id, const std::string& job_id) {
    auto profile = find_profile(profile_id);
    if (!profile)
        return engine_error::not_found("unknown profile '" + profile_id + "'");

    std::lock_guard<std::mutex> lock(profile->mutex);
    auto it = profile->active.find(job_id);
    if (it != profile->active.end()) {
        std::lock_guard<std::mutex> job_lock(it->second->mutex);
        return it->second->data;
    }
    if (const job* closed = find_closed(*profile, job_id))
        return *closed;
    return engine_error::not_found("unknown job '" + job_id + "'");
}

result<progress_snapshot> download_manager::get_progress(const std::string& profile_id,
                                                         const std::string& job_id) {
    auto found = get(profile_id, job_id);
    if (!found.ok())
        return found.error();
    return make_progress_snapshot(found.value());
}

engine_error download_manager::pause(const std::string& profile_id, const std::string& job_id) {
    auto profile = find_profile(profile_id);
    if (!profile)
        return engine_error::not_found("unknown profile '" + profile_id + "'");

    job_event event;
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        auto it = profile->active.find(job_id);
        if (it == profile->active.end()) {
            if (const job* closed = find_closed(*profile, job_id))
                return engine_error::validation("job " + job_id + " is " +
                                                to_string(closed->status));
            return engine_error::not_found("unknown job '" + job_id + "'");
        }

        auto js = it->second;
        std::lock_guard<std::mutex> job_lock(js->mutex);
        if (js->data.status == job_status::paused)
            return {};

        if (js->data.status == job_status::scheduled) {
            m_scheduler.remove(profile_id, job_id);
            js->data.scheduled_at.reset();
        }
        stop_tasks(*js);
        js->data.status = job_status::paused;
        js->touch();
        event = make_event(js->data, job_event_kind::status);
    }

    std::cout << "[download_manager] Job " << job_id << " paused" << std::endl;
    flush_profile(profile);
    emit({event});
    return {};
}

engine_error download_manager::resume(const std::string& profile_id, const std::string& job_id) {
    auto profile = find_profile(profile_id);
    if (!profile)
        return engine_error::not_found("unknown profile '" + profile_id + "'");

    std::shared_ptr<job_state> js;
    job_event event;
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        auto it = profile->active.find(job_id);
        if (it == profile->active.end()) {
            if (const job* closed = find_closed(*profile, job_id))
                return engine_error::validation("job " + job_id + " is " +
                                                to_string(closed->status));
            return engine_error::not_found("unknown job '" + job_id + "'");
        }

        js = it->second;
        std::lock_guard<std::mutex> job_lock(js->mutex);
        if (js->data.status != job_status::paused)
            return engine_error::validation("job " + job_id + " is " +
                                            to_string(js->data.status) +
                                            ", only paused jobs can be resumed");

        std::string error;
        if (!ensure_file_open(*js, error))
            return engine_error::validation("cannot open destination: " + error);

        for (auto& seg : js->data.segments) {
            if (seg.status == segment_status::failed) {
                seg.status = segment_status::pending;
                seg.retries = 0;
            }
        }
        js->data.last_error = error_kind::none;
        js->data.last_error_message.clear();
        js->data.status = job_status::downloading;
        js->touch();
        submit_pending(*js, js);
        event = make_event(js->data, job_event_kind::status);
    }

    std::cout << "[download_manager] Job " << job_id << " resumed" << std::endl;
    try_finish(profile, js);
    flush_profile(profile);
    emit({event});
    return {};
}

engine_error download_manager::cancel(const std::string& profile_id, const std::string& job_id) {
    auto profile = find_profile(profile_id);
    if (!profile)
        return engine_error::not_found("unknown profile '" + profile_id + "'");

    job_event event;
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        auto it = profile->active.find(job_id);
        if (it == profile->active.end()) {
            const job* closed = find_closed(*profile, job_id);
            if (!closed)
                return engine_error::not_found("unknown job '" + job_id + "'");
            if (closed->status == job_status::cancelled)
                return {};
            return engine_error::validation("job " + job_id + " is " +
                                            to_string(closed->status) +
                                            " and can no longer be cancelled");
        }

        auto js = it->second;
        std::lock_guard<std::mutex> job_lock(js->mutex);
        stop_tasks(*js);
        js->data.status = job_status::cancelled;
        js->touch();
        if (!destination_file::remove(js->data.destination_path))
            std::cerr << "[download_manager] Could not delete " << js->data.destination_path
                      << std::endl;
        event = make_event(js->data, job_event_kind::status);
        retire(*profile, *js);
    }

    std::cout << "[download_manager] Job " << job_id << " cancelled" << std::endl;
    flush_profile(profile);
    emit({event});
    return {};
}

engine_error download_manager::set_priority(const std::string& profile_id,
                                            const std::string& job_id, int priority) {
    if (priority < 0)
        return engine_error::validation("priority must not be negative");
    auto profile = find_profile(profile_id);
    if (!profile)
        return engine_error::not_found("unknown profile '" + profile_id + "'");

    std::lock_guard<std::mutex> lock(profile->mutex);
    auto it = profile->active.find(job_id);
    if (it == profile->active.end()) {
        if (const job* closed = find_closed(*profile, job_id))
            return engine_error::validation("job " + job_id + " is " +
                                            to_string(closed->status));
        return engine_error::not_found("unknown job '" + job_id + "'");
    }

    std::lock_guard<std::mutex> job_lock(it->second->mutex);
    it->second->data.priority = priority;
    it->second->priority.store(priority);
    it->second->touch();
    return {};
}

engine_error download_manager::set_bandwidth_limit(const std::string& profile_id,
                                                   std::uint64_t limit) {
    if (!valid_profile_id(profile_id))
        return engine_error::validation("invalid profile id '" + profile_id + "'");

    auto profile = get_or_create_profile(profile_id);
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        profile->bandwidth_limit = limit;
        profile->settings_dirty = true;
    }
    profile->limiter.set_limit(limit);
    flush_profile(profile);
    return {};
}

engine_error download_manager::schedule(const std::string& profile_id, const std::string& job_id,
                                        wall_clock::time_point when) {
    auto profile = find_profile(profile_id);
    if (!profile)
        return engine_error::not_found("unknown profile '" + profile_id + "'");

    job_event event;
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        auto it = profile->active.find(job_id);
        if (it == profile->active.end()) {
            if (const job* closed = find_closed(*profile, job_id))
                return engine_error::validation("job " + job_id + " is " +
                                                to_string(closed->status));
            return engine_error::not_found("unknown job '" + job_id + "'");
        }

        auto js = it->second;
        std::lock_guard<std::mutex> job_lock(js->mutex);
        stop_tasks(*js);
        js->data.status = job_status::scheduled;
        js->data.scheduled_at = when;
        js->touch();
        m_scheduler.add(profile_id, job_id, when);
        event = make_event(js->data, job_event_kind::status);
    }

    std::cout << "[download_manager] Job " << job_id << " scheduled for epoch ms "
              << to_epoch_ms(when) << std::endl;
    flush_profile(profile);
    emit({event});
    return {};
}

std::size_t download_manager::promote_due(wall_clock::time_point now) {
    std::size_t promoted = 0;
    for (const auto& key : m_scheduler.take_due(now)) {
        auto profile = find_profile(key.first);
        if (!profile)
            continue;

        std::shared_ptr<job_state> js;
        job_event event;
        {
            std::lock_guard<std::mutex> lock(profile->mutex);
            auto it = profile->active.find(key.second);
            if (it == profile->active.end())
                continue;
            js = it->second;
            std::lock_guard<std::mutex> job_lock(js->mutex);
            if (js->data.status != job_status::scheduled)
                continue;

            std::string error;
            if (!ensure_file_open(*js, error)) {
                std::cerr << "[download_manager] Scheduled job " << key.second
                          << " cannot open its destination: " << error << std::endl;
                js->data.status = job_status::paused;
                js->data.last_error = error_kind::validation;
                js->data.last_error_message = error;
            } else {
                js->data.status = job_status::queued;
                submit_pending(*js, js);
                ++promoted;
            }
            js->data.scheduled_at.reset();
            js->touch();
            event = make_event(js->data, job_event_kind::status);
        }

        std::cout << "[download_manager] Job " << key.second << " is due, now "
                  << to_string(event.status) << std::endl;
        try_finish(profile, js);
        flush_profile(profile);
        emit({event});
    }
    return promoted;
}

result<std::vector<job>> download_manager::restore(const std::string& profile_id) {
    if (!valid_profile_id(profile_id))
        return engine_error::validation("invalid profile id '" + profile_id + "'");

    auto snapshot = m_store.load(profile_id);
    auto profile = get_or_create_profile(profile_id);

    std::vector<job> restored;
    std::vector<std::shared_ptr<job_state>> runnable;
    events_t events;
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        if (snapshot.bandwidth_limit) {
            profile->bandwidth_limit = *snapshot.bandwidth_limit;
            profile->limiter.set_limit(*snapshot.bandwidth_limit);
        }

        for (auto& j : snapshot.closed) {
            if (!find_closed(*profile, j.id) && !profile->active.count(j.id))
                profile->closed.push_back(std::move(j));
        }

        for (auto& j : snapshot.active) {
            if (profile->active.count(j.id) || find_closed(*profile, j.id))
                continue;
            if (j.profile_id != profile_id) {
                std::cerr << "[download_manager] Job " << j.id << " belongs to profile "
                          << j.profile_id << ", skipping" << std::endl;
                continue;
            }
            if (is_terminal(j.status)) {
                j.speed = 0.0;
                j.eta = 0.0;
                profile->closed.push_back(std::move(j));
                profile->index_dirty = true;
                profile->closed_dirty = true;
                continue;
            }

            if (j.destination_path.empty())
                j.destination_path = destination_for(profile_id, j.filename);
            reconcile_with_disk(j);
            for (auto& seg : j.segments) {
                if (seg.status == segment_status::downloading)
                    seg.status = segment_status::pending;
            }
            if (j.status == job_status::downloading)
                j.status = job_status::paused;
            j.speed = 0.0;
            j.refresh_derived();

            auto js = make_state(std::move(j), *profile);
            std::lock_guard<std::mutex> job_lock(js->mutex);
            std::string error;
            if (js->data.status != job_status::paused && !ensure_file_open(*js, error)) {
                std::cerr << "[download_manager] Job " << js->data.id
                          << " cannot open its destination, pausing: " << error << std::endl;
                js->data.status = job_status::paused;
                js->data.scheduled_at.reset();
            }

            if (js->data.status == job_status::scheduled && !js->data.scheduled_at)
                js->data.status = job_status::queued;

            profile->active[js->data.id] = js;
            profile->index_dirty = true;
            js->touch();

            if (js->data.status == job_status::scheduled) {
                m_scheduler.add(profile_id, js->data.id, *js->data.scheduled_at);
            } else if (js->data.status == job_status::queued) {
                submit_pending(*js, js);
                runnable.push_back(js);
            }
            restored.push_back(js->data);
            events.push_back(make_event(js->data, job_event_kind::added));
        }

        if (profile->closed.size() > m_config.closed_history_limit) {
            auto excess = profile->closed.size() - m_config.closed_history_limit;
            profile->closed.erase(profile->closed.begin(),
                                  profile->closed.begin() + static_cast<std::ptrdiff_t>(excess));
            profile->closed_dirty = true;
        }
    }

    std::cout << "[download_manager] Restored " << restored.size() << " jobs for profile "
              << profile_id << std::endl;
    for (const auto& js : runnable)
        try_finish(profile, js);
    flush_profile(profile);
    emit(events);
    return restored;
}

result<media_detection_result> download_manager::detect(
    const std::string& url, const std::map<std::string, std::string>& headers) {
    auto header_error = validate_headers(headers);
    if (!header_error.ok())
        return header_error;
    return m_detector.detect(url, headers);
}

result<download_stats> download_manager::stats(const std::string& profile_id) {
    auto jobs = list(profile_id);
    if (!jobs.ok())
        return jobs.error();

    download_stats s;
    for (const auto& j : jobs.value()) {
        ++s.total;
        s.bytes_downloaded += j.bytes_downloaded();
        switch (j.status) {
        case job_status::queued:
            ++s.queued;
            break;
        case job_status::scheduled:
            ++s.scheduled;
            break;
        case job_status::downloading:
            ++s.downloading;
            s.speed += j.speed;
            break;
        case job_status::paused:
            ++s.paused;
            break;
        case job_status::completed:
            ++s.completed;
            break;
        case job_status::failed:
            ++s.failed;
            break;
        case job_status::cancelled:
            ++s.cancelled;
            break;
        }
    }
    return s;
}

engine_error download_manager::remove(const std::string& profile_id, const std::string& job_id) {
    auto profile = find_profile(profile_id);
    if (!profile)
        return engine_error::not_found("unknown profile '" + profile_id + "'");

    events_t events;
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        auto it = profile->active.find(job_id);
        bool was_active = it != profile->active.end();
        if (was_active) {
            auto js = it->second;
            std::lock_guard<std::mutex> job_lock(js->mutex);
            stop_tasks(*js);
            js->data.status = job_status::cancelled;
            if (!destination_file::remove(js->data.destination_path))
                std::cerr << "[download_manager] Could not delete "
                          << js->data.destination_path << std::endl;
            events.push_back(make_event(js->data, job_event_kind::status));
            retire(*profile, *js);
        }

        auto& closed = profile->closed;
        auto found = std::find_if(closed.begin(), closed.end(),
                                  [&](const job& j) { return j.id == job_id; });
        if (found != closed.end()) {
            events.push_back(make_event(*found, job_event_kind::removed));
            closed.erase(found);
            profile->closed_dirty = true;
        } else if (!was_active) {
            return engine_error::not_found("unknown job '" + job_id + "'");
        }
    }

    std::cout << "[download_manager] Job " << job_id << " removed" << std::endl;
    flush_profile(profile);
    emit(events);
    return {};
}

engine_error download_manager::clear_history(const std::string& profile_id) {
    auto profile = find_profile(profile_id);
    if (!profile)
        return engine_error::not_found("unknown profile '" + profile_id + "'");

    events_t events;
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        for (const auto& j : profile->closed)
            events.push_back(make_event(j, job_event_kind::removed));
        profile->closed.clear();
        profile->closed_dirty = true;
    }

    std::cout << "[download_manager] Cleared " << events.size() << " history entries of profile "
              << profile_id << std::endl;
    flush_profile(profile);
    emit(events);
    return {};
}

engine_error download_manager::flush(const std::string& profile_id) {
    auto profile = find_profile(profile_id);
    if (!profile)
        return engine_error::not_found("unknown profile '" + profile_id + "'");
    return flush_profile(profile);
}

std::uint64_t download_manager::subscribe(observer_t observer) {
    std::lock_guard<std::mutex> lock(m_observers_mutex);
    auto id = m_next_subscription++;
    m_observers.emplace(id, std::move(observer));
    return id;
}

void download_manager::unsubscribe(std::uint64_t subscription_id) {
    std::lock_guard<std::mutex> lock(m_observers_mutex);
    m_observers.erase(subscription_id);
}

void download_manager::emit(const events_t& events) {
    if (events.empty())
        return;

    std::vector<observer_t> observers;
    {
        std::lock_guard<std::mutex> lock(m_observers_mutex);
        observers.reserve(m_observers.size());
        for (const auto& entry : m_observers)
            observers.push_back(entry.second);
    }

    for (const auto& event : events) {
        for (const auto& observer : observers) {
            try {
                observer(event);
            } catch (const std::exception& e) {
                std::cerr << "[download_manager] Observer threw on " << to_string(event.kind)
                          << " event of job " << event.job_id << ": " << e.what() << std::endl;
            }
        }
    }
}

void download_manager::on_segment_started(const std::shared_ptr<job_state>& js,
                                          std::size_t) {
    job_event event;
    {
        std::lock_guard<std::mutex> lock(js->mutex);
        if (js->data.status != job_status::queued)
            return;
        js->data.status = job_status::downloading;
        js->touch();
        event = make_event(js->data, job_event_kind::status);
    }
    std::cout << "[download_manager] Job " << event.job_id << " downloading" << std::endl;
    request_flush();
    emit({event});
}

void download_manager::on_segment_progress(job_state& js) {
    job_event event;
    {
        std::lock_guard<std::mutex> lock(js.mutex);
        auto now = speed_meter::clock::now();
        if (now - js.last_progress_event < std::chrono::milliseconds(m_config.speed_window_ms))
            return;
        js.last_progress_event = now;
        event = make_event(js.data, job_event_kind::progress);
    }
    emit({event});
}

void download_manager::on_segment_finished(const std::shared_ptr<job_state>& js,
                                           std::size_t segment_index,
                                           const segment_fetcher::report& report) {
    std::string profile_id;
    {
        std::lock_guard<std::mutex> lock(js->mutex);
        profile_id = js->data.profile_id;
    }
    auto profile = find_profile(profile_id);
    if (!profile)
        return;

    bool check_finish = false;
    bool failed = false;
    job_event event;
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        std::lock_guard<std::mutex> job_lock(js->mutex);
        if (segment_index < js->busy.size())
            js->busy[segment_index] = false;
        bool running = is_running(js->data.status);

        switch (report.result) {
        case segment_fetcher::outcome::completed:
            check_finish = running;
            break;
        case segment_fetcher::outcome::stopped:
            // A stale task of a job that was resumed meanwhile hands its segment back
            if (running && !m_shutting_down.load() && segment_index < js->data.segments.size()) {
                const auto& seg = js->data.segments[segment_index];
                if (seg.status == segment_status::pending) {
                    js->busy[segment_index] = true;
                    m_pool.submit(js, segment_index, js->generation.load());
                }
            }
            break;
        case segment_fetcher::outcome::failed:
            if (!running)
                break;
            stop_tasks(*js);
            js->data.status = job_status::failed;
            js->data.last_error = report.error.kind;
            js->data.last_error_message = report.error.message;
            js->touch();
            event = make_event(js->data, job_event_kind::status);
            retire(*profile, *js);
            failed = true;
            break;
        }
    }

    if (check_finish)
        try_finish(profile, js);
    if (failed) {
        std::cerr << "[download_manager] Job " << event.job_id << " failed: "
                  << report.error.message << std::endl;
        flush_profile(profile);
        emit({event});
    }
}

void download_manager::try_finish(const profile_ptr& profile,
                                  const std::shared_ptr<job_state>& js) {
    std::shared_ptr<destination_file> file;
    std::string expected;
    std::string path;
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        std::lock_guard<std::mutex> job_lock(js->mutex);
        if (!is_running(js->data.status) || js->finalizing)
            return;
        for (std::size_t i = 0; i < js->data.segments.size(); ++i) {
            if (!js->data.segments[i].is_complete())
                return;
            if (i < js->busy.size() && js->busy[i])
                return;
        }

        // An open-ended transfer that produced no bytes is an empty file
        if (js->data.segments.size() == 1 && js->data.segments[0].is_open_ended() &&
            js->data.segments[0].bytes_written == 0) {
            js->data.segments.clear();
            js->busy.clear();
            js->data.file_size = 0;
        }

        js->finalizing = true;
        file = js->file;
        expected = js->data.expected_checksum;
        path = js->data.destination_path;
    }

    std::string error;
    if (file && !file->sync(error))
        std::cerr << "[download_manager] " << error << std::endl;

    std::string mismatch;
    if (!expected.empty()) {
        std::string actual;
        if (!checksum::sha256_file(path, actual, error))
            mismatch = "cannot verify checksum: " + error;
        else if (!checksum::matches(expected, actual))
            mismatch = "checksum mismatch: expected " + expected + ", got " + actual;
    }

    job_event event;
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        std::lock_guard<std::mutex> job_lock(js->mutex);
        js->finalizing = false;
        // Paused or cancelled while verifying; resume finishes it
        if (!is_running(js->data.status))
            return;

        js->speed.reset();
        if (mismatch.empty()) {
            js->data.status = job_status::completed;
            js->data.last_error = error_kind::none;
            js->data.last_error_message.clear();
        } else {
            js->data.status = job_status::failed;
            js->data.last_error = error_kind::integrity;
            js->data.last_error_message = mismatch;
        }
        js->data.refresh_derived();
        js->touch();
        event = make_event(js->data, job_event_kind::status);
        retire(*profile, *js);
    }

    if (mismatch.empty())
        std::cout << "[download_manager] Job " << event.job_id << " completed: " << path
                  << std::endl;
    else
        std::cerr << "[download_manager] Job " << event.job_id << " failed: " << mismatch
                  << std::endl;
    flush_profile(profile);
    emit({event});
}

engine_error download_manager::flush_profile(const profile_ptr& profile) {
    std::lock_guard<std::mutex> flush_lock(profile->flush_mutex);

    std::vector<std::shared_ptr<job_state>> sources;
    std::vector<job> jobs;
    std::optional<std::vector<std::string>> index;
    std::optional<std::vector<job>> closed;
    std::optional<std::uint64_t> settings;
    std::vector<std::string> removed;
    {
        std::lock_guard<std::mutex> lock(profile->mutex);
        for (const auto& entry : profile->active) {
            std::lock_guard<std::mutex> job_lock(entry.second->mutex);
            if (!entry.second->dirty)
                continue;
            entry.second->dirty = false;
            sources.push_back(entry.second);
            jobs.push_back(entry.second->data);
        }
        if (profile->index_dirty) {
            std::vector<std::string> ids;
            for (const auto& entry : profile->active)
                ids.push_back(entry.first);
            index = std::move(ids);
            profile->index_dirty = false;
        }
        if (profile->closed_dirty) {
            closed = profile->closed;
            profile->closed_dirty = false;
        }
        if (profile->settings_dirty) {
            settings = profile->bandwidth_limit;
            profile->settings_dirty = false;
        }
        removed.swap(profile->removed_documents);
    }

    std::string first_error;
    auto report = [&](const std::string& what, const std::string& error) {
        std::cerr << "[download_manager] Persisting " << what << " of profile " << profile->id
                  << " failed: " << error << std::endl;
        if (first_error.empty())
            first_error = what + ": " + error;
    };

    std::string error;
    std::vector<std::shared_ptr<job_state>> unsaved;
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        if (!m_store.save_job(jobs[i], error)) {
            report("job " + jobs[i].id, error);
            unsaved.push_back(sources[i]);
        }
    }

    // Documents first, then the index that refers to them
    bool index_failed = index && !m_store.save_active_index(profile->id, *index, error);
    if (index_failed)
        report("active index", error);

    std::vector<std::string> not_removed;
    for (const auto& id : removed) {
        if (!m_store.remove_job(profile->id, id, error)) {
            report("removal of job " + id, error);
            not_removed.push_back(id);
        }
    }

    bool closed_failed = closed && !m_store.save_closed(profile->id, *closed, error);
    if (closed_failed)
        report("history", error);
    bool settings_failed = settings && !m_store.save_settings(profile->id, *settings, error);
    if (settings_failed)
        report("settings", error);

    if (first_error.empty())
        return {};

    // Retried on the next flush
    std::lock_guard<std::mutex> lock(profile->mutex);
    for (const auto& js : unsaved) {
        std::lock_guard<std::mutex> job_lock(js->mutex);
        js->dirty = true;
    }
    profile->index_dirty = profile->index_dirty || index_failed;
    profile->closed_dirty = profile->closed_dirty || closed_failed;
    profile->settings_dirty = profile->settings_dirty || settings_failed;
    profile->removed_documents.insert(profile->removed_documents.end(), not_removed.begin(),
                                      not_removed.end());
    return engine_error::persistence(first_error);
}

void download_manager::flush_all() {
    std::vector<profile_ptr> profiles;
    {
        std::lock_guard<std::mutex> lock(m_profiles_mutex);
        for (const auto& entry : m_profiles)
            profiles.push_back(entry.second);
    }
    for (const auto& profile : profiles)
        flush_profile(profile);
}

void download_manager::request_flush() {
    {
        std::lock_guard<std::mutex> lock(m_flush_thread_mutex);
        m_flush_requested = true;
    }
    m_flush_cv.notify_one();
}

void download_manager::flush_loop() {
    std::unique_lock<std::mutex> lock(m_flush_thread_mutex);
    while (m_flush_running) {
        m_flush_cv.wait_for(lock, std::chrono::milliseconds(m_config.persist_interval_ms),
                            [this]() { return !m_flush_running || m_flush_requested; });
        if (!m_flush_running)
            break;
        m_flush_requested = false;

        lock.unlock();
        flush_all();
        lock.lock();
    }
}
