#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "config/engine_config.hpp"
#include "core/bandwidth_limiter.hpp"
#include "core/errors.hpp"
#include "core/job.hpp"
#include "core/job_scheduler.hpp"
#include "core/job_state.hpp"
#include "core/media_detection.hpp"
#include "core/segment_planner.hpp"
#include "core/worker_pool.hpp"
#include "net/transport.hpp"
#include "storage/job_store.hpp"
#include "storage/secure_storage.hpp"

struct enqueue_options {
    std::optional<std::string> filename;
    std::optional<int> max_connections;
    std::map<std::string, std::string> headers;
    int priority = 0;
    std::optional<wall_clock::time_point> scheduled_at;
    std::string expected_sha256;

    // Pre-supplied probe data. When file_size is set no probe request is made.
    std::optional<std::uint64_t> file_size;
    std::optional<bool> accepts_ranges;
    std::string content_type;
};

struct job_query {
    std::optional<job_status> status;
    // Case-insensitive match against the filename, URL and content type.
    std::string text;
    std::size_t offset = 0;
    std::size_t limit = 0; // 0 means no limit
};

struct job_page {
    std::vector<job> jobs;
    std::size_t total = 0; // matches before paging
};

enum class job_event_kind {
    added,
    status,
    progress,
    removed,
};

const char* to_string(job_event_kind kind);

struct job_event {
    std::string profile_id;
    std::string job_id;
    job_event_kind kind = job_event_kind::status;
    job_status status = job_status::queued;
};

struct download_stats {
    std::size_t total = 0;
    std::size_t queued = 0;
    std::size_t scheduled = 0;
    std::size_t downloading = 0;
    std::size_t paused = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    std::uint64_t bytes_downloaded = 0;
    double speed = 0.0;
};

void to_json(nlohmann::json& out, const download_stats& s);

// Orchestrates every profile's jobs: probes and plans new jobs, feeds their segments
// to the worker pool, tracks status transitions and persists state through the
// job_store. No operation throws; failures come back as engine_error.
class download_manager : private worker_pool::listener {
public:
    using observer_t = std::function<void(const job_event&)>;

    download_manager(const engine_config& config, secure_storage& storage, transport& net);
    ~download_manager() override;

    download_manager(const download_manager&) = delete;
    download_manager& operator=(const download_manager&) = delete;

    // Starts the workers and the periodic scheduler and flush threads.
    void start();
    // Stops everything and writes the final state. Running jobs are persisted as
    // downloading and come back paused on restore.
    void shutdown();

    result<job> enqueue(const std::string& profile_id, const std::string& url,
                        const enqueue_options& options = enqueue_options());
    // Active and closed jobs, newest first.
    result<std::vector<job>> list(const std::string& profile_id);
    // list() narrowed by `query`, then paged.
    result<job_page> query(const std::string& profile_id, const job_query& query);
    result<job> get(const std::string& profile_id, const std::string& job_id);
    result<progress_snapshot> get_progress(const std::string& profile_id,
                                           const std::string& job_id);

    engine_error pause(const std::string& profile_id, const std::string& job_id);
    engine_error resume(const std::string& profile_id, const std::string& job_id);
    engine_error cancel(const std::string& profile_id, const std::string& job_id);
    engine_error set_priority(const std::string& profile_id, const std::string& job_id,
                              int priority);
    // 0 removes the limit.
    engine_error set_bandwidth_limit(const std::string& profile_id, std::uint64_t limit);
    engine_error schedule(const std::string& profile_id, const std::string& job_id,
                          wall_clock::time_point when);
    // Reloads the profile's persisted jobs. Jobs that were downloading come back
    // paused; queued and scheduled jobs carry on.
    result<std::vector<job>> restore(const std::string& profile_id);

    result<media_detection_result> detect(const std::string& url,
                                          const std::map<std::string, std::string>& headers = {});
    result<download_stats> stats(const std::string& profile_id);
    // Cancels the job if it is active and forgets it.
    engine_error remove(const std::string& profile_id, const std::string& job_id);
    engine_error clear_history(const std::string& profile_id);

    // Writes the profile's dirty state now.
    engine_error flush(const std::string& profile_id);
    // Moves every scheduled job due at `now` to queued. Returns how many moved.
    std::size_t promote_due(wall_clock::time_point now);

    std::uint64_t subscribe(observer_t observer);
    void unsubscribe(std::uint64_t subscription_id);

private:
    struct profile_state {
        explicit profile_state(std::string profile_id) : id(std::move(profile_id)) {}

        const std::string id;
        std::mutex mutex; // serializes registry changes; taken before any job mutex
        std::map<std::string, std::shared_ptr<job_state>> active;
        std::vector<job> closed; // oldest first
        bandwidth_limiter limiter;
        std::uint64_t bandwidth_limit = 0;

        bool index_dirty = false;
        bool closed_dirty = false;
        bool settings_dirty = false;
        std::vector<std::string> removed_documents;

        std::mutex flush_mutex; // orders concurrent flushes of this profile
    };

    using profile_ptr = std::shared_ptr<profile_state>;
    using events_t = std::vector<job_event>;

    // worker_pool::listener
    void on_segment_started(const std::shared_ptr<job_state>& js,
                            std::size_t segment_index) override;
    void on_segment_progress(job_state& js) override;
    void on_segment_finished(const std::shared_ptr<job_state>& js, std::size_t segment_index,
                             const segment_fetcher::report& report) override;

    profile_ptr find_profile(const std::string& profile_id);
    profile_ptr get_or_create_profile(const std::string& profile_id);
    // Drops a profile that a failed operation created and left without state
    void discard_if_empty(const profile_ptr& profile);

    // The helpers below expect the profile mutex, and the job mutex where they take
    // a job_state, to be held by the caller.
    std::size_t submit_pending(job_state& js, const std::shared_ptr<job_state>& ptr);
    void stop_tasks(job_state& js);
    void retire(profile_state& profile, job_state& js);
    const job* find_closed(const profile_state& profile, const std::string& job_id) const;
    std::string unique_filename(const profile_state& profile, const std::string& wanted) const;
    std::string destination_for(const std::string& profile_id,
                                const std::string& filename) const;
    bool ensure_file_open(job_state& js, std::string& out_error);
    std::shared_ptr<job_state> make_state(job j, profile_state& profile);

    // Verifies and commits a job whose segments are all complete. Takes the locks itself.
    void try_finish(const profile_ptr& profile, const std::shared_ptr<job_state>& js);

    engine_error flush_profile(const profile_ptr& profile);
    void flush_all();
    void flush_loop();
    // Wakes the flush thread early.
    void request_flush();

    void emit(const events_t& events);

    engine_config m_config;
    job_store m_store;
    transport& m_transport;
    segment_planner m_planner;
    media_detector m_detector;
    bandwidth_limiter m_global_limiter;
    worker_pool m_pool;
    job_scheduler m_scheduler;

    std::mutex m_profiles_mutex;
    std::map<std::string, profile_ptr> m_profiles;

    std::mutex m_observers_mutex;
    std::unordered_map<std::uint64_t, observer_t> m_observers;
    std::uint64_t m_next_subscription = 1;

    std::atomic<bool> m_shutting_down{false};
    std::mutex m_flush_thread_mutex;
    std::condition_variable m_flush_cv;
    bool m_flush_running = false;
    bool m_flush_requested = false;
    std::thread m_flush_thread;
};
