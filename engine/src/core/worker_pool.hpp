#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "core/segment_fetcher.hpp"

// Fixed set of threads draining one priority queue of segment tasks. The task to
// run next is chosen when a worker frees up, by (job priority desc, job creation
// asc, submission order asc), so priority changes apply to tasks already queued.
class worker_pool {
public:
    class listener {
    public:
        virtual ~listener() = default;
        // A worker picked up a task of this job.
        virtual void on_segment_started(const std::shared_ptr<job_state>& js,
                                        std::size_t segment_index) = 0;
        virtual void on_segment_progress(job_state& js) = 0;
        // Called exactly once per dispatched task, from the worker thread.
        virtual void on_segment_finished(const std::shared_ptr<job_state>& js,
                                         std::size_t segment_index,
                                         const segment_fetcher::report& report) = 0;
    };

    worker_pool(std::size_t worker_count, transport& net, bandwidth_limiter* global_limiter,
                const segment_fetcher::policy& policy);
    ~worker_pool();

    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;

    void attach(listener* l);
    void start();
    // Stops accepting work, interrupts running tasks and joins the threads.
    void stop();

    void submit(const std::shared_ptr<job_state>& js, std::size_t segment_index,
                std::uint64_t generation);

    // Drops every queued task of the job; returns the segment indices dropped.
    std::vector<std::size_t> remove_job(const job_state* js);

    std::size_t queued() const;
    std::size_t active() const {
        return m_active.load();
    }
    std::size_t size() const {
        return m_worker_count;
    }

private:
    struct task {
        std::shared_ptr<job_state> job;
        std::size_t segment_index;
        std::uint64_t generation;
        std::uint64_t seq;
    };

    void worker_loop(std::size_t worker_index);
    // Caller holds m_mutex and the queue is not empty.
    task pop_next();
    static bool runs_before(const task& a, const task& b);

    std::size_t m_worker_count;
    segment_fetcher m_fetcher;
    listener* m_listener = nullptr;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<task> m_queue;
    std::uint64_t m_next_seq = 0;
    bool m_stopping = false;
    std::atomic<bool> m_shutdown{false};
    std::atomic<std::size_t> m_active{0};

    std::vector<std::thread> m_threads;
};
