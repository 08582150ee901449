#include "core/worker_pool.hpp"

#include <iostream>

worker_pool::worker_pool(std::size_t worker_count, transport& net,
                         bandwidth_limiter* global_limiter, const segment_fetcher::policy& policy)
    : m_worker_count(worker_count > 0 ? worker_count : 1),
      m_fetcher(net, global_limiter, policy) {}

worker_pool::~worker_pool() {
    stop();
}

void worker_pool::attach(listener* l) {
    m_listener = l;
}

void worker_pool::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_threads.empty())
        return;
    m_stopping = false;
    m_shutdown.store(false);
    for (std::size_t i = 0; i < m_worker_count; ++i)
        m_threads.emplace_back(&worker_pool::worker_loop, this, i);
    std::cout << "[worker_pool] Started " << m_worker_count << " workers" << std::endl;
}

void worker_pool::stop() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_threads.empty())
            return;
        m_stopping = true;
        m_shutdown.store(true);
        m_queue.clear();
        threads.swap(m_threads);
    }
    m_cv.notify_all();
    for (auto& t : threads)
        t.join();
    std::cout << "[worker_pool] Stopped" << std::endl;
}

void worker_pool::submit(const std::shared_ptr<job_state>& js, std::size_t segment_index,
                         std::uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push_back(task{js, segment_index, generation, m_next_seq++});
    }
    m_cv.notify_one();
}

std::vector<std::size_t> worker_pool::remove_job(const job_state* js) {
    std::vector<std::size_t> dropped;
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_queue.begin();
    while (it != m_queue.end()) {
        if (it->job.get() == js) {
            dropped.push_back(it->segment_index);
            it = m_queue.erase(it);
        } else {
            ++it;
        }
    }
    return dropped;
}

std::size_t worker_pool::queued() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

bool worker_pool::runs_before(const task& a, const task& b) {
    int pa = a.job->priority.load();
    int pb = b.job->priority.load();
    if (pa != pb)
        return pa > pb;
    if (a.job->created_at != b.job->created_at)
        return a.job->created_at < b.job->created_at;
    return a.seq < b.seq;
}

worker_pool::task worker_pool::pop_next() {
    std::size_t best = 0;
    for (std::size_t i = 1; i < m_queue.size(); ++i) {
        if (runs_before(m_queue[i], m_queue[best]))
            best = i;
    }
    task t = std::move(m_queue[best]);
    m_queue.erase(m_queue.begin() + static_cast<std::ptrdiff_t>(best));
    return t;
}

void worker_pool::worker_loop(std::size_t worker_index) {
    for (;;) {
        task t;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_stopping || !m_queue.empty(); });
            if (m_stopping)
                return;
            t = pop_next();
            ++m_active;
        }

        segment_fetcher::report rep;
        if (t.job->generation.load() == t.generation) {
            if (m_listener)
                m_listener->on_segment_started(t.job, t.segment_index);
            try {
                rep = m_fetcher.run(
                    *t.job, t.segment_index, t.generation,
                    [this](job_state& js) {
                        if (m_listener)
                            m_listener->on_segment_progress(js);
                    },
                    [this]() { return m_shutdown.load(); });
            } catch (const std::exception& e) {
                std::cerr << "[worker_pool] Worker " << worker_index
                          << " task failed with exception: " << e.what() << std::endl;
                rep.result = segment_fetcher::outcome::failed;
                rep.error = engine_error::transport(e.what());
            }
        }

        if (m_listener)
            m_listener->on_segment_finished(t.job, t.segment_index, rep);
        --m_active;
    }
}
