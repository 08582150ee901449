#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/segment_planner.hpp"
#include "core/worker_pool.hpp"
#include "fake_transport.hpp"
#include "test_support.hpp"

namespace {
class recording_listener : public worker_pool::listener {
public:
    void on_segment_started(const std::shared_ptr<job_state>& js, std::size_t) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        started.push_back(js->data.id);
    }
    void on_segment_progress(job_state&) override {}
    void on_segment_finished(const std::shared_ptr<job_state>& js, std::size_t,
                             const segment_fetcher::report& report) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        finished.push_back(js->data.id);
        outcomes.push_back(report.result);
    }

    std::size_t finished_count() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return finished.size();
    }

    std::mutex m_mutex;
    std::vector<std::string> started;
    std::vector<std::string> finished;
    std::vector<segment_fetcher::outcome> outcomes;
};

std::shared_ptr<job_state> make_job(const std::string& id, const std::string& url,
                                    std::uint64_t size, int priority,
                                    wall_clock::time_point created, const temp_dir& dir) {
    job j;
    j.id = id;
    j.profile_id = "p";
    j.url = url;
    j.file_size = size;
    j.accepts_ranges = true;
    j.priority = priority;
    j.created_at = created;
    j.status = job_status::downloading;
    j.destination_path = (dir.path() / id).string();
    j.segments = segment_planner().plan(size, true, 1);

    auto js = std::make_shared<job_state>(j, std::chrono::milliseconds(100), 0.3);
    js->file = std::make_shared<destination_file>();
    std::string error;
    EXPECT_TRUE(js->file->open(j.destination_path, size, error)) << error;
    return js;
}
} // namespace

TEST(worker_pool, runs_tasks_by_priority_then_age) {
    temp_dir dir;
    fake_transport net;
    fake_transport::resource res;
    res.body = fake_transport::pattern(4096);
    net.add("http://example.com/a", res);

    auto now = wall_clock::now();
    auto later = now + std::chrono::seconds(1);
    auto latest = now + std::chrono::seconds(2);
    auto low = make_job("low", "http://example.com/a", 4096, 0, now, dir);
    auto high = make_job("high", "http://example.com/a", 4096, 5, latest, dir);
    auto old_mid = make_job("old_mid", "http://example.com/a", 4096, 2, now, dir);
    auto new_mid = make_job("new_mid", "http://example.com/a", 4096, 2, later, dir);

    recording_listener listener;
    worker_pool pool(1, net, nullptr, segment_fetcher::policy());
    pool.attach(&listener);

    pool.submit(low, 0, 0);
    pool.submit(new_mid, 0, 0);
    pool.submit(high, 0, 0);
    pool.submit(old_mid, 0, 0);
    EXPECT_EQ(pool.queued(), 4u);

    pool.start();
    ASSERT_TRUE(wait_until([&]() { return listener.finished_count() == 4; }));
    pool.stop();

    std::vector<std::string> expected = {"high", "old_mid", "new_mid", "low"};
    EXPECT_EQ(listener.started, expected);
    for (auto outcome : listener.outcomes)
        EXPECT_EQ(outcome, segment_fetcher::outcome::completed);
    EXPECT_EQ(read_file(low->data.destination_path), res.body);
}

TEST(worker_pool, priority_change_reorders_queued_tasks) {
    temp_dir dir;
    fake_transport net;
    fake_transport::resource res;
    res.body = fake_transport::pattern(1024);
    net.add("http://example.com/a", res);

    auto now = wall_clock::now();
    auto first = make_job("first", "http://example.com/a", 1024, 1, now, dir);
    auto second =
        make_job("second", "http://example.com/a", 1024, 1, now + std::chrono::seconds(1), dir);

    recording_listener listener;
    worker_pool pool(1, net, nullptr, segment_fetcher::policy());
    pool.attach(&listener);
    pool.submit(first, 0, 0);
    pool.submit(second, 0, 0);
    second->priority.store(9);

    pool.start();
    ASSERT_TRUE(wait_until([&]() { return listener.finished_count() == 2; }));
    pool.stop();

    ASSERT_EQ(listener.started.size(), 2u);
    EXPECT_EQ(listener.started[0], "second");
}

TEST(worker_pool, stale_generation_is_reported_stopped_without_running) {
    temp_dir dir;
    fake_transport net;
    fake_transport::resource res;
    res.body = fake_transport::pattern(1024);
    net.add("http://example.com/a", res);

    auto js = make_job("stale", "http://example.com/a", 1024, 0, wall_clock::now(), dir);
    recording_listener listener;
    worker_pool pool(1, net, nullptr, segment_fetcher::policy());
    pool.attach(&listener);

    pool.submit(js, 0, 0);
    js->generation.store(1);
    pool.start();
    ASSERT_TRUE(wait_until([&]() { return listener.finished_count() == 1; }));
    pool.stop();

    EXPECT_TRUE(listener.started.empty());
    EXPECT_EQ(listener.outcomes[0], segment_fetcher::outcome::stopped);
    EXPECT_EQ(net.fetch_count("http://example.com/a"), 0u);
}

TEST(worker_pool, remove_job_drops_queued_tasks) {
    temp_dir dir;
    fake_transport net;
    auto a = make_job("a", "http://example.com/a", 1024, 0, wall_clock::now(), dir);
    auto b = make_job("b", "http://example.com/b", 1024, 0, wall_clock::now(), dir);

    worker_pool pool(2, net, nullptr, segment_fetcher::policy());
    pool.submit(a, 0, 0);
    pool.submit(b, 0, 0);

    auto dropped = pool.remove_job(a.get());
    ASSERT_EQ(dropped.size(), 1u);
    EXPECT_EQ(dropped[0], 0u);
    EXPECT_EQ(pool.queued(), 1u);
}

TEST(worker_pool, failing_segment_exhausts_its_retries) {
    temp_dir dir;
    fake_transport net;
    fake_transport::resource res;
    res.body = fake_transport::pattern(1024);
    res.always_fail = true;
    net.add("http://example.com/broken", res);

    segment_fetcher::policy policy;
    policy.max_retries = 3;
    policy.retry_base_delay = std::chrono::milliseconds(1);
    policy.retry_max_delay = std::chrono::milliseconds(4);

    auto js = make_job("broken", "http://example.com/broken", 1024, 0, wall_clock::now(), dir);
    recording_listener listener;
    worker_pool pool(1, net, nullptr, policy);
    pool.attach(&listener);
    pool.submit(js, 0, 0);
    pool.start();
    ASSERT_TRUE(wait_until([&]() { return listener.finished_count() == 1; }));
    pool.stop();

    EXPECT_EQ(listener.outcomes[0], segment_fetcher::outcome::failed);
    EXPECT_EQ(net.fetch_count("http://example.com/broken"), 3u);
    std::lock_guard<std::mutex> lock(js->mutex);
    EXPECT_EQ(js->data.segments[0].status, segment_status::failed);
    EXPECT_EQ(js->data.segments[0].retries, 3);
}

TEST(segment_fetcher, backoff_doubles_up_to_the_ceiling) {
    fake_transport net;
    segment_fetcher::policy policy;
    policy.retry_base_delay = std::chrono::milliseconds(500);
    policy.retry_max_delay = std::chrono::milliseconds(3000);
    segment_fetcher fetcher(net, nullptr, policy);

    EXPECT_EQ(fetcher.retry_delay(1).count(), 500);
    EXPECT_EQ(fetcher.retry_delay(2).count(), 1000);
    EXPECT_EQ(fetcher.retry_delay(3).count(), 2000);
    EXPECT_EQ(fetcher.retry_delay(4).count(), 3000);
    EXPECT_EQ(fetcher.retry_delay(40).count(), 3000);
}
