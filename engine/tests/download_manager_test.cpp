#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "core/checksum.hpp"
#include "manager_fixture.hpp"
#include "storage/job_store.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
std::string sha256_of(const std::string& data) {
    sha256_hasher hasher;
    hasher.update(data.data(), data.size());
    return hasher.finish();
}
} // namespace

TEST_F(manager_test, splits_a_large_file_into_equal_segments) {
    const std::string url = "http://example.com/files/data.bin";
    serve(url, 4000000);
    start_manager();

    enqueue_options opts;
    opts.max_connections = 4;
    auto added = manager->enqueue(profile, url, opts);
    ASSERT_TRUE(added.ok()) << added.error().message;

    const job& j = added.value();
    EXPECT_EQ(j.filename, "data.bin");
    ASSERT_TRUE(j.file_size.has_value());
    EXPECT_EQ(*j.file_size, 4000000u);
    ASSERT_EQ(j.segments.size(), 4u);
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(j.segments[i].start_byte, i * 1000000);
        EXPECT_EQ(j.segments[i].end_byte, i * 1000000 + 999999);
    }

    auto done = wait_for_status(j.id, job_status::completed);
    EXPECT_DOUBLE_EQ(done.progress, 1.0);
    EXPECT_EQ(done.bytes_downloaded(), 4000000u);
    for (const auto& seg : done.segments) {
        EXPECT_EQ(seg.status, segment_status::completed);
        EXPECT_EQ(seg.bytes_written, 1000000u);
        EXPECT_EQ(seg.checksum.size(), 64u);
    }
    EXPECT_EQ(read_file(done.destination_path), fake_transport::pattern(4000000));

    std::set<std::uint64_t> starts;
    for (const auto& req : net.requests(url)) {
        EXPECT_TRUE(req.use_range);
        starts.insert(req.range_start);
    }
    EXPECT_EQ(starts, (std::set<std::uint64_t>{0, 1000000, 2000000, 3000000}));
}

TEST_F(manager_test, pause_and_resume_fetch_only_the_remainder) {
    const std::string url = "http://example.com/slow.bin";
    const std::size_t size = 4000000;
    serve(url, size, 3ms, 16 * 1024);
    start_manager();

    enqueue_options opts;
    opts.max_connections = 4;
    auto added = manager->enqueue(profile, url, opts);
    ASSERT_TRUE(added.ok());
    const std::string id = added.value().id;

    ASSERT_TRUE(wait_for_bytes(id, 100000));
    ASSERT_TRUE(manager->pause(profile, id).ok());
    ASSERT_TRUE(net.wait_idle(5s));

    auto paused = current(id);
    ASSERT_EQ(paused.status, job_status::paused);
    std::uint64_t before = paused.bytes_downloaded();
    ASSERT_LT(before, size);

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(current(id).bytes_downloaded(), before);
    EXPECT_TRUE(manager->pause(profile, id).ok());

    std::uint64_t delivered_before = net.bytes_delivered(url);
    std::size_t requests_before = net.requests(url).size();
    std::set<std::uint64_t> cursors;
    for (const auto& seg : paused.segments) {
        if (seg.status != segment_status::completed)
            cursors.insert(seg.start_byte + seg.bytes_written);
    }

    ASSERT_TRUE(manager->resume(profile, id).ok());
    auto done = wait_for_status(id, job_status::completed);

    EXPECT_EQ(net.bytes_delivered(url) - delivered_before, size - before);
    auto requests = net.requests(url);
    for (std::size_t i = requests_before; i < requests.size(); ++i)
        EXPECT_EQ(cursors.count(requests[i].range_start), 1u)
            << "unexpected range start " << requests[i].range_start;
    EXPECT_EQ(read_file(done.destination_path), fake_transport::pattern(size));
}

TEST_F(manager_test, profile_bandwidth_limit_caps_throughput) {
    const std::string url = "http://example.com/capped.bin";
    serve(url, 300000, 0ms, 16 * 1024);
    start_manager();

    ASSERT_TRUE(manager->set_bandwidth_limit(profile, 100000).ok());
    auto start = std::chrono::steady_clock::now();
    auto added = manager->enqueue(profile, url);
    ASSERT_TRUE(added.ok());
    wait_for_status(added.value().id, job_status::completed);
    double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    // One second of burst, then 200000 bytes at 100000 B/s
    EXPECT_GE(elapsed, 1.6);
    EXPECT_LT(elapsed, 8.0);
}

TEST_F(manager_test, jobs_of_one_profile_share_its_limit) {
    const std::string first_url = "http://example.com/first.bin";
    const std::string second_url = "http://example.com/second.bin";
    serve(first_url, 150000, 0ms, 16 * 1024);
    serve(second_url, 150000, 0ms, 16 * 1024);
    start_manager();

    ASSERT_TRUE(manager->set_bandwidth_limit(profile, 100000).ok());
    auto start = std::chrono::steady_clock::now();
    auto first = manager->enqueue(profile, first_url);
    auto second = manager->enqueue(profile, second_url);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    EXPECT_TRUE(wait_until([&]() {
        return current(first.value().id).status == job_status::downloading &&
               current(second.value().id).status == job_status::downloading;
    }));

    wait_for_status(first.value().id, job_status::completed);
    wait_for_status(second.value().id, job_status::completed);
    double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    // 300000 bytes in total: one second of burst, then 200000 bytes at 100000 B/s.
    // Separate buckets would finish both jobs in about half a second.
    EXPECT_GE(elapsed, 1.6);
    EXPECT_LT(elapsed, 8.0);
    EXPECT_EQ(read_file(current(second.value().id).destination_path),
              fake_transport::pattern(150000));
}

TEST_F(manager_test, scheduled_job_waits_for_its_time) {
    const std::string url = "http://example.com/later.bin";
    serve(url, 200000);
    start_manager();

    auto now = wall_clock::now();
    enqueue_options opts;
    opts.scheduled_at = now + 1h;
    auto added = manager->enqueue(profile, url, opts);
    ASSERT_TRUE(added.ok());
    const std::string id = added.value().id;
    EXPECT_EQ(added.value().status, job_status::scheduled);

    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(current(id).status, job_status::scheduled);
    EXPECT_EQ(net.fetch_count(url), 0u);

    EXPECT_EQ(manager->promote_due(now + 30min), 0u);
    EXPECT_EQ(current(id).status, job_status::scheduled);

    EXPECT_EQ(manager->promote_due(now + 2h), 1u);
    auto done = wait_for_status(id, job_status::completed);
    EXPECT_FALSE(done.scheduled_at.has_value());
    EXPECT_EQ(read_file(done.destination_path), fake_transport::pattern(200000));
}

TEST_F(manager_test, schedule_stops_a_running_job) {
    const std::string url = "http://example.com/resched.bin";
    serve(url, 2000000, 3ms, 16 * 1024);
    start_manager();

    auto added = manager->enqueue(profile, url);
    ASSERT_TRUE(added.ok());
    const std::string id = added.value().id;
    ASSERT_TRUE(wait_for_bytes(id, 16 * 1024));

    auto when = wall_clock::now() + 1h;
    ASSERT_TRUE(manager->schedule(profile, id, when).ok());
    ASSERT_TRUE(net.wait_idle(5s));
    auto scheduled = current(id);
    EXPECT_EQ(scheduled.status, job_status::scheduled);
    ASSERT_TRUE(scheduled.scheduled_at.has_value());
    EXPECT_EQ(to_epoch_ms(*scheduled.scheduled_at), to_epoch_ms(when));

    EXPECT_EQ(manager->promote_due(when), 1u);
    auto done = wait_for_status(id, job_status::completed);
    EXPECT_EQ(read_file(done.destination_path), fake_transport::pattern(2000000));
}

TEST_F(manager_test, exhausted_retries_fail_the_job) {
    const std::string url = "http://example.com/broken.bin";
    fake_transport::resource res;
    res.body = fake_transport::pattern(100000);
    res.always_fail = true;
    net.add(url, res);
    start_manager();

    enqueue_options opts;
    opts.max_connections = 1;
    auto added = manager->enqueue(profile, url, opts);
    ASSERT_TRUE(added.ok());

    auto failed = wait_for_status(added.value().id, job_status::failed);
    EXPECT_EQ(failed.last_error, error_kind::transport);
    EXPECT_FALSE(failed.last_error_message.empty());
    EXPECT_EQ(net.fetch_count(url), 3u);
    ASSERT_EQ(failed.segments.size(), 1u);
    EXPECT_EQ(failed.segments[0].status, segment_status::failed);
    EXPECT_EQ(failed.segments[0].retries, 3);

    auto progress = manager->get_progress(profile, added.value().id);
    ASSERT_TRUE(progress.ok());
    EXPECT_EQ(progress.value().last_error, error_kind::transport);
}

TEST_F(manager_test, transient_failures_are_retried) {
    const std::string url = "http://example.com/flaky.bin";
    serve(url, 100000);
    net.fail_next(url, 2);
    start_manager();

    auto added = manager->enqueue(profile, url);
    ASSERT_TRUE(added.ok());
    auto done = wait_for_status(added.value().id, job_status::completed);
    EXPECT_EQ(done.segments[0].retries, 2);
    EXPECT_EQ(read_file(done.destination_path), fake_transport::pattern(100000));
}

TEST_F(manager_test, checksum_mismatch_is_an_integrity_error) {
    const std::string url = "http://example.com/tampered.bin";
    serve(url, 300000);
    start_manager();

    enqueue_options opts;
    opts.expected_sha256 = std::string(64, '0');
    auto added = manager->enqueue(profile, url, opts);
    ASSERT_TRUE(added.ok());

    auto failed = wait_for_status(added.value().id, job_status::failed);
    EXPECT_EQ(failed.last_error, error_kind::integrity);
    EXPECT_NE(failed.last_error_message.find("mismatch"), std::string::npos);
    // Integrity failures are never retried
    EXPECT_EQ(net.fetch_count(url), 1u);
}

TEST_F(manager_test, matching_checksum_completes) {
    const std::string url = "http://example.com/verified.bin";
    serve(url, 300000);
    start_manager();

    enqueue_options opts;
    std::string digest = sha256_of(fake_transport::pattern(300000));
    std::transform(digest.begin(), digest.end(), digest.begin(), ::toupper);
    opts.expected_sha256 = digest;
    auto added = manager->enqueue(profile, url, opts);
    ASSERT_TRUE(added.ok());

    auto done = wait_for_status(added.value().id, job_status::completed);
    EXPECT_EQ(done.last_error, error_kind::none);
}

TEST_F(manager_test, cancel_deletes_the_destination) {
    const std::string url = "http://example.com/unwanted.bin";
    serve(url, 2000000, 3ms, 16 * 1024);
    start_manager();

    auto added = manager->enqueue(profile, url);
    ASSERT_TRUE(added.ok());
    const std::string id = added.value().id;
    ASSERT_TRUE(wait_for_bytes(id, 1));

    ASSERT_TRUE(manager->cancel(profile, id).ok());
    EXPECT_EQ(current(id).status, job_status::cancelled);
    EXPECT_FALSE(fs::exists(added.value().destination_path));

    EXPECT_TRUE(manager->cancel(profile, id).ok());
    EXPECT_EQ(manager->pause(profile, id).kind, error_kind::validation);
    EXPECT_EQ(manager->resume(profile, id).kind, error_kind::validation);
}

TEST_F(manager_test, finished_jobs_cannot_be_cancelled_or_resumed) {
    const std::string url = "http://example.com/done.bin";
    serve(url, 1000);
    start_manager();

    auto added = manager->enqueue(profile, url);
    ASSERT_TRUE(added.ok());
    wait_for_status(added.value().id, job_status::completed);

    EXPECT_EQ(manager->cancel(profile, added.value().id).kind, error_kind::validation);
    EXPECT_EQ(manager->resume(profile, added.value().id).kind, error_kind::validation);
    EXPECT_EQ(manager->set_priority(profile, added.value().id, 3).kind, error_kind::validation);
    EXPECT_TRUE(fs::exists(added.value().destination_path));
}

TEST_F(manager_test, unknown_size_resource_downloads_as_one_stream) {
    const std::string url = "http://example.com/stream.bin";
    fake_transport::resource res;
    res.body = fake_transport::pattern(123457);
    res.report_length = false;
    net.add(url, res);
    start_manager();

    auto added = manager->enqueue(profile, url);
    ASSERT_TRUE(added.ok());
    EXPECT_FALSE(added.value().file_size.has_value());
    ASSERT_EQ(added.value().segments.size(), 1u);
    EXPECT_TRUE(added.value().segments[0].is_open_ended());

    auto done = wait_for_status(added.value().id, job_status::completed);
    ASSERT_TRUE(done.file_size.has_value());
    EXPECT_EQ(*done.file_size, 123457u);
    EXPECT_EQ(done.segments[0].end_byte, 123456u);
    EXPECT_EQ(read_file(done.destination_path), res.body);
}

TEST_F(manager_test, resource_without_ranges_uses_a_single_connection) {
    const std::string url = "http://example.com/norange.bin";
    fake_transport::resource res;
    res.body = fake_transport::pattern(3000000);
    res.accepts_ranges = false;
    net.add(url, res);
    start_manager();

    enqueue_options opts;
    opts.max_connections = 4;
    auto added = manager->enqueue(profile, url, opts);
    ASSERT_TRUE(added.ok());
    EXPECT_FALSE(added.value().accepts_ranges);
    EXPECT_EQ(added.value().segments.size(), 1u);

    auto done = wait_for_status(added.value().id, job_status::completed);
    EXPECT_EQ(read_file(done.destination_path), res.body);
    for (const auto& req : net.requests(url))
        EXPECT_FALSE(req.use_range);
}

TEST_F(manager_test, empty_resource_completes_without_transfers) {
    const std::string url = "http://example.com/empty.txt";
    fake_transport::resource res;
    net.add(url, res);
    start_manager();

    auto added = manager->enqueue(profile, url);
    ASSERT_TRUE(added.ok());
    EXPECT_TRUE(added.value().segments.empty());

    auto done = current(added.value().id);
    EXPECT_EQ(done.status, job_status::completed);
    EXPECT_EQ(net.fetch_count(url), 0u);
    ASSERT_TRUE(fs::exists(done.destination_path));
    EXPECT_EQ(fs::file_size(done.destination_path), 0u);
}

TEST_F(manager_test, clashing_filenames_get_a_suffix) {
    const std::string url = "http://example.com/same.bin";
    serve(url, 50000);
    start_manager();

    auto first = manager->enqueue(profile, url);
    auto second = manager->enqueue(profile, url);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    EXPECT_EQ(first.value().filename, "same.bin");
    EXPECT_NE(second.value().filename, "same.bin");
    EXPECT_EQ(second.value().filename.rfind("same_", 0), 0u);
    EXPECT_EQ(second.value().filename.substr(second.value().filename.size() - 4), ".bin");

    auto a = wait_for_status(first.value().id, job_status::completed);
    auto b = wait_for_status(second.value().id, job_status::completed);
    EXPECT_EQ(read_file(a.destination_path), read_file(b.destination_path));
}

TEST_F(manager_test, back_to_back_clashes_get_distinct_files) {
    const std::string url = "http://example.com/same.bin";
    start_manager(false);

    enqueue_options opts;
    opts.file_size = 1000;
    std::set<std::string> paths;
    for (int i = 0; i < 6; ++i) {
        auto added = manager->enqueue(profile, url, opts);
        ASSERT_TRUE(added.ok()) << added.error().message;
        paths.insert(added.value().destination_path);
    }
    EXPECT_EQ(paths.size(), 6u);
    for (const auto& path : paths)
        EXPECT_TRUE(fs::exists(path)) << path;
}

TEST_F(manager_test, unwritable_destination_leaves_no_profile) {
    const auto blocker = dir.path() / "blocker";
    { std::ofstream(blocker.string()) << "x"; }
    config.download_directory = (blocker / "downloads").string();
    start_manager();

    enqueue_options opts;
    opts.file_size = 1000;
    auto added = manager->enqueue(profile, "http://example.com/a.bin", opts);
    ASSERT_FALSE(added.ok());
    EXPECT_EQ(added.error().kind, error_kind::validation);

    EXPECT_EQ(manager->list(profile).error().kind, error_kind::not_found);
    EXPECT_EQ(manager->flush(profile).kind, error_kind::not_found);
    EXPECT_EQ(storage.write_count(), 0u);
}

TEST_F(manager_test, filename_falls_back_to_content_type) {
    const std::string url = "http://example.com/media/";
    fake_transport::resource res;
    res.body = fake_transport::pattern(1000);
    res.content_type = "video/mp4; codecs=avc1";
    net.add(url, res);
    start_manager();

    auto added = manager->enqueue(profile, url);
    ASSERT_TRUE(added.ok());
    EXPECT_EQ(added.value().filename, "download.mp4");
    EXPECT_EQ(added.value().media, media_type::video);
    EXPECT_EQ(added.value().content_type, "video/mp4");

    enqueue_options opts;
    opts.filename = "clip";
    auto named = manager->enqueue(profile, url, opts);
    ASSERT_TRUE(named.ok());
    EXPECT_EQ(named.value().filename, "clip.mp4");
}

TEST_F(manager_test, invalid_requests_are_rejected) {
    serve("http://example.com/ok.bin", 10);
    start_manager();
    const std::string url = "http://example.com/ok.bin";

    EXPECT_EQ(manager->enqueue("bad profile", url).error().kind, error_kind::validation);
    EXPECT_EQ(manager->enqueue("", url).error().kind, error_kind::validation);
    EXPECT_EQ(manager->enqueue(profile, "ftp://example.com/x").error().kind,
              error_kind::validation);
    EXPECT_EQ(manager->enqueue(profile, "not a url").error().kind, error_kind::validation);

    enqueue_options negative;
    negative.priority = -1;
    EXPECT_EQ(manager->enqueue(profile, url, negative).error().kind, error_kind::validation);

    enqueue_options zero;
    zero.max_connections = 0;
    EXPECT_EQ(manager->enqueue(profile, url, zero).error().kind, error_kind::validation);

    enqueue_options bad_sha;
    bad_sha.expected_sha256 = "abc";
    EXPECT_EQ(manager->enqueue(profile, url, bad_sha).error().kind, error_kind::validation);

    enqueue_options bad_header;
    bad_header.headers["X-Evil"] = "a\r\nInjected: yes";
    EXPECT_EQ(manager->enqueue(profile, url, bad_header).error().kind, error_kind::validation);

    enqueue_options bad_name;
    bad_name.filename = "../escape";
    EXPECT_EQ(manager->enqueue(profile, url, bad_name).error().kind, error_kind::validation);

    EXPECT_EQ(manager->list("nobody").error().kind, error_kind::not_found);
    EXPECT_EQ(manager->pause("nobody", "x").kind, error_kind::not_found);
    EXPECT_TRUE(manager->set_bandwidth_limit(profile, 0).ok());
    EXPECT_EQ(manager->get(profile, "missing").error().kind, error_kind::not_found);
    EXPECT_EQ(manager->cancel(profile, "missing").kind, error_kind::not_found);
    EXPECT_EQ(manager->set_priority(profile, "missing", -2).kind, error_kind::validation);
}

TEST_F(manager_test, drm_protected_content_is_refused) {
    const std::string url = "http://example.com/widevine/movie.mp4";
    serve(url, 1000);
    start_manager();

    auto added = manager->enqueue(profile, url);
    ASSERT_FALSE(added.ok());
    EXPECT_EQ(added.error().kind, error_kind::validation);
}

TEST_F(manager_test, failed_probe_falls_back_to_unknown_size) {
    const std::string url = "http://example.com/missing.bin";
    start_manager();

    enqueue_options opts;
    opts.max_connections = 4;
    auto added = manager->enqueue(profile, url, opts);
    ASSERT_TRUE(added.ok());
    EXPECT_FALSE(added.value().file_size.has_value());
    EXPECT_EQ(added.value().segments.size(), 1u);

    auto failed = wait_for_status(added.value().id, job_status::failed);
    EXPECT_EQ(failed.last_error, error_kind::transport);
}

TEST_F(manager_test, presupplied_size_skips_the_probe) {
    const std::string url = "http://example.com/known.bin";
    serve(url, 2000000);
    start_manager();

    enqueue_options opts;
    opts.file_size = 2000000;
    opts.max_connections = 2;
    auto added = manager->enqueue(profile, url, opts);
    ASSERT_TRUE(added.ok());
    EXPECT_EQ(net.probe_count(url), 0u);
    EXPECT_EQ(added.value().segments.size(), 2u);
    wait_for_status(added.value().id, job_status::completed);
}

TEST_F(manager_test, observers_see_the_lifecycle) {
    const std::string url = "http://example.com/watched.bin";
    serve(url, 500000, 1ms, 16 * 1024);
    start_manager();

    std::mutex mutex;
    std::vector<job_event> events;
    auto subscription = manager->subscribe([&](const job_event& e) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(e);
    });

    enqueue_options opts;
    opts.max_connections = 1;
    auto added = manager->enqueue(profile, url, opts);
    ASSERT_TRUE(added.ok());
    wait_for_status(added.value().id, job_status::completed);
    // The final status event is delivered after the state change becomes visible
    ASSERT_TRUE(wait_until([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return std::any_of(events.begin(), events.end(), [](const job_event& e) {
            return e.kind == job_event_kind::status && e.status == job_status::completed;
        });
    }));

    {
        std::lock_guard<std::mutex> lock(mutex);
        bool saw_added = false;
        bool saw_progress = false;
        std::vector<job_status> statuses;
        for (const auto& e : events) {
            EXPECT_EQ(e.job_id, added.value().id);
            EXPECT_EQ(e.profile_id, profile);
            saw_added = saw_added || e.kind == job_event_kind::added;
            saw_progress = saw_progress || e.kind == job_event_kind::progress;
            if (e.kind == job_event_kind::status)
                statuses.push_back(e.status);
        }
        EXPECT_TRUE(saw_added);
        EXPECT_TRUE(saw_progress);
        ASSERT_FALSE(statuses.empty());
        EXPECT_EQ(statuses.back(), job_status::completed);
    }

    manager->unsubscribe(subscription);
    std::size_t seen = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        seen = events.size();
    }
    auto other = manager->enqueue(profile, url, opts);
    ASSERT_TRUE(other.ok());
    wait_for_status(other.value().id, job_status::completed);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(events.size(), seen);
}

TEST_F(manager_test, list_is_newest_first_and_stats_add_up) {
    serve("http://example.com/a.bin", 1000);
    serve("http://example.com/b.bin", 1000);
    serve("http://example.com/c.bin", 1000);
    start_manager();

    auto a = manager->enqueue(profile, "http://example.com/a.bin");
    ASSERT_TRUE(a.ok());
    wait_for_status(a.value().id, job_status::completed);
    std::this_thread::sleep_for(5ms);
    auto b = manager->enqueue(profile, "http://example.com/b.bin");
    ASSERT_TRUE(b.ok());
    wait_for_status(b.value().id, job_status::completed);
    std::this_thread::sleep_for(5ms);

    enqueue_options later;
    later.scheduled_at = wall_clock::now() + 1h;
    auto c = manager->enqueue(profile, "http://example.com/c.bin", later);
    ASSERT_TRUE(c.ok());

    auto jobs = manager->list(profile);
    ASSERT_TRUE(jobs.ok());
    ASSERT_EQ(jobs.value().size(), 3u);
    EXPECT_EQ(jobs.value()[0].id, c.value().id);
    EXPECT_EQ(jobs.value()[1].id, b.value().id);
    EXPECT_EQ(jobs.value()[2].id, a.value().id);

    auto s = manager->stats(profile);
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(s.value().total, 3u);
    EXPECT_EQ(s.value().completed, 2u);
    EXPECT_EQ(s.value().scheduled, 1u);
    EXPECT_EQ(s.value().bytes_downloaded, 2000u);
}

TEST_F(manager_test, query_filters_and_pages) {
    start_manager(false);

    std::vector<std::string> ids;
    for (const char* name : {"Report.pdf", "movie.mp4", "report-2.pdf", "song.mp3"}) {
        enqueue_options opts;
        opts.file_size = 100;
        opts.filename = name;
        opts.scheduled_at = wall_clock::now() + 1h;
        auto added = manager->enqueue(profile, "http://example.com/files/" + std::string(name),
                                      opts);
        ASSERT_TRUE(added.ok()) << added.error().message;
        ids.push_back(added.value().id);
        std::this_thread::sleep_for(2ms);
    }
    enqueue_options now_opts;
    now_opts.file_size = 100;
    auto queued = manager->enqueue(profile, "http://example.com/files/notes.txt", now_opts);
    ASSERT_TRUE(queued.ok());

    job_query reports;
    reports.text = "REPORT";
    auto page = manager->query(profile, reports);
    ASSERT_TRUE(page.ok());
    EXPECT_EQ(page.value().total, 2u);
    ASSERT_EQ(page.value().jobs.size(), 2u);
    EXPECT_EQ(page.value().jobs[0].id, ids[2]);
    EXPECT_EQ(page.value().jobs[1].id, ids[0]);

    job_query by_status;
    by_status.status = job_status::queued;
    page = manager->query(profile, by_status);
    ASSERT_TRUE(page.ok());
    ASSERT_EQ(page.value().jobs.size(), 1u);
    EXPECT_EQ(page.value().jobs[0].id, queued.value().id);

    job_query paged;
    paged.status = job_status::scheduled;
    paged.offset = 1;
    paged.limit = 2;
    page = manager->query(profile, paged);
    ASSERT_TRUE(page.ok());
    EXPECT_EQ(page.value().total, 4u);
    ASSERT_EQ(page.value().jobs.size(), 2u);
    EXPECT_EQ(page.value().jobs[0].id, ids[2]);
    EXPECT_EQ(page.value().jobs[1].id, ids[1]);

    EXPECT_EQ(manager->query("nobody", job_query()).error().kind, error_kind::not_found);
}

TEST_F(manager_test, remove_and_clear_history) {
    serve("http://example.com/a.bin", 1000);
    serve("http://example.com/b.bin", 1000);
    start_manager();

    auto a = manager->enqueue(profile, "http://example.com/a.bin");
    auto b = manager->enqueue(profile, "http://example.com/b.bin");
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    wait_for_status(a.value().id, job_status::completed);
    wait_for_status(b.value().id, job_status::completed);

    ASSERT_TRUE(manager->remove(profile, a.value().id).ok());
    EXPECT_EQ(manager->get(profile, a.value().id).error().kind, error_kind::not_found);
    EXPECT_EQ(manager->remove(profile, a.value().id).kind, error_kind::not_found);

    ASSERT_TRUE(manager->clear_history(profile).ok());
    auto jobs = manager->list(profile);
    ASSERT_TRUE(jobs.ok());
    EXPECT_TRUE(jobs.value().empty());

    auto snapshot = job_store(storage).load(profile);
    EXPECT_TRUE(snapshot.closed.empty());
    EXPECT_TRUE(snapshot.active.empty());
}

TEST_F(manager_test, priority_updates_are_persisted) {
    serve("http://example.com/p.bin", 1000);
    start_manager();

    enqueue_options later;
    later.scheduled_at = wall_clock::now() + 1h;
    auto added = manager->enqueue(profile, "http://example.com/p.bin", later);
    ASSERT_TRUE(added.ok());

    ASSERT_TRUE(manager->set_priority(profile, added.value().id, 7).ok());
    EXPECT_EQ(current(added.value().id).priority, 7);
    ASSERT_TRUE(manager->flush(profile).ok());

    auto snapshot = job_store(storage).load(profile);
    ASSERT_EQ(snapshot.active.size(), 1u);
    EXPECT_EQ(snapshot.active[0].priority, 7);
}

TEST_F(manager_test, storage_outage_does_not_stop_downloads) {
    const std::string url = "http://example.com/offline.bin";
    serve(url, 200000);
    start_manager();

    storage.fail_writes(true);
    auto added = manager->enqueue(profile, url);
    ASSERT_TRUE(added.ok());
    wait_for_status(added.value().id, job_status::completed);

    auto flushed = manager->flush(profile);
    EXPECT_EQ(flushed.kind, error_kind::persistence);

    storage.fail_writes(false);
    EXPECT_TRUE(manager->flush(profile).ok());
    auto snapshot = job_store(storage).load(profile);
    ASSERT_EQ(snapshot.closed.size(), 1u);
    EXPECT_EQ(snapshot.closed[0].id, added.value().id);
    EXPECT_EQ(snapshot.closed[0].status, job_status::completed);
    EXPECT_TRUE(snapshot.active.empty());
}

TEST_F(manager_test, closed_history_is_bounded) {
    config.closed_history_limit = 2;
    for (int i = 0; i < 3; ++i)
        serve("http://example.com/h" + std::to_string(i) + ".bin", 100);
    start_manager();

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        auto added = manager->enqueue(profile, "http://example.com/h" + std::to_string(i) + ".bin");
        ASSERT_TRUE(added.ok());
        wait_for_status(added.value().id, job_status::completed);
        ids.push_back(added.value().id);
    }

    auto jobs = manager->list(profile);
    ASSERT_TRUE(jobs.ok());
    EXPECT_EQ(jobs.value().size(), 2u);
    EXPECT_EQ(manager->get(profile, ids[0]).error().kind, error_kind::not_found);
}

TEST_F(manager_test, detect_lists_hls_variants) {
    const std::string url = "http://cdn.example.com/live/master.m3u8";
    fake_transport::resource res;
    res.content_type = "application/vnd.apple.mpegurl";
    res.body = "#EXTM3U\n"
               "#EXT-X-STREAM-INF:BANDWIDTH=800000,RESOLUTION=640x360,CODECS=\"avc1.4d401e,mp4a.40.2\"\n"
               "low/index.m3u8\n"
               "#EXT-X-STREAM-INF:BANDWIDTH=2400000,RESOLUTION=1280x720\n"
               "/hd/index.m3u8\n";
    net.add(url, res);
    start_manager();

    auto detected = manager->detect(url);
    ASSERT_TRUE(detected.ok()) << detected.error().message;
    const auto& r = detected.value();
    EXPECT_EQ(r.type, media_type::hls);
    EXPECT_TRUE(r.streamable);
    EXPECT_FALSE(r.drm_protected);
    ASSERT_EQ(r.qualities.size(), 2u);
    EXPECT_EQ(r.qualities[0].bitrate, 800000u);
    EXPECT_EQ(r.qualities[0].resolution, "640x360");
    EXPECT_EQ(r.qualities[0].codec, "avc1.4d401e,mp4a.40.2");
    EXPECT_EQ(r.qualities[0].url, "http://cdn.example.com/live/low/index.m3u8");
    EXPECT_EQ(r.qualities[1].url, "http://cdn.example.com/hd/index.m3u8");

    EXPECT_EQ(manager->detect("http://example.com/nothing").error().kind, error_kind::transport);
    EXPECT_EQ(manager->detect("nope").error().kind, error_kind::validation);
}
