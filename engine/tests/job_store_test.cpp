#include <gtest/gtest.h>

#include "storage/job_store.hpp"
#include "storage/memory_storage.hpp"

namespace {
job make_job(const std::string& id, job_status status) {
    job j;
    j.id = id;
    j.profile_id = "p1";
    j.url = "https://example.com/" + id;
    j.filename = id;
    j.status = status;
    j.file_size = 10;
    segment s;
    s.id = "0";
    s.end_byte = 9;
    j.segments = {s};
    return j;
}
} // namespace

TEST(job_store, keys_are_scoped_by_profile) {
    EXPECT_EQ(job_store::active_key("p1"), "downloads/p1/active");
    EXPECT_EQ(job_store::job_key("p1", "j"), "downloads/p1/jobs/j");
    EXPECT_EQ(job_store::closed_key("p1"), "downloads/p1/closed");
    EXPECT_EQ(job_store::settings_key("p1"), "downloads/p1/settings");
}

TEST(job_store, saves_and_loads_a_profile) {
    memory_storage storage;
    job_store store(storage);
    std::string error;

    ASSERT_TRUE(store.save_job(make_job("a", job_status::paused), error)) << error;
    ASSERT_TRUE(store.save_job(make_job("b", job_status::queued), error)) << error;
    ASSERT_TRUE(store.save_active_index("p1", {"a", "b"}, error)) << error;
    ASSERT_TRUE(store.save_closed("p1", {make_job("c", job_status::completed)}, error));
    ASSERT_TRUE(store.save_settings("p1", 4096, error));

    auto snapshot = store.load("p1");
    ASSERT_EQ(snapshot.active.size(), 2u);
    EXPECT_EQ(snapshot.active[0].id, "a");
    EXPECT_EQ(snapshot.active[0].status, job_status::paused);
    EXPECT_EQ(snapshot.active[1].id, "b");
    ASSERT_EQ(snapshot.closed.size(), 1u);
    EXPECT_EQ(snapshot.closed[0].status, job_status::completed);
    ASSERT_TRUE(snapshot.bandwidth_limit.has_value());
    EXPECT_EQ(*snapshot.bandwidth_limit, 4096u);

    EXPECT_TRUE(store.load("p2").active.empty());
}

TEST(job_store, unreadable_documents_are_skipped) {
    memory_storage storage;
    job_store store(storage);
    std::string error;

    ASSERT_TRUE(store.save_job(make_job("good", job_status::paused), error));
    ASSERT_TRUE(storage.set(job_store::job_key("p1", "broken"), "{not json", error));
    ASSERT_TRUE(storage.set(job_store::job_key("p1", "odd"),
                            R"({"id":"odd","profileId":"p1","url":"u","status":"melted"})",
                            error));
    ASSERT_TRUE(store.save_active_index("p1", {"broken", "missing", "odd", "good"}, error));
    ASSERT_TRUE(storage.set(job_store::settings_key("p1"), "{\"bandwidthLimit\":-5}", error));

    auto snapshot = store.load("p1");
    ASSERT_EQ(snapshot.active.size(), 1u);
    EXPECT_EQ(snapshot.active[0].id, "good");
    EXPECT_FALSE(snapshot.bandwidth_limit.has_value());
}

TEST(job_store, removal_drops_the_document) {
    memory_storage storage;
    job_store store(storage);
    std::string error;

    ASSERT_TRUE(store.save_job(make_job("a", job_status::paused), error));
    ASSERT_TRUE(store.remove_job("p1", "a", error));
    EXPECT_FALSE(storage.get(job_store::job_key("p1", "a")).has_value());
}

TEST(job_store, write_failures_are_reported) {
    memory_storage storage;
    job_store store(storage);
    std::string error;

    storage.fail_writes(true);
    EXPECT_FALSE(store.save_job(make_job("a", job_status::queued), error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(store.save_settings("p1", 1, error));
    EXPECT_FALSE(store.remove_job("p1", "a", error));
    EXPECT_EQ(storage.write_count(), 0u);
}
