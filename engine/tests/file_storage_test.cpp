#include <gtest/gtest.h>

#include <filesystem>

#include "storage/file_storage.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

TEST(file_storage, set_get_remove) {
    temp_dir dir;
    file_storage storage(dir.path().string());
    std::string error;

    EXPECT_FALSE(storage.get("downloads/p1/active").has_value());
    ASSERT_TRUE(storage.set("downloads/p1/active", "[\"a\"]", error)) << error;
    EXPECT_EQ(storage.get("downloads/p1/active").value_or(""), "[\"a\"]");

    ASSERT_TRUE(storage.set("downloads/p1/active", "[]", error)) << error;
    EXPECT_EQ(storage.get("downloads/p1/active").value_or(""), "[]");
    EXPECT_FALSE(fs::exists(storage.path_for("downloads/p1/active") + ".tmp"));

    ASSERT_TRUE(storage.remove("downloads/p1/active", error)) << error;
    EXPECT_FALSE(storage.get("downloads/p1/active").has_value());
    EXPECT_TRUE(storage.remove("downloads/p1/active", error));
}

TEST(file_storage, keys_map_to_nested_files) {
    temp_dir dir;
    file_storage storage(dir.path().string());

    auto path = fs::path(storage.path_for("downloads/p1/jobs/abc-1"));
    EXPECT_EQ(path.filename().string(), "abc-1.json");
    EXPECT_EQ(path.parent_path().string(),
              (dir.path() / "downloads" / "p1" / "jobs").string());
}

TEST(file_storage, key_components_cannot_escape_the_root) {
    temp_dir dir;
    file_storage storage(dir.path().string());

    auto dots = fs::path(storage.path_for("downloads/../../etc/passwd"));
    EXPECT_EQ(dots.parent_path().string(),
              (dir.path() / "downloads" / "%2E%2E" / "%2E%2E" / "etc").string());

    auto odd = fs::path(storage.path_for("a b/c:d"));
    EXPECT_EQ(odd.string(), (dir.path() / "a%20b" / "c%3Ad.json").string());

    std::string error;
    ASSERT_TRUE(storage.set("downloads/../x", "1", error)) << error;
    EXPECT_EQ(storage.get("downloads/../x").value_or(""), "1");
    EXPECT_FALSE(fs::exists(dir.path().parent_path() / "x.json"));
}

TEST(file_storage, values_survive_a_new_instance) {
    temp_dir dir;
    std::string error;
    {
        file_storage storage(dir.path().string());
        ASSERT_TRUE(storage.set("downloads/p/settings", "{\"bandwidthLimit\":5}", error));
    }
    file_storage reopened(dir.path().string());
    EXPECT_EQ(reopened.get("downloads/p/settings").value_or(""), "{\"bandwidthLimit\":5}");
}
