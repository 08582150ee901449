#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/job.hpp"
#include "storage/secure_storage.hpp"

// Everything persisted for one profile.
struct profile_snapshot {
    std::vector<job> active;
    std::vector<job> closed; // oldest first
    std::optional<std::uint64_t> bandwidth_limit;
};

// Translates jobs to and from JSON documents in a secure_storage:
//   downloads/<profile>/active      array of active job ids
//   downloads/<profile>/jobs/<id>   one job document
//   downloads/<profile>/closed      array of closed job documents
//   downloads/<profile>/settings    {"bandwidthLimit": N}
class job_store {
public:
    explicit job_store(secure_storage& storage) : m_storage(storage) {}

    // Unreadable documents are logged and skipped.
    profile_snapshot load(const std::string& profile_id);

    bool save_job(const job& j, std::string& out_error);
    bool remove_job(const std::string& profile_id, const std::string& job_id,
                    std::string& out_error);
    bool save_active_index(const std::string& profile_id, const std::vector<std::string>& ids,
                           std::string& out_error);
    bool save_closed(const std::string& profile_id, const std::vector<job>& closed,
                     std::string& out_error);
    bool save_settings(const std::string& profile_id, std::uint64_t bandwidth_limit,
                       std::string& out_error);

    static std::string active_key(const std::string& profile_id);
    static std::string job_key(const std::string& profile_id, const std::string& job_id);
    static std::string closed_key(const std::string& profile_id);
    static std::string settings_key(const std::string& profile_id);

private:
    std::optional<nlohmann::json> read_json(const std::string& key);

    secure_storage& m_storage;
};
