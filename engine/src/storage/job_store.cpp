#include "storage/job_store.hpp"

#include <iostream>
#include <stdexcept>

std::string job_store::active_key(const std::string& profile_id) {
    return "downloads/" + profile_id + "/active";
}

std::string job_store::job_key(const std::string& profile_id, const std::string& job_id) {
    return "downloads/" + profile_id + "/jobs/" + job_id;
}

std::string job_store::closed_key(const std::string& profile_id) {
    return "downloads/" + profile_id + "/closed";
}

std::string job_store::settings_key(const std::string& profile_id) {
    return "downloads/" + profile_id + "/settings";
}

std::optional<nlohmann::json> job_store::read_json(const std::string& key) {
    auto raw = m_storage.get(key);
    if (!raw)
        return std::nullopt;
    try {
        return nlohmann::json::parse(*raw);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[job_store] Ignoring unreadable " << key << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

profile_snapshot job_store::load(const std::string& profile_id) {
    profile_snapshot snapshot;

    auto index = read_json(active_key(profile_id));
    if (index && index->is_array()) {
        for (const auto& id : *index) {
            if (!id.is_string())
                continue;
            auto key = job_key(profile_id, id.get<std::string>());
            auto doc = read_json(key);
            if (!doc) {
                std::cerr << "[job_store] Active job " << id.get<std::string>()
                          << " has no document, skipping" << std::endl;
                continue;
            }
            try {
                snapshot.active.push_back(doc->get<job>());
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[job_store] Ignoring malformed " << key << ": " << e.what()
                          << std::endl;
            } catch (const std::invalid_argument& e) {
                std::cerr << "[job_store] Ignoring malformed " << key << ": " << e.what()
                          << std::endl;
            }
        }
    }

    auto closed = read_json(closed_key(profile_id));
    if (closed && closed->is_array()) {
        for (const auto& doc : *closed) {
            try {
                snapshot.closed.push_back(doc.get<job>());
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[job_store] Ignoring malformed closed entry: " << e.what()
                          << std::endl;
            } catch (const std::invalid_argument& e) {
                std::cerr << "[job_store] Ignoring malformed closed entry: " << e.what()
                          << std::endl;
            }
        }
    }

    auto settings = read_json(settings_key(profile_id));
    if (settings && settings->is_object()) {
        auto it = settings->find("bandwidthLimit");
        if (it != settings->end() && it->is_number_unsigned())
            snapshot.bandwidth_limit = it->get<std::uint64_t>();
    }

    std::cout << "[job_store] Loaded profile " << profile_id << ": " << snapshot.active.size()
              << " active, " << snapshot.closed.size() << " closed" << std::endl;
    return snapshot;
}

bool job_store::save_job(const job& j, std::string& out_error) {
    return m_storage.set(job_key(j.profile_id, j.id), nlohmann::json(j).dump(), out_error);
}

bool job_store::remove_job(const std::string& profile_id, const std::string& job_id,
                           std::string& out_error) {
    return m_storage.remove(job_key(profile_id, job_id), out_error);
}

bool job_store::save_active_index(const std::string& profile_id,
                                  const std::vector<std::string>& ids, std::string& out_error) {
    return m_storage.set(active_key(profile_id), nlohmann::json(ids).dump(), out_error);
}

bool job_store::save_closed(const std::string& profile_id, const std::vector<job>& closed,
                            std::string& out_error) {
    return m_storage.set(closed_key(profile_id), nlohmann::json(closed).dump(), out_error);
}

bool job_store::save_settings(const std::string& profile_id, std::uint64_t bandwidth_limit,
                              std::string& out_error) {
    nlohmann::json settings = {{"bandwidthLimit", bandwidth_limit}};
    return m_storage.set(settings_key(profile_id), settings.dump(), out_error);
}
