#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <vector>

#include "storage/secure_storage.hpp"

// Process-local storage. Survives a download_manager being destroyed and rebuilt,
// which is what restart tests need.
class memory_storage : public secure_storage {
public:
    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value, std::string& out_error) override;
    bool remove(const std::string& key, std::string& out_error) override;

    // While set, every write fails as an unavailable backend would.
    void fail_writes(bool fail) {
        m_fail_writes.store(fail);
    }

    std::vector<std::string> keys() const;
    std::size_t write_count() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_values;
    std::size_t m_writes = 0;
    std::atomic<bool> m_fail_writes{false};
};
