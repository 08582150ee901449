#include "storage/memory_storage.hpp"

std::optional<std::string> memory_storage::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_values.find(key);
    if (it == m_values.end())
        return std::nullopt;
    return it->second;
}

bool memory_storage::set(const std::string& key, const std::string& value,
                         std::string& out_error) {
    if (m_fail_writes.load()) {
        out_error = "storage unavailable";
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values[key] = value;
    ++m_writes;
    return true;
}

bool memory_storage::remove(const std::string& key, std::string& out_error) {
    if (m_fail_writes.load()) {
        out_error = "storage unavailable";
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values.erase(key);
    return true;
}

std::vector<std::string> memory_storage::keys() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    for (const auto& entry : m_values)
        out.push_back(entry.first);
    return out;
}

std::size_t memory_storage::write_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_writes;
}
