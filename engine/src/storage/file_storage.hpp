#pragma once

#include <mutex>
#include <string>

#include "storage/secure_storage.hpp"

// One file per key under a root directory. The key's '/' separators become
// directories; any other byte outside [A-Za-z0-9._-] is percent-encoded. Writes go
// to a temporary file that is renamed over the old one.
class file_storage : public secure_storage {
public:
    explicit file_storage(std::string root_directory);

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value, std::string& out_error) override;
    bool remove(const std::string& key, std::string& out_error) override;

    std::string path_for(const std::string& key) const;

private:
    std::string m_root;
    std::mutex m_write_mutex;
};
