#pragma once

#include <optional>
#include <string>

// Durable key/value store the engine persists into. Keys are '/'-separated and
// scoped by profile. Implementations must allow concurrent callers; the last write
// to a key wins.
class secure_storage {
public:
    virtual ~secure_storage() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual bool set(const std::string& key, const std::string& value,
                     std::string& out_error) = 0;
    // Removing an absent key succeeds.
    virtual bool remove(const std::string& key, std::string& out_error) = 0;
};
