#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// The single on-disk file of a job. Segments write into it at their own offsets
// with pwrite, so concurrent writers never share a file position.
class destination_file {
public:
    destination_file() = default;
    ~destination_file();

    destination_file(const destination_file&) = delete;
    destination_file& operator=(const destination_file&) = delete;

    // Opens (creating parent directories and the file when needed) without
    // truncating existing content. When `size` is known the file is resized to it.
    bool open(const std::string& path, std::optional<std::uint64_t> size, std::string& out_error);
    void close();
    bool is_open() const {
        return m_fd >= 0;
    }

    bool write_at(std::uint64_t offset, const char* data, std::size_t size,
                  std::string& out_error);
    // Reads up to `size` bytes; returns the number read or -1.
    long long read_at(std::uint64_t offset, char* data, std::size_t size) const;

    bool truncate(std::uint64_t size, std::string& out_error);
    bool sync(std::string& out_error);

    const std::string& path() const {
        return m_path;
    }

    // Size on disk, nullopt if the file does not exist.
    static std::optional<std::uint64_t> size_on_disk(const std::string& path);
    static bool remove(const std::string& path);

private:
    int m_fd = -1;
    std::string m_path;
};
