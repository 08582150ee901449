#include "core/destination_file.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
std::string errno_message(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}
} // namespace

destination_file::~destination_file() {
    close();
}

bool destination_file::open(const std::string& path, std::optional<std::uint64_t> size,
                            std::string& out_error) {
    close();

    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            out_error = "cannot create " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        out_error = errno_message("cannot open", path);
        return false;
    }
    m_fd = fd;
    m_path = path;

    if (size && !truncate(*size, out_error)) {
        close();
        return false;
    }
    return true;
}

void destination_file::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

bool destination_file::write_at(std::uint64_t offset, const char* data, std::size_t size,
                                std::string& out_error) {
    while (size > 0) {
        ssize_t written = ::pwrite(m_fd, data, size, static_cast<off_t>(offset));
        if (written < 0) {
            if (errno == EINTR)
                continue;
            out_error = errno_message("write failed on", m_path);
            return false;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
        offset += static_cast<std::uint64_t>(written);
    }
    return true;
}

long long destination_file::read_at(std::uint64_t offset, char* data, std::size_t size) const {
    for (;;) {
        ssize_t n = ::pread(m_fd, data, size, static_cast<off_t>(offset));
        if (n < 0 && errno == EINTR)
            continue;
        return static_cast<long long>(n);
    }
}

bool destination_file::truncate(std::uint64_t size, std::string& out_error) {
    if (::ftruncate(m_fd, static_cast<off_t>(size)) != 0) {
        out_error = errno_message("cannot resize", m_path);
        return false;
    }
    return true;
}

bool destination_file::sync(std::string& out_error) {
    if (::fsync(m_fd) != 0) {
        out_error = errno_message("fsync failed on", m_path);
        return false;
    }
    return true;
}

std::optional<std::uint64_t> destination_file::size_on_disk(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0)
        return std::nullopt;
    return static_cast<std::uint64_t>(st.st_size);
}

bool destination_file::remove(const std::string& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        std::cerr << "[destination_file] " << errno_message("cannot delete", path) << std::endl;
        return false;
    }
    return true;
}
