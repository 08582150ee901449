#include "storage/file_storage.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {
std::string encode_component(const std::string& component) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : component) {
        if (std::isalnum(c) || c == '_' || c == '-' || c == '.') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0f]);
        }
    }
    // "." and ".." must never walk the tree
    if (out == ".")
        return "%2E";
    if (out == "..")
        return "%2E%2E";
    return out.empty() ? "%" : out;
}
} // namespace

file_storage::file_storage(std::string root_directory) : m_root(std::move(root_directory)) {}

std::string file_storage::path_for(const std::string& key) const {
    fs::path path(m_root);
    std::size_t pos = 0;
    for (;;) {
        auto slash = key.find('/', pos);
        std::string component = key.substr(pos, slash == std::string::npos ? slash : slash - pos);
        path /= encode_component(component);
        if (slash == std::string::npos)
            break;
        pos = slash + 1;
    }
    return path.string() + ".json";
}

std::optional<std::string> file_storage::get(const std::string& key) {
    std::ifstream in(path_for(key), std::ios::binary);
    if (!in.is_open())
        return std::nullopt;
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        std::cerr << "[file_storage] Read error on " << path_for(key) << std::endl;
        return std::nullopt;
    }
    return content.str();
}

bool file_storage::set(const std::string& key, const std::string& value,
                       std::string& out_error) {
    std::string path = path_for(key);
    std::string temp_path = path + ".tmp";

    std::lock_guard<std::mutex> lock(m_write_mutex);
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        out_error = "cannot create directory for " + path + ": " + ec.message();
        return false;
    }

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            out_error = "cannot open " + temp_path + " for writing";
            return false;
        }
        out.write(value.data(), static_cast<std::streamsize>(value.size()));
        out.flush();
        if (!out) {
            out_error = "write failed on " + temp_path;
            return false;
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        out_error = "cannot move " + temp_path + " into place: " + ec.message();
        fs::remove(temp_path, ec);
        return false;
    }
    return true;
}

bool file_storage::remove(const std::string& key, std::string& out_error) {
    std::lock_guard<std::mutex> lock(m_write_mutex);
    std::error_code ec;
    fs::remove(path_for(key), ec);
    if (ec) {
        out_error = "cannot remove " + path_for(key) + ": " + ec.message();
        return false;
    }
    return true;
}
