#include "core/checksum.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>
#include <openssl/sha.h>

#include "util/url.hpp"

namespace {
constexpr std::size_t BUFFER_SIZE = 64 * 1024;
}

sha256_hasher::sha256_hasher() : m_ctx(EVP_MD_CTX_new()) {
    if (m_ctx && EVP_DigestInit_ex(m_ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(m_ctx);
        m_ctx = nullptr;
    }
}

sha256_hasher::~sha256_hasher() {
    if (m_ctx)
        EVP_MD_CTX_free(m_ctx);
}

bool sha256_hasher::update(const void* data, std::size_t size) {
    return m_ctx && EVP_DigestUpdate(m_ctx, data, size) == 1;
}

std::string sha256_hasher::finish() {
    if (!m_ctx)
        return "";

    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hash_len = 0;
    bool ok = EVP_DigestFinal_ex(m_ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(m_ctx);
    m_ctx = nullptr;
    if (!ok)
        return "";

    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; i++) {
        hex.push_back(digits[hash[i] >> 4]);
        hex.push_back(digits[hash[i] & 0x0f]);
    }
    return hex;
}

namespace checksum {

bool sha256_range(const destination_file& file, std::uint64_t offset, std::uint64_t length,
                  std::string& out_hex, std::string& out_error) {
    sha256_hasher hasher;
    if (!hasher.ok()) {
        out_error = "cannot initialise sha-256 context";
        return false;
    }

    std::vector<char> buffer(BUFFER_SIZE);
    while (length > 0) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(length, BUFFER_SIZE));
        long long n = file.read_at(offset, buffer.data(), want);
        if (n <= 0) {
            out_error = "short read while hashing " + file.path();
            return false;
        }
        if (!hasher.update(buffer.data(), static_cast<std::size_t>(n))) {
            out_error = "sha-256 update failed";
            return false;
        }
        offset += static_cast<std::uint64_t>(n);
        length -= static_cast<std::uint64_t>(n);
    }

    out_hex = hasher.finish();
    if (out_hex.empty()) {
        out_error = "sha-256 finalisation failed";
        return false;
    }
    return true;
}

bool sha256_file(const std::string& path, std::string& out_hex, std::string& out_error) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        out_error = "cannot open " + path;
        return false;
    }

    sha256_hasher hasher;
    if (!hasher.ok()) {
        out_error = "cannot initialise sha-256 context";
        return false;
    }

    std::vector<char> buffer(BUFFER_SIZE);
    while (in) {
        in.read(buffer.data(), BUFFER_SIZE);
        std::streamsize n = in.gcount();
        if (n > 0 && !hasher.update(buffer.data(), static_cast<std::size_t>(n))) {
            out_error = "sha-256 update failed";
            return false;
        }
    }
    if (in.bad()) {
        out_error = "read error on " + path;
        return false;
    }

    out_hex = hasher.finish();
    if (out_hex.empty()) {
        out_error = "sha-256 finalisation failed";
        return false;
    }
    return true;
}

bool is_sha256_hex(const std::string& value) {
    return value.size() == 64 && std::all_of(value.begin(), value.end(), [](unsigned char c) {
               return std::isxdigit(c) != 0;
           });
}

bool matches(const std::string& expected, const std::string& actual) {
    return url_utils::to_lower(expected) == url_utils::to_lower(actual);
}

} // namespace checksum
