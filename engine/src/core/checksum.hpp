#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <openssl/evp.h>

#include "core/destination_file.hpp"

// Incremental SHA-256 over OpenSSL's EVP interface.
class sha256_hasher {
public:
    sha256_hasher();
    ~sha256_hasher();

    sha256_hasher(const sha256_hasher&) = delete;
    sha256_hasher& operator=(const sha256_hasher&) = delete;

    bool ok() const {
        return m_ctx != nullptr;
    }
    bool update(const void* data, std::size_t size);
    // Lowercase hex digest, empty on failure. The hasher is spent afterwards.
    std::string finish();

private:
    EVP_MD_CTX* m_ctx;
};

namespace checksum {

// Digest of `length` bytes of `file` starting at `offset`.
bool sha256_range(const destination_file& file, std::uint64_t offset, std::uint64_t length,
                  std::string& out_hex, std::string& out_error);

// Digest of a whole file on disk.
bool sha256_file(const std::string& path, std::string& out_hex, std::string& out_error);

// 64 hex digits, either case.
bool is_sha256_hex(const std::string& value);

// Case-insensitive digest comparison.
bool matches(const std::string& expected, const std::string& actual);

} // namespace checksum
