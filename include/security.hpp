#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <sodium.h>

namespace security {

// Initializes libsodium once. Throws std::runtime_error if it cannot.
void ensure_initialized();

// Incremental SHA-256 over libsodium's crypto_hash_sha256 state
class Sha256 {
public:
    Sha256();
    void update(const void* data, std::size_t size);
    // Lowercase hex digest. The object must not be updated afterwards.
    std::string finish();

private:
    crypto_hash_sha256_state state_;
    bool finished_ = false;
};

std::string sha256_hex(const std::string& data);

// Digest of a file's contents, or nullopt if it cannot be read
std::optional<std::string> sha256_file(const std::string& filepath);

std::string to_hex(const unsigned char* data, std::size_t size);

// Constant-time, case-insensitive comparison of two hex digests
bool digest_equals(const std::string& a, const std::string& b);

// Reduces a peer-supplied filename to a bare file name that cannot escape
// the destination directory. Returns nullopt if nothing usable remains.
std::optional<std::string> sanitize_filename(const std::string& name);

} // namespace security
