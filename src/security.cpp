#include "security.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <vector>
#include <stdexcept>
#include <cctype>

namespace security {

void ensure_initialized() {
    // sodium_init() is idempotent: 0 on first success, 1 when already done
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

Sha256::Sha256() {
    ensure_initialized();
    crypto_hash_sha256_init(&state_);
}

void Sha256::update(const void* data, std::size_t size) {
    if (finished_) {
        throw std::logic_error("Sha256::update after finish");
    }
    crypto_hash_sha256_update(&state_, static_cast<const unsigned char*>(data), size);
}

std::string Sha256::finish() {
    if (finished_) {
        throw std::logic_error("Sha256::finish called twice");
    }
    unsigned char hash[crypto_hash_sha256_BYTES]; // 32 bytes
    crypto_hash_sha256_final(&state_, hash);
    finished_ = true;
    return to_hex(hash, sizeof(hash));
}

std::string sha256_hex(const std::string& data) {
    Sha256 hasher;
    hasher.update(data.data(), data.size());
    return hasher.finish();
}

std::optional<std::string> sha256_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Sha256 hasher;
    std::vector<char> buffer(64 * 1024);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        hasher.update(buffer.data(), static_cast<std::size_t>(file.gcount()));
    }
    if (file.bad()) {
        return std::nullopt;
    }
    return hasher.finish();
}

std::string to_hex(const unsigned char* data, std::size_t size) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

bool digest_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    std::string la(a.size(), '\0');
    std::string lb(b.size(), '\0');
    for (std::size_t i = 0; i < a.size(); ++i) {
        la[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(a[i])));
        lb[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(b[i])));
    }
    return sodium_memcmp(la.data(), lb.data(), la.size()) == 0;
}

std::optional<std::string> sanitize_filename(const std::string& name) {
    // Keep only the last component, whichever separator the peer used
    std::size_t cut = name.find_last_of("/\\");
    std::string base = (cut == std::string::npos) ? name : name.substr(cut + 1);

    std::string clean;
    clean.reserve(base.size());
    for (char c : base) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f || c == ':') {
            continue;
        }
        clean.push_back(c);
    }

    // Trailing dots and spaces are dropped, which also turns "." and ".." into ""
    while (!clean.empty() && (clean.back() == '.' || clean.back() == ' ')) {
        clean.pop_back();
    }
    while (!clean.empty() && clean.front() == ' ') {
        clean.erase(clean.begin());
    }

    if (clean.empty()) {
        return std::nullopt;
    }
    return clean;
}

} // namespace security
