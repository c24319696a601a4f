#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace protocol {

// Declared properties of a file the peer wants to upload
struct FileInfo {
    std::string filename;
    uint64_t size;
    std::string checksum; // hex SHA-256
};

// Map JSON parsing automatically using nlohmann
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileInfo, filename, size, checksum)

} // namespace protocol
