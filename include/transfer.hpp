#pragma once

#include <string>
#include <chrono>
#include <filesystem>
#include <functional>
#include <boost/asio.hpp>
#include "protocol/file_meta.hpp"

namespace transfer {

// Progress callback: filename, bytes_transferred, bytes_total, speed_mbps
using TransferProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t, double)>;

enum class TransferState {
    COMPLETED, // every declared byte arrived
    SHORT,     // peer closed (or went silent) early; the partial file is kept
    REJECTED,  // filename unusable, nothing was acknowledged
    FAILED     // destination could not be opened or written
};

struct TransferSession {
    std::string filename;       // sanitized
    uint64_t declared_size = 0;
    std::string declared_checksum;
    uint64_t bytes_received = 0;
    std::string computed_checksum;
};

struct TransferResult {
    TransferState state = TransferState::FAILED;
    bool checksum_ok = false;
    TransferSession session;
    std::filesystem::path path;
    const char* response = nullptr; // final token sent to the peer, if any
};

struct ReceiveOptions {
    std::size_t chunk_size = 4096;
    std::chrono::milliseconds read_timeout{0}; // 0 waits forever
};

struct HeaderRead {
    std::string text;
    bool overflow = false;  // hit the size cap before a newline
    bool delimited = false; // ended with '\n'
};

class MessageSender {
public:
    // Writes the bytes as given; returns false if the peer is gone.
    static bool send(boost::asio::ip::tcp::socket& socket, const std::string& message);
    // Streams a file's raw bytes with no framing.
    static bool send_file(boost::asio::ip::tcp::socket& socket, const std::string& filepath,
                          std::size_t chunk_size = 4096,
                          TransferProgressCallback progress_cb = nullptr);
};

class MessageReceiver {
public:
    // Reads one byte at a time up to and including '\n', at most max_bytes.
    // An empty text means the peer closed without sending anything.
    static HeaderRead receive_header(boost::asio::ip::tcp::socket& socket, std::size_t max_bytes,
                                     std::chrono::milliseconds read_timeout = std::chrono::milliseconds(0));

    // Reads exactly n bytes, or fewer if the peer closes first.
    static std::string receive_exact(boost::asio::ip::tcp::socket& socket, std::size_t n,
                                     std::chrono::milliseconds read_timeout = std::chrono::milliseconds(0));

    // Reads until the peer closes, at most max_bytes.
    static std::string receive_until_close(boost::asio::ip::tcp::socket& socket, std::size_t max_bytes,
                                           std::chrono::milliseconds read_timeout = std::chrono::milliseconds(0));

    // Full server side of an upload: sanitize the name, open the destination,
    // send ACK, stream up to info.size bytes to disk while hashing them,
    // then answer EOF_OK or ERR_CHECKSUM.
    static TransferResult receive_file(boost::asio::ip::tcp::socket& socket,
                                       const std::filesystem::path& dest_dir,
                                       const protocol::FileInfo& info,
                                       const ReceiveOptions& options = ReceiveOptions{},
                                       TransferProgressCallback progress_cb = nullptr);
};

const char* state_name(TransferState state);

} // namespace transfer
