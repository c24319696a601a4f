#include "transfer.hpp"
#include "protocol/request.hpp"
#include "security.hpp"
#include "log.hpp"
#include <vector>
#include <array>
#include <fstream>
#include <algorithm>
#include <atomic>
#include <optional>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>

namespace transfer {

namespace {

// Boost's blocking reads retry internally on EAGAIN, so SO_RCVTIMEO cannot
// bound them. Wait for readability ourselves first.
std::size_t read_some_within(boost::asio::ip::tcp::socket& socket, boost::asio::mutable_buffer buffer,
                             std::chrono::milliseconds timeout, boost::system::error_code& ec) {
    if (timeout.count() > 0) {
        pollfd pfd{};
        pfd.fd = socket.native_handle();
        pfd.events = POLLIN;
        int rc;
        do {
            rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (rc < 0 && errno == EINTR);

        if (rc == 0) {
            ec = boost::asio::error::timed_out;
            return 0;
        }
        if (rc < 0) {
            ec = boost::system::error_code(errno, boost::system::system_category());
            return 0;
        }
    }
    return socket.read_some(buffer, ec);
}

// Claims a fresh, exclusively created file in dest_dir to stream into.
// Uploads of the same name each get their own and are renamed into place
// when they end, so the file on disk is always one whole session's bytes.
std::optional<std::filesystem::path> create_part_file(const std::filesystem::path& dest_dir) {
    static std::atomic<uint64_t> counter{0};
    for (int attempt = 0; attempt < 16; ++attempt) {
        std::filesystem::path candidate = dest_dir / (".fieldlink-" + std::to_string(::getpid()) + "-" +
                                                      std::to_string(counter++) + ".part");
        int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd >= 0) {
            ::close(fd);
            return candidate;
        }
        if (errno != EEXIST) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

void discard_part_file(const std::filesystem::path& part) {
    std::error_code ec;
    std::filesystem::remove(part, ec);
    if (ec) {
        logging::warn("Could not remove " + part.string() + ": " + ec.message());
    }
}

} // namespace

const char* state_name(TransferState state) {
    switch (state) {
        case TransferState::COMPLETED: return "completed";
        case TransferState::SHORT: return "short";
        case TransferState::REJECTED: return "rejected";
        case TransferState::FAILED: return "failed";
    }
    return "unknown";
}

bool MessageSender::send(boost::asio::ip::tcp::socket& socket, const std::string& message) {
    boost::system::error_code ec;
    boost::asio::write(socket, boost::asio::buffer(message), ec);
    if (ec) {
        logging::debug("MessageSender: could not send response: " + ec.message());
        return false;
    }
    return true;
}

bool MessageSender::send_file(boost::asio::ip::tcp::socket& socket, const std::string& filepath,
                              std::size_t chunk_size, TransferProgressCallback progress_cb) {
    try {
        std::ifstream file(filepath, std::ios::binary);
        if (!file.is_open()) {
            logging::error("Could not open file for reading: " + filepath);
            return false;
        }

        // Get file size
        file.seekg(0, std::ios::end);
        uint64_t file_size = static_cast<uint64_t>(file.tellg());
        file.seekg(0);

        uint64_t total_sent = 0;
        auto start_time = std::chrono::steady_clock::now();
        auto last_cb_time = start_time;
        std::string name = std::filesystem::path(filepath).filename().string();

        std::vector<char> buffer(std::max<std::size_t>(chunk_size, 1));
        while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
            std::streamsize bytes_read = file.gcount();
            boost::asio::write(socket, boost::asio::buffer(buffer.data(), static_cast<std::size_t>(bytes_read)));
            total_sent += static_cast<uint64_t>(bytes_read);

            if (progress_cb) {
                auto now = std::chrono::steady_clock::now();
                auto elapsed_since_cb = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_cb_time).count();
                if (elapsed_since_cb >= 300 || total_sent == file_size) {
                    double elapsed = std::chrono::duration<double>(now - start_time).count();
                    double speed = (elapsed > 0) ? (total_sent / elapsed / (1024.0 * 1024.0)) : 0;
                    progress_cb(name, total_sent, file_size, speed);
                    last_cb_time = now;
                }
            }
        }
        return true;
    } catch (std::exception& e) {
        logging::error(std::string("MessageSender Exception (send_file): ") + e.what());
        return false;
    }
}

HeaderRead MessageReceiver::receive_header(boost::asio::ip::tcp::socket& socket, std::size_t max_bytes,
                                           std::chrono::milliseconds read_timeout) {
    HeaderRead result;
    char c = 0;
    while (result.text.size() < max_bytes) {
        boost::system::error_code ec;
        std::size_t n = read_some_within(socket, boost::asio::buffer(&c, 1), read_timeout, ec);
        if (ec || n == 0) {
            if (ec && ec != boost::asio::error::eof) {
                logging::debug("Header read ended: " + ec.message());
            }
            return result;
        }
        result.text.push_back(c);
        if (c == '\n') {
            result.delimited = true;
            return result;
        }
    }
    result.overflow = true;
    return result;
}

std::string MessageReceiver::receive_exact(boost::asio::ip::tcp::socket& socket, std::size_t n,
                                           std::chrono::milliseconds read_timeout) {
    std::string data(n, '\0');
    std::size_t got = 0;
    while (got < n) {
        boost::system::error_code ec;
        std::size_t r = read_some_within(socket, boost::asio::buffer(&data[got], n - got), read_timeout, ec);
        if (ec || r == 0) {
            break;
        }
        got += r;
    }
    data.resize(got);
    return data;
}

std::string MessageReceiver::receive_until_close(boost::asio::ip::tcp::socket& socket, std::size_t max_bytes,
                                                 std::chrono::milliseconds read_timeout) {
    std::string data;
    std::array<char, 512> buf;
    while (data.size() < max_bytes) {
        boost::system::error_code ec;
        std::size_t want = std::min(buf.size(), max_bytes - data.size());
        std::size_t r = read_some_within(socket, boost::asio::buffer(buf.data(), want), read_timeout, ec);
        if (r > 0) {
            data.append(buf.data(), r);
        }
        if (ec || r == 0) {
            break;
        }
    }
    return data;
}

TransferResult MessageReceiver::receive_file(boost::asio::ip::tcp::socket& socket,
                                             const std::filesystem::path& dest_dir,
                                             const protocol::FileInfo& info,
                                             const ReceiveOptions& options,
                                             TransferProgressCallback progress_cb) {
    TransferResult result;
    result.session.declared_size = info.size;
    result.session.declared_checksum = info.checksum;

    auto clean = security::sanitize_filename(info.filename);
    if (!clean) {
        logging::warn("Rejecting upload with unusable filename " + logging::quote(info.filename));
        result.state = TransferState::REJECTED;
        result.response = protocol::token::ERR_INCOMPLETE_HEADER;
        if (!MessageSender::send(socket, result.response)) {
            logging::debug("Peer left before the rejection was sent");
        }
        return result;
    }
    if (*clean != info.filename) {
        logging::warn("Filename " + logging::quote(info.filename) + " sanitized to " + logging::quote(*clean));
    }
    result.session.filename = *clean;
    result.path = dest_dir / *clean;

    auto part = create_part_file(dest_dir);
    if (!part) {
        logging::error("Could not create a file in " + dest_dir.string() + " for " + result.session.filename);
        result.state = TransferState::FAILED;
        return result;
    }
    std::ofstream file(*part, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        logging::error("Could not open file for writing: " + part->string());
        discard_part_file(*part);
        result.state = TransferState::FAILED;
        return result;
    }

    // Confirm the server is ready to receive. If the peer is already gone the
    // first read below reports it and the transfer ends up SHORT.
    if (!MessageSender::send(socket, protocol::token::ACK)) {
        logging::warn("Could not acknowledge " + result.session.filename);
    }

    security::Sha256 hasher;
    uint64_t& total_received = result.session.bytes_received;
    const uint64_t expected_size = info.size;
    auto start_time = std::chrono::steady_clock::now();
    auto last_cb_time = start_time;
    bool write_failed = false;

    std::vector<char> buffer(std::max<std::size_t>(options.chunk_size, 1));
    while (total_received < expected_size) {
        std::size_t want = static_cast<std::size_t>(
            std::min<uint64_t>(buffer.size(), expected_size - total_received));
        boost::system::error_code ec;
        std::size_t n = read_some_within(socket, boost::asio::buffer(buffer.data(), want), options.read_timeout, ec);
        if (n > 0) {
            file.write(buffer.data(), static_cast<std::streamsize>(n));
            if (!file) {
                logging::error("Write failed on " + part->string());
                write_failed = true;
                break;
            }
            hasher.update(buffer.data(), n);
            total_received += n;

            if (progress_cb) {
                auto now = std::chrono::steady_clock::now();
                auto elapsed_since_cb = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_cb_time).count();
                if (elapsed_since_cb >= 300 || total_received == expected_size) {
                    double elapsed = std::chrono::duration<double>(now - start_time).count();
                    double speed = (elapsed > 0) ? (total_received / elapsed / (1024.0 * 1024.0)) : 0;
                    progress_cb(result.session.filename, total_received, expected_size, speed);
                    last_cb_time = now;
                }
            }
        }
        if (ec || n == 0) {
            if (ec && ec != boost::asio::error::eof) {
                logging::warn("Transfer of " + result.session.filename + " interrupted: " + ec.message());
            }
            break;
        }
    }
    file.close();

    if (write_failed) {
        discard_part_file(*part);
        result.state = TransferState::FAILED;
        return result;
    }

    // Short and mismatched uploads are kept too; the last session to finish wins the name
    std::error_code rename_ec;
    std::filesystem::rename(*part, result.path, rename_ec);
    if (rename_ec) {
        logging::error("Could not move upload into " + result.path.string() + ": " + rename_ec.message());
        discard_part_file(*part);
        result.state = TransferState::FAILED;
        return result;
    }

    result.session.computed_checksum = hasher.finish();
    result.state = (total_received == expected_size) ? TransferState::COMPLETED : TransferState::SHORT;
    result.checksum_ok = security::digest_equals(result.session.computed_checksum, info.checksum);
    result.response = result.checksum_ok ? protocol::token::EOF_OK : protocol::token::ERR_CHECKSUM;
    if (!MessageSender::send(socket, result.response)) {
        logging::warn("Could not deliver verdict for " + result.session.filename);
    }
    return result;
}

} // namespace transfer
