#pragma once

#include <string>
#include <fstream>
#include <filesystem>
#include <random>
#include <chrono>
#include <thread>
#include <functional>
#include <boost/asio.hpp>

namespace testutil {

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("fieldlink_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::string& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Polls `condition` until it holds or the timeout passes
inline bool wait_for(const std::function<bool()>& condition,
                     std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

// Blocking loopback connection for driving the server byte by byte
class RawConnection {
public:
    explicit RawConnection(unsigned short port) : socket_(io_) {
        socket_.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    }

    void send(const std::string& bytes) {
        boost::asio::write(socket_, boost::asio::buffer(bytes));
    }

    void close_send() {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send);
    }

    std::string read_exact(std::size_t n) {
        std::string data(n, '\0');
        boost::system::error_code ec;
        std::size_t got = boost::asio::read(socket_, boost::asio::buffer(&data[0], n), ec);
        data.resize(got);
        return data;
    }

    std::string read_all() {
        std::string data;
        char buf[512];
        for (;;) {
            boost::system::error_code ec;
            std::size_t n = socket_.read_some(boost::asio::buffer(buf), ec);
            data.append(buf, n);
            if (ec) {
                break;
            }
        }
        return data;
    }

private:
    boost::asio::io_context io_;
    boost::asio::ip::tcp::socket socket_;
};

} // namespace testutil
