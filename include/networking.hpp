#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "router.hpp"
#include "transfer.hpp"

namespace networking {

// Best guess at the address peers can reach us on; 127.0.0.1 if offline
std::string get_local_ip(boost::asio::io_context& io_context);

std::string format_size(uint64_t bytes);

// Accepts connections and serves each one on its own thread.
class Server {
public:
    Server(config::ServerConfig cfg,
           registry::DeviceRegistry& devices,
           registry::TelemetryStore& telemetry,
           events::EventBus& bus,
           SessionLauncher launcher = nullptr);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Prepares the destination directory and binds the listener.
    // Throws std::runtime_error if either fails.
    void start();

    // Accepts connections until stop() is called. Call start() first.
    void run();

    // Closes the listener. In-flight connections finish on their own.
    void stop();

    // Blocks until no connection handler is running.
    void wait_idle();

    unsigned short port() const;

private:
    void do_accept();
    void spawn_handler(boost::asio::ip::tcp::socket socket);
    void serve(boost::asio::ip::tcp::socket& socket);

    config::ServerConfig cfg_;
    ActionRouter router_;

    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> started_{false};

    std::mutex active_mutex_;
    std::condition_variable idle_cv_;
    std::size_t active_ = 0;
};

struct UploadResult {
    bool accepted = false; // server answered ACK to the header
    std::string ack;       // the first response bytes
    std::string verdict;   // EOF_OK or ERR_CHECKSUM after the body
};

// One connection per call, mirroring the server's one-request rule.
// Connection failures throw boost::system::system_error.
class Client {
public:
    Client(std::string host, unsigned short port,
           std::chrono::milliseconds timeout = std::chrono::seconds(10));

    std::string ping(bool plain_text = false);
    std::string hello(const std::string& serial, const std::string& device_type);
    std::string send_data(const std::string& serial, const nlohmann::json& payload);

    // Sends `header` followed by '\n' and returns whatever comes back
    std::string send_raw_header(const std::string& header);

    // Hashes the file, announces it, waits for ACK and streams the body.
    // Throws std::runtime_error if the file cannot be read.
    UploadResult send_file(const std::string& filepath, const std::string& serial = "",
                           transfer::TransferProgressCallback progress_cb = nullptr,
                           std::size_t chunk_size = 4096);

private:
    boost::asio::ip::tcp::socket connect(boost::asio::io_context& io_context);
    std::string request(const std::string& line);

    std::string host_;
    unsigned short port_;
    std::chrono::milliseconds timeout_;
};

} // namespace networking
