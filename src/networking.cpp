#include "networking.hpp"
#include "security.hpp"
#include "log.hpp"
#include <thread>
#include <memory>
#include <filesystem>
#include <system_error>
#include <cstdio>

using boost::asio::ip::tcp;

namespace networking {

std::string get_local_ip(boost::asio::io_context& io_context) {
    try {
        boost::asio::ip::udp::socket socket(io_context);
        socket.connect(boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("8.8.8.8"), 53));
        return socket.local_endpoint().address().to_string();
    } catch (std::exception& e) {
        logging::debug(std::string("No outbound route, assuming loopback: ") + e.what());
        return "127.0.0.1";
    }
}

std::string format_size(uint64_t bytes) {
    double size = static_cast<double>(bytes);
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

// --- Server ---

Server::Server(config::ServerConfig cfg,
               registry::DeviceRegistry& devices,
               registry::TelemetryStore& telemetry,
               events::EventBus& bus,
               SessionLauncher launcher)
    : cfg_(std::move(cfg)),
      router_(cfg_, devices, telemetry, bus, std::move(launcher)),
      acceptor_(io_) {}

Server::~Server() {
    stop();
    wait_idle();
}

void Server::start() {
    namespace fs = std::filesystem;

    std::error_code fs_ec;
    fs::create_directories(cfg_.dest_dir, fs_ec);
    if (fs_ec || !fs::is_directory(cfg_.dest_dir)) {
        throw std::runtime_error("Destination directory unusable: " + cfg_.dest_dir +
                                 (fs_ec ? " (" + fs_ec.message() + ")" : ""));
    }

    try {
        tcp::endpoint endpoint(boost::asio::ip::make_address(cfg_.host), cfg_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
    } catch (boost::system::system_error& e) {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        throw std::runtime_error("Cannot listen on " + cfg_.host + ":" + std::to_string(cfg_.port) +
                                 ": " + e.what());
    }

    started_ = true;
    std::string shown = cfg_.host == "0.0.0.0" ? get_local_ip(io_) : cfg_.host;
    logging::info("Listening on " + shown + ":" + std::to_string(port()) +
                  ", files go to " + cfg_.dest_dir);
}

void Server::run() {
    if (!started_) {
        throw std::logic_error("Server::run() called before start()");
    }
    do_accept();
    io_.run();
    logging::info("Server stopped accepting connections");
}

void Server::stop() {
    boost::asio::post(io_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            logging::debug("Closing listener: " + ec.message());
        }
    });
}

void Server::wait_idle() {
    std::unique_lock<std::mutex> lock(active_mutex_);
    idle_cv_.wait(lock, [this]() { return active_ == 0; });
}

unsigned short Server::port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? cfg_.port : endpoint.port();
}

void Server::do_accept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (ec) {
            logging::warn("Accept failed: " + ec.message());
        } else {
            spawn_handler(std::move(socket));
        }
        do_accept();
    });
}

void Server::spawn_handler(tcp::socket socket) {
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        ++active_;
    }

    auto release = [this]() {
        std::lock_guard<std::mutex> lock(active_mutex_);
        --active_;
        idle_cv_.notify_all();
    };

    // The socket must be gone before release(): once active_ hits zero the
    // Server, and the io_context the socket belongs to, may be destroyed
    auto owned = std::make_unique<tcp::socket>(std::move(socket));
    try {
        std::thread([this, release, owned = std::move(owned)]() mutable {
            {
                std::unique_ptr<tcp::socket> connection = std::move(owned);
                serve(*connection);
            }
            release();
        }).detach();
    } catch (std::system_error& e) {
        logging::error(std::string("Could not start connection handler: ") + e.what());
        release();
    }
}

void Server::serve(tcp::socket& socket) {
    boost::system::error_code ec;
    auto remote = socket.remote_endpoint(ec);
    std::string peer_ip = ec ? std::string("unknown") : remote.address().to_string();

    try {
        RouteOutcome outcome = router_.handle(socket, peer_ip);
        logging::debug("Connection from " + peer_ip + " ended in " + state_name(outcome.state) +
                       (outcome.kind.empty() ? "" : " (" + outcome.kind + ")"));
    } catch (std::exception& e) {
        logging::error("Connection handler for " + peer_ip + " failed: " + e.what());
    }

    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

// --- Client ---

Client::Client(std::string host, unsigned short port, std::chrono::milliseconds timeout)
    : host_(std::move(host)), port_(port), timeout_(timeout) {}

tcp::socket Client::connect(boost::asio::io_context& io_context) {
    tcp::resolver resolver(io_context);
    tcp::socket socket(io_context);
    boost::asio::connect(socket, resolver.resolve(host_, std::to_string(port_)));
    return socket;
}

std::string Client::request(const std::string& line) {
    boost::asio::io_context io_context;
    tcp::socket socket = connect(io_context);
    if (!transfer::MessageSender::send(socket, line)) {
        throw std::runtime_error("Connection to " + host_ + " dropped while sending");
    }
    socket.shutdown(tcp::socket::shutdown_send);
    return transfer::MessageReceiver::receive_until_close(socket, protocol::MAX_HEADER_BYTES, timeout_);
}

std::string Client::ping(bool plain_text) {
    if (plain_text) {
        return request("ping\n");
    }
    return request(nlohmann::json{{"action", "ping"}}.dump() + "\n");
}

std::string Client::hello(const std::string& serial, const std::string& device_type) {
    nlohmann::json header{{"action", "hello"}, {"serial", serial}, {"device_type", device_type}};
    return request(header.dump() + "\n");
}

std::string Client::send_data(const std::string& serial, const nlohmann::json& payload) {
    nlohmann::json header{{"action", "data"}, {"serial", serial}, {"payload", payload}};
    return request(header.dump() + "\n");
}

std::string Client::send_raw_header(const std::string& header) {
    return request(header + "\n");
}

UploadResult Client::send_file(const std::string& filepath, const std::string& serial,
                               transfer::TransferProgressCallback progress_cb, std::size_t chunk_size) {
    auto checksum = security::sha256_file(filepath);
    if (!checksum) {
        throw std::runtime_error("Cannot read " + filepath);
    }

    std::error_code fs_ec;
    uint64_t size = std::filesystem::file_size(filepath, fs_ec);
    if (fs_ec) {
        throw std::runtime_error("Cannot stat " + filepath + ": " + fs_ec.message());
    }

    protocol::FileInfo info{std::filesystem::path(filepath).filename().string(), size, *checksum};
    nlohmann::json header = info;
    header["action"] = "send_file";
    if (!serial.empty()) {
        header["serial"] = serial;
    }

    boost::asio::io_context io_context;
    tcp::socket socket = connect(io_context);

    UploadResult result;
    if (!transfer::MessageSender::send(socket, header.dump() + "\n")) {
        throw std::runtime_error("Connection to " + host_ + " dropped while sending header");
    }

    result.ack = transfer::MessageReceiver::receive_exact(socket, 3, timeout_);
    if (result.ack != protocol::token::ACK) {
        // Rejected: the rest of the error token follows, then the server closes
        result.ack += transfer::MessageReceiver::receive_until_close(socket, 256, timeout_);
        logging::warn("Upload of " + info.filename + " refused: " + result.ack);
        return result;
    }
    result.accepted = true;

    logging::info("Uploading " + info.filename + " (" + format_size(size) + ")");
    if (!transfer::MessageSender::send_file(socket, filepath, chunk_size, progress_cb)) {
        logging::warn("Upload of " + info.filename + " interrupted");
    }

    result.verdict = transfer::MessageReceiver::receive_until_close(socket, 256, timeout_);
    return result;
}

} // namespace networking
