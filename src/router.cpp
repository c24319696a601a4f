#include "router.hpp"
#include "transfer.hpp"
#include "log.hpp"
#include <thread>
#include <system_error>

namespace networking {

using boost::asio::ip::tcp;
namespace token = protocol::token;

const char* state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::AWAIT_HEADER: return "AWAIT_HEADER";
        case ConnectionState::DISPATCHED: return "DISPATCHED";
        case ConnectionState::PING_DONE: return "PING_DONE";
        case ConnectionState::HELLO_DONE: return "HELLO_DONE";
        case ConnectionState::DATA_DONE: return "DATA_DONE";
        case ConnectionState::TRANSFER_IN_PROGRESS: return "TRANSFER_IN_PROGRESS";
        case ConnectionState::TRANSFER_DONE: return "TRANSFER_DONE";
        case ConnectionState::REJECTED: return "REJECTED";
        case ConnectionState::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

ActionRouter::ActionRouter(const config::ServerConfig& cfg,
                           registry::DeviceRegistry& devices,
                           registry::TelemetryStore& telemetry,
                           events::EventBus& bus,
                           SessionLauncher launcher)
    : cfg_(cfg), devices_(devices), telemetry_(telemetry), bus_(bus), launcher_(std::move(launcher)) {}

RouteOutcome ActionRouter::handle(tcp::socket& socket, const std::string& peer_ip) {
    auto header = transfer::MessageReceiver::receive_header(
        socket, cfg_.max_header_bytes, std::chrono::seconds(cfg_.read_timeout_seconds));

    if (header.text.empty()) {
        logging::debug("Empty connection from " + peer_ip);
        return RouteOutcome{ConnectionState::AWAIT_HEADER, "", nullptr};
    }

    if (header.overflow) {
        logging::warn("Header from " + peer_ip + " exceeds " + std::to_string(cfg_.max_header_bytes) + " bytes");
        RouteOutcome outcome{ConnectionState::REJECTED, "invalid", token::ERR_INVALID_HEADER};
        reply(socket, outcome.response, peer_ip);
        return outcome;
    }

    return dispatch(protocol::decode_request(header.text), socket, peer_ip);
}

RouteOutcome ActionRouter::dispatch(const protocol::Request& request, tcp::socket& socket,
                                    const std::string& peer_ip) {
    return std::visit(protocol::overloaded{
        [&](const protocol::PingRequest& r) { return on_ping(r, socket, peer_ip); },
        [&](const protocol::HelloRequest& r) { return on_hello(r, socket, peer_ip); },
        [&](const protocol::DataRequest& r) { return on_data(r, socket, peer_ip); },
        [&](const protocol::SendFileRequest& r) { return on_send_file(r, socket, peer_ip); },
        [&](const protocol::IncompleteRequest&) { return reject(request, socket, peer_ip); },
        [&](const protocol::UnknownRequest&) { return reject(request, socket, peer_ip); },
        [&](const protocol::InvalidHeader&) { return reject(request, socket, peer_ip); }
    }, request);
}

RouteOutcome ActionRouter::on_ping(const protocol::PingRequest& req, tcp::socket& socket,
                                   const std::string& peer_ip) {
    logging::info(std::string("Ping (") + (req.plain_text ? "text" : "JSON") + ") from " + peer_ip);
    reply(socket, token::PONG, peer_ip);
    return RouteOutcome{ConnectionState::PING_DONE, "ping", token::PONG};
}

RouteOutcome ActionRouter::on_hello(const protocol::HelloRequest& req, tcp::socket& socket,
                                    const std::string& peer_ip) {
    devices_.upsert(req.serial, peer_ip, req.device_type, registry::Clock::now());
    if (!devices_.persist()) {
        logging::warn("Device registry snapshot not saved after hello from " + logging::quote(req.serial));
    }
    logging::info("Hello: serial=" + logging::quote(req.serial) + " type=" + logging::quote(req.device_type) + " from " + peer_ip);

    reply(socket, token::ACK_HELLO, peer_ip);

    bus_.emit_nowait(events::make_event(events::event_type::DEVICE_CONNECTED, req.serial,
                                        {{"ip", peer_ip}, {"device_type", req.device_type}}));
    launch_session(req.serial);
    return RouteOutcome{ConnectionState::HELLO_DONE, "hello", token::ACK_HELLO};
}

RouteOutcome ActionRouter::on_data(const protocol::DataRequest& req, tcp::socket& socket,
                                   const std::string& peer_ip) {
    telemetry_.record(req.serial, req.payload, registry::Clock::now());
    if (!telemetry_.persist()) {
        logging::warn("Telemetry snapshot not saved after data from " + logging::quote(req.serial));
    }
    logging::info("Data from " + logging::quote(req.serial) + ": " + req.payload.dump().substr(0, 200));

    bus_.register_heartbeat(req.serial);
    bus_.emit_nowait(events::make_event(events::event_type::DATA_RECEIVED, req.serial, req.payload));

    reply(socket, token::ACK_DATA, peer_ip);
    return RouteOutcome{ConnectionState::DATA_DONE, "data", token::ACK_DATA};
}

RouteOutcome ActionRouter::on_send_file(const protocol::SendFileRequest& req, tcp::socket& socket,
                                        const std::string& peer_ip) {
    logging::info("Device " + logging::quote(req.serial) + " at " + peer_ip + " sending " + logging::quote(req.file.filename) + " (" +
                  std::to_string(req.file.size) + " bytes" + (req.implicit_action ? ", legacy header)" : ")"));

    launch_session(req.serial);

    const std::string serial = req.serial;
    auto progress = [this, serial](const std::string& filename, uint64_t done, uint64_t total, double speed_mbps) {
        bus_.emit_nowait(events::make_event(events::event_type::TRANSFER_PROGRESS, serial,
                                            {{"filename", filename},
                                             {"bytes_received", done},
                                             {"size", total},
                                             {"speed_mbps", speed_mbps}}));
    };

    transfer::ReceiveOptions options;
    options.chunk_size = cfg_.chunk_size;
    options.read_timeout = std::chrono::seconds(cfg_.read_timeout_seconds);

    // TRANSFER_IN_PROGRESS lasts for the duration of this call
    transfer::TransferResult result = transfer::MessageReceiver::receive_file(
        socket, cfg_.dest_dir, req.file, options, progress);

    if (result.state == transfer::TransferState::REJECTED) {
        return RouteOutcome{ConnectionState::REJECTED, "send_file", result.response};
    }
    if (result.state == transfer::TransferState::FAILED) {
        logging::error("Transfer of " + logging::quote(req.file.filename) + " from " + logging::quote(serial) + " failed after " +
                       std::to_string(result.session.bytes_received) + " bytes");
        return RouteOutcome{ConnectionState::TRANSFER_DONE, "send_file", result.response};
    }

    const auto& session = result.session;
    if (result.state == transfer::TransferState::SHORT) {
        logging::warn("Short transfer: " + session.filename + " got " + std::to_string(session.bytes_received) +
                      " of " + std::to_string(session.declared_size) + " bytes, partial file kept");
        bus_.emit_nowait(events::make_event(events::event_type::TRANSFER_INCOMPLETE, serial,
                                            {{"filename", session.filename},
                                             {"bytes_received", session.bytes_received},
                                             {"size", session.declared_size},
                                             {"path", result.path.string()}}));
    }

    if (result.checksum_ok) {
        logging::info("File received: " + result.path.string() + " (" + std::to_string(session.bytes_received) + " bytes)");
    } else {
        logging::warn("Checksum mismatch for " + session.filename + ": expected=" + session.declared_checksum +
                      " actual=" + session.computed_checksum);
    }

    bus_.emit_nowait(events::make_event(events::event_type::TRANSFER_COMPLETE, serial,
                                        {{"filename", session.filename},
                                         {"path", result.path.string()},
                                         {"bytes_received", session.bytes_received},
                                         {"size", session.declared_size},
                                         {"checksum_ok", result.checksum_ok},
                                         {"state", transfer::state_name(result.state)}}));

    return RouteOutcome{ConnectionState::TRANSFER_DONE, "send_file", result.response};
}

RouteOutcome ActionRouter::reject(const protocol::Request& req, tcp::socket& socket,
                                  const std::string& peer_ip) {
    const char* response = protocol::rejection_token(req);

    std::visit(protocol::overloaded{
        [&](const protocol::IncompleteRequest& r) {
            logging::warn("Incomplete " + logging::quote(r.action) + " header from " + peer_ip + ": " + r.reason);
        },
        [&](const protocol::UnknownRequest& r) {
            logging::warn("Unknown action " + logging::quote(r.action) + " from " + peer_ip);
        },
        [&](const protocol::InvalidHeader& r) {
            logging::warn("Invalid header from " + peer_ip + ": " + logging::quote(r.error));
        },
        [](const auto&) {}
    }, req);

    reply(socket, response, peer_ip);
    return RouteOutcome{ConnectionState::REJECTED, protocol::request_kind(req), response};
}

void ActionRouter::reply(tcp::socket& socket, const char* response, const std::string& peer_ip) {
    if (!transfer::MessageSender::send(socket, response)) {
        logging::debug("Peer " + peer_ip + " closed before the response was sent");
    }
}

void ActionRouter::launch_session(const std::string& serial) {
    if (!launcher_) {
        logging::debug("No session launcher configured, skipping session for " + logging::quote(serial));
        return;
    }

    try {
        std::thread([launcher = launcher_, serial]() {
            try {
                launcher(serial, nlohmann::json::object(), [serial](const nlohmann::json& status) {
                    logging::info("Session " + logging::quote(serial) + ": " + status.dump());
                });
            } catch (std::exception& e) {
                logging::error("Remote session for " + logging::quote(serial) + " failed: " + e.what());
            }
        }).detach();
        logging::info("Remote session launched for " + logging::quote(serial));
    } catch (std::system_error& e) {
        logging::error("Could not launch remote session for " + logging::quote(serial) + ": " + e.what());
    }
}

} // namespace networking
