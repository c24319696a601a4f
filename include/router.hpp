#pragma once

#include <string>
#include <functional>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "events.hpp"
#include "registry.hpp"
#include "protocol/request.hpp"

namespace networking {

// Status reports from an instrument session back to whoever launched it
using SessionCallback = std::function<void(const nlohmann::json&)>;

// External orchestration hook: (serial, params, callback). Runs detached;
// the router never waits on it.
using SessionLauncher = std::function<void(const std::string&, const nlohmann::json&, SessionCallback)>;

enum class ConnectionState {
    AWAIT_HEADER,
    DISPATCHED,
    PING_DONE,
    HELLO_DONE,
    DATA_DONE,
    TRANSFER_IN_PROGRESS,
    TRANSFER_DONE,
    REJECTED,
    CLOSED
};

const char* state_name(ConnectionState state);

struct RouteOutcome {
    ConnectionState state = ConnectionState::AWAIT_HEADER;
    std::string kind;              // request kind, empty if nothing was read
    const char* response = nullptr; // last token sent
};

// Serves exactly one request on an accepted connection. The caller owns the
// socket and closes it afterwards.
class ActionRouter {
public:
    ActionRouter(const config::ServerConfig& cfg,
                 registry::DeviceRegistry& devices,
                 registry::TelemetryStore& telemetry,
                 events::EventBus& bus,
                 SessionLauncher launcher = nullptr);

    RouteOutcome handle(boost::asio::ip::tcp::socket& socket, const std::string& peer_ip);

    RouteOutcome dispatch(const protocol::Request& request,
                          boost::asio::ip::tcp::socket& socket,
                          const std::string& peer_ip);

private:
    RouteOutcome on_ping(const protocol::PingRequest& req, boost::asio::ip::tcp::socket& socket,
                         const std::string& peer_ip);
    RouteOutcome on_hello(const protocol::HelloRequest& req, boost::asio::ip::tcp::socket& socket,
                          const std::string& peer_ip);
    RouteOutcome on_data(const protocol::DataRequest& req, boost::asio::ip::tcp::socket& socket,
                         const std::string& peer_ip);
    RouteOutcome on_send_file(const protocol::SendFileRequest& req, boost::asio::ip::tcp::socket& socket,
                              const std::string& peer_ip);
    RouteOutcome reject(const protocol::Request& req, boost::asio::ip::tcp::socket& socket,
                        const std::string& peer_ip);

    void launch_session(const std::string& serial);
    void reply(boost::asio::ip::tcp::socket& socket, const char* token, const std::string& peer_ip);

    const config::ServerConfig& cfg_;
    registry::DeviceRegistry& devices_;
    registry::TelemetryStore& telemetry_;
    events::EventBus& bus_;
    SessionLauncher launcher_;
};

} // namespace networking
