#include <iostream>
#include <string>
#include <cstdint>
#include <thread>
#include <csignal>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "events.hpp"
#include "log.hpp"
#include "networking.hpp"
#include "publisher.hpp"
#include "registry.hpp"
#include "security.hpp"

namespace {

void print_usage() {
    std::cout << "Usage:\n"
              << "  fieldlink serve [--config FILE] [--port N] [--dest DIR]\n"
              << "  fieldlink ping HOST PORT\n"
              << "  fieldlink hello HOST PORT SERIAL [TYPE]\n"
              << "  fieldlink data HOST PORT SERIAL JSON\n"
              << "  fieldlink send HOST PORT FILE [SERIAL]\n";
}

unsigned short parse_port(const std::string& text) {
    unsigned long value = std::stoul(text);
    if (value > 65535) {
        throw std::out_of_range("port out of range: " + text);
    }
    return static_cast<unsigned short>(value);
}

int run_server(int argc, char* argv[]) {
    config::ServerConfig cfg;
    std::string config_path;
    std::string port_override;
    std::string dest_override;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            return 2;
        }
        if (arg == "--config") {
            config_path = argv[++i];
        } else if (arg == "--port") {
            port_override = argv[++i];
        } else if (arg == "--dest") {
            dest_override = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        }
    }

    if (!config_path.empty()) {
        cfg = config::load_config(config_path);
    }
    if (!port_override.empty()) {
        cfg.port = parse_port(port_override);
    }
    if (!dest_override.empty()) {
        cfg.dest_dir = dest_override;
    }
    logging::init(logging::parse_level(cfg.log_level));

    registry::DeviceRegistry devices(cfg.registry_path);
    registry::TelemetryStore telemetry(cfg.telemetry_path);
    logging::info("Loaded " + std::to_string(devices.load()) + " known devices from " + cfg.registry_path);
    telemetry.load();

    events::BusOptions bus_options;
    bus_options.heartbeat_timeout = std::chrono::seconds(cfg.heartbeat_timeout_seconds);
    bus_options.heartbeat_tick = std::chrono::milliseconds(cfg.heartbeat_tick_ms);
    bus_options.evict_after = cfg.heartbeat_evict_after;
    bus_options.workers = cfg.event_workers;
    events::EventBus bus(bus_options);

    publisher::EventPublisher event_publisher(cfg.topic_root, cfg.publish_events);
    event_publisher.start(bus);
    bus.start();

    networking::Server server(cfg, devices, telemetry, bus);
    server.start();

    // Ctrl+C closes the listener; in-flight connections are allowed to finish
    boost::asio::io_context signal_io;
    boost::asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            logging::info("Signal " + std::to_string(signo) + " received, shutting down");
            server.stop();
        }
    });
    std::thread signal_thread([&signal_io]() { signal_io.run(); });

    server.run();

    signal_io.stop();
    signal_thread.join();

    server.wait_idle();
    event_publisher.stop();
    bus.stop();
    logging::info("Published " + std::to_string(event_publisher.published_count()) + " events");
    return 0;
}

int run_client(const std::string& command, int argc, char* argv[]) {
    networking::Client client(argv[2], parse_port(argv[3]));

    if (command == "ping") {
        std::cout << client.ping();
    } else if (command == "hello") {
        if (argc < 5) {
            print_usage();
            return 2;
        }
        std::string type = argc >= 6 ? argv[5] : protocol::UNKNOWN_FIELD;
        std::cout << client.hello(argv[4], type);
    } else if (command == "data") {
        if (argc < 6) {
            print_usage();
            return 2;
        }
        nlohmann::json payload = nlohmann::json::parse(argv[5]);
        std::cout << client.send_data(argv[4], payload);
    } else if (command == "send") {
        if (argc < 5) {
            print_usage();
            return 2;
        }
        std::string serial = argc >= 6 ? argv[5] : "";
        auto progress = [](const std::string& name, uint64_t done, uint64_t total, double speed) {
            std::cout << "\r" << name << " " << networking::format_size(done) << " / "
                      << networking::format_size(total) << " (" << speed << " MB/s)" << std::flush;
        };
        networking::UploadResult result = client.send_file(argv[4], serial, progress);
        std::cout << "\n";
        if (!result.accepted) {
            std::cerr << "Rejected: " << result.ack;
            return 1;
        }
        std::cout << result.verdict << "\n";
        return result.verdict == protocol::token::EOF_OK ? 0 : 1;
    } else {
        print_usage();
        return 2;
    }
    std::cout << std::flush;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    std::string command = argv[1];
    try {
        logging::init(logging::Level::INFO);
        security::ensure_initialized();

        if (command == "serve") {
            return run_server(argc, argv);
        }
        if (argc < 4) {
            print_usage();
            return 2;
        }
        return run_client(command, argc, argv);
    } catch (std::exception& e) {
        logging::error(std::string("Fatal: ") + e.what());
        return 1;
    }
}
