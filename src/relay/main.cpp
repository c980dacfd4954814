#include "zapwire/Config.hpp"
#include "zapwire/core/StructuredLogger.hpp"
#include "zapwire/relay/EventLoop.hpp"
#include "zapwire/relay/PeerTable.hpp"
#include "zapwire/relay/RelayServer.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

namespace {

using zapwire::core::StructuredLogger;
using zapwire::relay::EventLoop;
using zapwire::relay::PeerTable;
using zapwire::relay::RelayServer;
using zapwire::relay::RelayServerConfig;

EventLoop* g_loop = nullptr;

void handle_signal(int) {
    if (g_loop) {
        g_loop->stop();
    }
}

void install_signal_handlers() {
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

struct CliConfig {
    std::optional<std::string> config_path;
    std::optional<std::pair<std::string, std::uint16_t>> listen;
    std::optional<std::string> log_level;
    bool show_help{false};
    bool valid{true};
    std::string error;
};

std::optional<std::pair<std::string, std::uint16_t>> parse_listen_endpoint(const std::string& text) {
    const auto pos = text.rfind(':');
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string host = text.substr(0, pos);
    std::string port_text = text.substr(pos + 1);
    if (host.empty() || port_text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const auto port_value = std::strtoul(port_text.c_str(), &end, 10);
    if (!end || *end != '\0' || port_value == 0 || port_value > 65535) {
        return std::nullopt;
    }
    return std::make_pair(host, static_cast<std::uint16_t>(port_value));
}

CliConfig parse_arguments(int argc, char** argv) {
    CliConfig parsed;
    const auto require_value = [&](int& index, const std::string& flag) -> std::optional<std::string> {
        if (index + 1 >= argc) {
            parsed.valid = false;
            parsed.error = flag + " requires a value";
            return std::nullopt;
        }
        return std::string(argv[++index]);
    };

    for (int i = 1; i < argc && parsed.valid; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            parsed.show_help = true;
        } else if (arg == "--listen") {
            const auto value = require_value(i, arg);
            if (!value) {
                break;
            }
            parsed.listen = parse_listen_endpoint(*value);
            if (!parsed.listen) {
                parsed.valid = false;
                parsed.error = "Invalid --listen value";
            }
        } else if (arg == "--config") {
            parsed.config_path = require_value(i, arg);
        } else if (arg == "--log-level") {
            parsed.log_level = require_value(i, arg);
        } else {
            parsed.valid = false;
            parsed.error = "Unknown argument: " + arg;
        }
    }
    return parsed;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--listen host:port] [--config file] [--log-level level]\n";
    std::cout << "Options:\n";
    std::cout << "  --listen host:port   Address to bind (default 0.0.0.0:" << zapwire::kDefaultRelayPort << ")\n";
    std::cout << "  --config file        Read settings from a YAML file\n";
    std::cout << "  --log-level level    debug, info, warning or error\n";
    std::cout << "  -h, --help           Show this message\n";
}

}  // namespace

int main(int argc, char** argv) {
    const auto cli = parse_arguments(argc, argv);
    if (!cli.valid) {
        std::cerr << cli.error << "\n";
        print_usage(argv[0]);
        return 2;
    }
    if (cli.show_help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    zapwire::Config config;
    try {
        if (cli.config_path) {
            zapwire::load_config_file(*cli.config_path, config);
        }
        if (cli.log_level) {
            config.log_level = *cli.log_level;
        }
        zapwire::validate_config(config);
    } catch (const zapwire::ConfigError& error) {
        std::cerr << error.what() << "\n";
        if (!error.hint().empty()) {
            std::cerr << "Hint: " << error.hint() << "\n";
        }
        return 2;
    }

    auto& logger = StructuredLogger::instance();
    logger.set_enabled(config.logging_enabled);
    logger.set_min_level(StructuredLogger::parse_level(config.log_level).value_or(StructuredLogger::Level::Info));

    RelayServerConfig server_config;
    server_config.listen_host = config.listen_host;
    server_config.listen_port = config.relay_port;
    server_config.max_frame_size = config.max_frame_size;
    if (cli.listen) {
        server_config.listen_host = cli.listen->first;
        server_config.listen_port = cli.listen->second;
    }

    install_signal_handlers();

    try {
        EventLoop loop;
        PeerTable peers;
        g_loop = &loop;
        RelayServer server(loop, peers, server_config);
        if (!server.start()) {
            g_loop = nullptr;
            return EXIT_FAILURE;
        }
        std::cout << "Relay listening on " << server_config.listen_host << ":" << server.port() << "\n";
        std::cout << "Payloads are end-to-end encrypted; the relay only forwards them.\n";

        loop.run();

        server.stop();
        g_loop = nullptr;
    } catch (const std::system_error& error) {
        g_loop = nullptr;
        std::cerr << "Relay failed: " << error.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
