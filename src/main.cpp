#include "zapwire/Config.hpp"
#include "zapwire/Error.hpp"
#include "zapwire/core/StructuredLogger.hpp"
#include "zapwire/crypto/CodeGenerator.hpp"
#include "zapwire/network/DirectConnection.hpp"
#include "zapwire/network/RelayedConnection.hpp"
#include "zapwire/transfer/ChunkIO.hpp"
#include "zapwire/transfer/TransferSession.hpp"

#include <array>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using zapwire::core::StructuredLogger;

constexpr const char* kDefaultReceiveHost = "127.0.0.1";

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

struct CliOptions {
    std::optional<std::string> command{};
    std::vector<std::string> positionals{};
    std::optional<std::string> config_path{};
    std::optional<std::string> relay{};
    std::optional<std::uint16_t> port{};
    std::optional<std::string> code{};
    std::optional<std::size_t> words{};
    std::optional<std::string> output{};
    std::optional<std::string> host{};
    bool resume{false};
    bool quiet{false};
    bool help{false};
};

void print_usage() {
    std::cout << "zap: send a file to another machine with a short code\n\n";
    std::cout << "Usage:\n"
              << "  zap send <path> [--code <code>] [--words <n>]\n"
              << "  zap receive <code> [--output <path>] [--resume] [--host <host>]\n\n";
    std::cout << "Options:\n"
              << "  --relay <host[:port]>     Pair through a relay instead of a direct connection\n"
              << "  --port <port>             Direct port (default " << zapwire::kDefaultDirectPort << ")\n"
              << "  --config <file>           Read settings from a YAML file\n"
              << "  --quiet                   No progress output\n"
              << "  -h, --help                Show this message\n";
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::array<const char*, 5> kUnits{"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit_index = 0;
    while (value >= 1024.0 && unit_index + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss << std::fixed;
    if (unit_index == 0 || value >= 100.0) {
        oss << std::setprecision(0);
    } else {
        oss << std::setprecision(1);
    }
    oss << value << ' ' << kUnits[unit_index];
    return oss.str();
}

bool parse_uint(std::string_view text, std::uint64_t max, std::uint64_t& value) {
    if (text.empty()) {
        return false;
    }
    std::uint64_t result = 0;
    for (const char ch : text) {
        if (ch < '0' || ch > '9') {
            return false;
        }
        result = result * 10 + static_cast<std::uint64_t>(ch - '0');
        if (result > max) {
            return false;
        }
    }
    value = result;
    return true;
}

std::uint16_t parse_port(std::string_view option, std::string_view text) {
    std::uint64_t value = 0;
    if (!parse_uint(text, 65535, value) || value == 0) {
        throw_cli_error("E_INVALID_PORT",
                        std::string(option) + " expects a port between 1 and 65535",
                        "Got '" + std::string(text) + "'");
    }
    return static_cast<std::uint16_t>(value);
}

CliOptions parse_arguments(int argc, char** argv) {
    std::vector<std::string_view> args;
    args.reserve(static_cast<std::size_t>(argc));
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    CliOptions options{};
    std::size_t index = 0;
    auto require_value = [&](std::string_view option) -> std::string {
        if (index >= args.size()) {
            throw_cli_error("E_MISSING_VALUE",
                            std::string(option) + " requires a value",
                            "Provide an argument immediately after " + std::string(option));
        }
        return std::string(args[index++]);
    };

    while (index < args.size()) {
        const auto arg = args[index++];
        if (!arg.starts_with("-")) {
            if (!options.command) {
                options.command = std::string(arg);
            } else {
                options.positionals.emplace_back(arg);
            }
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
        } else if (arg == "--resume") {
            options.resume = true;
        } else if (arg == "--config") {
            options.config_path = require_value(arg);
        } else if (arg == "--relay") {
            options.relay = require_value(arg);
        } else if (arg == "--port") {
            options.port = parse_port(arg, require_value(arg));
        } else if (arg == "--code") {
            options.code = require_value(arg);
        } else if (arg == "--words") {
            const auto text = require_value(arg);
            std::uint64_t value = 0;
            if (!parse_uint(text, 16, value) || value == 0) {
                throw_cli_error("E_INVALID_WORDS", "--words expects a number between 1 and 16");
            }
            options.words = static_cast<std::size_t>(value);
        } else if (arg == "--output" || arg == "-o") {
            options.output = require_value(arg);
        } else if (arg == "--host") {
            options.host = require_value(arg);
        } else {
            throw_cli_error("E_UNKNOWN_OPTION", "Unknown option " + std::string(arg), "Run 'zap --help' for usage");
        }
    }
    return options;
}

void apply_relay_option(const std::string& text, zapwire::Config& config) {
    const auto pos = text.rfind(':');
    if (pos == std::string::npos) {
        config.relay_host = text;
        return;
    }
    const auto host = text.substr(0, pos);
    if (host.empty()) {
        throw_cli_error("E_INVALID_RELAY", "--relay expects host[:port]");
    }
    config.relay_host = host;
    config.relay_port = parse_port("--relay", std::string_view(text).substr(pos + 1));
}

zapwire::Config build_config(const CliOptions& options) {
    zapwire::Config config;
    if (options.config_path) {
        zapwire::load_config_file(*options.config_path, config);
    }
    if (options.port) {
        config.direct_port = *options.port;
    }
    if (options.relay) {
        apply_relay_option(*options.relay, config);
    }
    if (options.words) {
        config.code_words = *options.words;
    }
    zapwire::validate_config(config);
    return config;
}

void configure_logging(const zapwire::Config& config, bool quiet) {
    auto& logger = StructuredLogger::instance();
    logger.set_enabled(config.logging_enabled);
    const auto level = StructuredLogger::parse_level(config.log_level).value_or(StructuredLogger::Level::Info);
    logger.set_min_level(quiet ? StructuredLogger::Level::Error : level);
}

class ProgressPrinter {
public:
    explicit ProgressPrinter(bool enabled)
        : enabled_(enabled) {}

    void operator()(const zapwire::transfer::Progress& progress) {
        if (!enabled_) {
            return;
        }
        const auto permille = progress.total == 0 ? 1000 : (progress.transferred * 1000) / progress.total;
        if (permille == last_permille_) {
            return;
        }
        last_permille_ = permille;
        std::cerr << "\r" << std::setw(5) << std::fixed << std::setprecision(1)
                  << static_cast<double>(permille) / 10.0 << "%  " << format_bytes(progress.transferred) << " of "
                  << format_bytes(progress.total) << "  "
                  << format_bytes(static_cast<std::uint64_t>(progress.bytes_per_second)) << "/s   " << std::flush;
        if (progress.transferred >= progress.total) {
            std::cerr << std::endl;
        }
    }

private:
    bool enabled_;
    std::uint64_t last_permille_{UINT64_MAX};
};

zapwire::transfer::SessionOptions session_options(const zapwire::Config& config, bool quiet) {
    zapwire::transfer::SessionOptions options{};
    options.protocol_version = config.protocol_version;
    options.chunk_size = config.chunk_size;
    options.max_frame_size = config.max_frame_size;
    options.progress = ProgressPrinter(!quiet);
    return options;
}

// Only the final path component of the announced name is used.
std::filesystem::path destination_for(const zapwire::protocol::MetadataPayload& metadata,
                                      const std::optional<std::string>& output) {
    const auto name = std::filesystem::path(metadata.filename).filename();
    const auto text = name.string();
    if (text.empty() || text == "." || text == "..") {
        throw zapwire::Error(zapwire::ErrorCode::IOError, "peer announced an unusable file name");
    }
    if (!output) {
        return name;
    }
    const std::filesystem::path target(*output);
    std::error_code ec;
    if (std::filesystem::is_directory(target, ec)) {
        return target / name;
    }
    return target;
}

int run_send(const CliOptions& options, const zapwire::Config& config) {
    if (options.positionals.size() != 1) {
        throw_cli_error("E_USAGE", "send expects exactly one path", "zap send <path>");
    }
    const std::filesystem::path path(options.positionals.front());
    const auto file = zapwire::transfer::file_metadata(path);
    if (file.is_directory) {
        throw zapwire::Error(zapwire::ErrorCode::IOError, "directory transfer requires an archive");
    }
    zapwire::transfer::FileChunkSource source(path);

    const auto code = options.code ? *options.code : zapwire::crypto::generate_code(config.code_words);
    std::cout << "Sending " << file.name << " (" << format_bytes(file.size) << ")\n";
    std::cout << "Code: " << code << "\n";
    std::cout << "On the other machine run: zap receive " << code << std::endl;

    std::unique_ptr<zapwire::network::FramedTransport> transport;
    if (config.relay_host) {
        transport = zapwire::network::RelayedConnection::connect(*config.relay_host, config.relay_port, code,
                                                                 zapwire::Role::Sender, config.max_frame_size);
    } else {
        zapwire::network::DirectListener listener(config.listen_host, config.direct_port);
        std::cout << "Waiting for the receiver on port " << listener.port() << std::endl;
        transport = listener.accept(config.max_frame_size);
    }

    zapwire::transfer::TransferSession session(*transport, code, zapwire::Role::Sender,
                                               session_options(config, options.quiet));
    const auto report = session.send(file, source);
    transport->close();
    std::cout << "Sent " << format_bytes(report.bytes_sent) << " in " << report.chunks_sent << " chunks";
    if (report.first_chunk > 0) {
        std::cout << " (resumed at chunk " << report.first_chunk << ")";
    }
    std::cout << std::endl;
    return EXIT_SUCCESS;
}

int run_receive(const CliOptions& options, const zapwire::Config& config) {
    if (options.positionals.size() != 1) {
        throw_cli_error("E_USAGE", "receive expects exactly one code", "zap receive <code>");
    }
    const auto& code = options.positionals.front();

    std::unique_ptr<zapwire::network::FramedTransport> transport;
    if (config.relay_host) {
        transport = zapwire::network::RelayedConnection::connect(*config.relay_host, config.relay_port, code,
                                                                 zapwire::Role::Receiver, config.max_frame_size);
    } else {
        const auto host = options.host.value_or(kDefaultReceiveHost);
        transport = zapwire::network::DirectConnection::connect(host, config.direct_port, config.max_frame_size);
    }

    auto session_config = session_options(config, options.quiet);
    session_config.resume = options.resume;
    zapwire::transfer::TransferSession session(*transport, code, zapwire::Role::Receiver, std::move(session_config));

    std::filesystem::path written_to;
    const auto report = session.receive([&](const zapwire::protocol::MetadataPayload& metadata) {
        written_to = destination_for(metadata, options.output);
        if (!options.quiet) {
            std::cout << "Receiving " << metadata.filename << " (" << format_bytes(metadata.size) << ") into "
                      << written_to.string() << std::endl;
        }
        return std::make_unique<zapwire::transfer::FileChunkSink>(written_to, options.resume);
    });
    transport->close();
    std::cout << "Saved " << written_to.string() << " (" << format_bytes(report.bytes_written) << ")";
    if (report.resumed_from_chunk > 0) {
        std::cout << ", resumed at chunk " << report.resumed_from_chunk;
    }
    std::cout << std::endl;
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
    std::signal(SIGPIPE, SIG_IGN);
    try {
        const auto options = parse_arguments(argc, argv);
        if (options.help || !options.command) {
            print_usage();
            return options.help ? EXIT_SUCCESS : 2;
        }
        const auto config = build_config(options);
        configure_logging(config, options.quiet);

        if (*options.command == "send") {
            if (options.output || options.host || options.resume) {
                throw_cli_error("E_USAGE", "--output, --host and --resume apply to receive only");
            }
            return run_send(options, config);
        }
        if (*options.command == "receive") {
            if (options.code || options.words) {
                throw_cli_error("E_USAGE", "--code and --words apply to send only");
            }
            return run_receive(options, config);
        }
        throw_cli_error("E_UNKNOWN_COMMAND", "Unknown command " + *options.command, "Use 'send' or 'receive'");
    } catch (const CliException& ex) {
        print_cli_error(ex);
        return 2;
    } catch (const zapwire::ConfigError& ex) {
        std::cerr << ex.what() << std::endl;
        if (!ex.hint().empty()) {
            std::cerr << "Hint: " << ex.hint() << std::endl;
        }
        return 2;
    } catch (const zapwire::Error& ex) {
        std::cerr << "Transfer failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        std::cerr << "Transfer failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
