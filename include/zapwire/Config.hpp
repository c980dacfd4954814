#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>

namespace zapwire {

inline constexpr std::uint32_t kProtocolVersion = 1;
inline constexpr std::size_t kDefaultChunkSize = 64 * 1024;
inline constexpr std::size_t kMaxFrameSize = 100 * 1024 * 1024;
inline constexpr std::uint16_t kDefaultDirectPort = 9999;
inline constexpr std::uint16_t kDefaultRelayPort = 9750;

struct Config {
    std::uint32_t protocol_version{kProtocolVersion};
    std::size_t chunk_size{kDefaultChunkSize};
    std::size_t max_frame_size{kMaxFrameSize};
    std::string listen_host{"0.0.0.0"};
    std::uint16_t direct_port{kDefaultDirectPort};
    std::optional<std::string> relay_host{};
    std::uint16_t relay_port{kDefaultRelayPort};
    std::size_t code_words{3};
    std::string log_level{"info"};
    bool logging_enabled{true};
};

class ConfigError : public std::exception {
public:
    ConfigError(std::string code, std::string message, std::string hint = {});

    const char* what() const noexcept override { return formatted_.c_str(); }

    const std::string& code() const& { return code_; }
    const std::string& message() const& { return message_; }
    const std::string& hint() const& { return hint_; }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

// Reads a flat YAML mapping. Nested sections one level deep map to "section.key".
// Recognised keys:
//   protocol_version, chunk_size, max_frame_size, listen_host, direct_port,
//   code_words, log_level, logging, relay.host, relay.port
void load_config_file(const std::filesystem::path& path, Config& config);
void apply_config_text(const std::string& text, Config& config);

void validate_config(const Config& config);

}  // namespace zapwire
