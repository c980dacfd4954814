#include "zapwire/Config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>

namespace zapwire {

namespace {

std::string trim(std::string value) {
    const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) { return !is_space(ch); }).base(), value.end());
    return value;
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string strip_comment(const std::string& line) {
    bool in_single = false;
    bool in_double = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (ch == '"' && !in_single) {
            in_double = !in_double;
        } else if (ch == '\'' && !in_double) {
            in_single = !in_single;
        } else if (ch == '#' && !in_single && !in_double) {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string parse_scalar(const std::string& text) {
    std::string trimmed = trim(text);
    if (trimmed.size() >= 2 &&
        ((trimmed.front() == '"' && trimmed.back() == '"') || (trimmed.front() == '\'' && trimmed.back() == '\''))) {
        return trimmed.substr(1, trimmed.size() - 2);
    }
    return trimmed;
}

std::uint64_t parse_unsigned(const std::string& key, const std::string& value, std::uint64_t max) {
    std::uint64_t parsed = 0;
    const auto result = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (result.ec != std::errc{} || result.ptr != value.data() + value.size() || parsed > max) {
        throw ConfigError("E_CONFIG_VALUE", key + " must be an integer between 0 and " + std::to_string(max));
    }
    return parsed;
}

std::uint16_t parse_port(const std::string& key, const std::string& value) {
    const auto parsed = parse_unsigned(key, value, std::numeric_limits<std::uint16_t>::max());
    if (parsed == 0) {
        throw ConfigError("E_CONFIG_VALUE", key + " must be between 1 and 65535");
    }
    return static_cast<std::uint16_t>(parsed);
}

bool parse_bool(const std::string& key, const std::string& value) {
    const auto lowered = to_lower(value);
    if (lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    throw ConfigError("E_CONFIG_VALUE", key + " must be true or false");
}

void apply_entry(const std::string& key, const std::string& value, Config& config) {
    if (key == "protocol_version") {
        config.protocol_version = static_cast<std::uint32_t>(
            parse_unsigned(key, value, std::numeric_limits<std::uint32_t>::max()));
    } else if (key == "chunk_size") {
        config.chunk_size = static_cast<std::size_t>(
            parse_unsigned(key, value, std::numeric_limits<std::uint32_t>::max()));
    } else if (key == "max_frame_size") {
        config.max_frame_size = static_cast<std::size_t>(
            parse_unsigned(key, value, std::numeric_limits<std::uint32_t>::max()));
    } else if (key == "listen_host") {
        config.listen_host = value;
    } else if (key == "direct_port") {
        config.direct_port = parse_port(key, value);
    } else if (key == "code_words") {
        config.code_words = static_cast<std::size_t>(parse_unsigned(key, value, 64));
    } else if (key == "log_level") {
        config.log_level = to_lower(value);
    } else if (key == "logging") {
        config.logging_enabled = parse_bool(key, value);
    } else if (key == "relay.host") {
        if (value.empty()) {
            config.relay_host.reset();
        } else {
            config.relay_host = value;
        }
    } else if (key == "relay.port") {
        config.relay_port = parse_port(key, value);
    } else {
        throw ConfigError("E_CONFIG_VALUE", "Unknown configuration key: " + key);
    }
}

}  // namespace

ConfigError::ConfigError(std::string code, std::string message, std::string hint)
    : code_(std::move(code)),
      message_(std::move(message)),
      hint_(std::move(hint)) {
    formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
}

void load_config_file(const std::filesystem::path& path, Config& config) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND", "Configuration file not found: " + path.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    apply_config_text(buffer.str(), config);
}

void apply_config_text(const std::string& text, Config& config) {
    std::istringstream input(text);
    std::string line;
    std::string section;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string content = strip_comment(line);
        while (!content.empty() && std::isspace(static_cast<unsigned char>(content.back()))) {
            content.pop_back();
        }
        if (content.empty()) {
            continue;
        }

        std::size_t indent = 0;
        while (indent < content.size() && content[indent] == ' ') {
            ++indent;
        }
        const auto where = " (line " + std::to_string(line_number) + ")";
        if (indent != 0 && indent != 2) {
            throw ConfigError("E_CONFIG_PARSE", "Indentation must be zero or two spaces" + where);
        }
        if (indent == 2 && section.empty()) {
            throw ConfigError("E_CONFIG_PARSE", "Indented entry outside of a section" + where);
        }

        const auto colon = content.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("E_CONFIG_PARSE", "Expected ':' in mapping entry" + where);
        }
        const auto key = trim(content.substr(indent, colon - indent));
        const auto value = parse_scalar(content.substr(colon + 1));
        if (key.empty()) {
            throw ConfigError("E_CONFIG_PARSE", "Empty key in mapping entry" + where);
        }

        if (indent == 0) {
            if (trim(content.substr(colon + 1)).empty()) {
                section = key;
                continue;
            }
            section.clear();
            apply_entry(key, value, config);
        } else {
            apply_entry(section + "." + key, value, config);
        }
    }
}

void validate_config(const Config& config) {
    if (config.protocol_version == 0) {
        throw ConfigError("E_CONFIG_VALUE", "protocol_version must be at least 1");
    }
    if (config.chunk_size == 0 || config.chunk_size > 16 * 1024 * 1024) {
        throw ConfigError("E_CONFIG_VALUE", "chunk_size must be between 1 byte and 16 MiB");
    }
    if (config.max_frame_size == 0 || config.max_frame_size > kMaxFrameSize) {
        throw ConfigError("E_CONFIG_VALUE", "max_frame_size must be between 1 byte and 100 MiB");
    }
    // A sealed chunk adds the message header and the AEAD envelope.
    if (config.chunk_size + 1024 > config.max_frame_size) {
        throw ConfigError("E_CONFIG_VALUE", "chunk_size must leave room below max_frame_size");
    }
    if (config.code_words == 0 || config.code_words > 16) {
        throw ConfigError("E_CONFIG_VALUE", "code_words must be between 1 and 16");
    }
    if (config.log_level != "debug" && config.log_level != "info" && config.log_level != "warning" &&
        config.log_level != "error") {
        throw ConfigError("E_CONFIG_VALUE", "log_level must be one of debug, info, warning, error");
    }
}

}  // namespace zapwire
