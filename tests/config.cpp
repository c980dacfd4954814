#include "zapwire/Config.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

using namespace zapwire;

namespace {

std::string error_code_of(const std::string& text) {
    Config config{};
    try {
        apply_config_text(text, config);
        validate_config(config);
    } catch (const ConfigError& error) {
        return error.code();
    }
    return {};
}

}  // namespace

int main() {
    {
        Config config{};
        validate_config(config);
        assert(config.chunk_size == 64 * 1024);
        assert(config.max_frame_size == 100 * 1024 * 1024);
        assert(!config.relay_host.has_value());
    }

    {
        Config config{};
        apply_config_text(
            "# transfer settings\n"
            "chunk_size: 4096   # small chunks\n"
            "code_words: 4\n"
            "listen_host: \"127.0.0.1\"\n"
            "log_level: DEBUG\n"
            "logging: off\n"
            "\n"
            "relay:\n"
            "  host: 'relay.example.net'\n"
            "  port: 7000\n"
            "direct_port: 8123\n",
            config);
        validate_config(config);
        assert(config.chunk_size == 4096);
        assert(config.code_words == 4);
        assert(config.listen_host == "127.0.0.1");
        assert(config.log_level == "debug");
        assert(!config.logging_enabled);
        assert(config.relay_host == std::string("relay.example.net"));
        assert(config.relay_port == 7000);
        assert(config.direct_port == 8123);
    }

    // An empty relay host switches back to direct mode.
    {
        Config config{};
        config.relay_host = "relay.example.net";
        apply_config_text("relay:\n  host: \"\"\n", config);
        assert(!config.relay_host.has_value());
    }

    assert(error_code_of("chunk_size 4096\n") == "E_CONFIG_PARSE");
    assert(error_code_of("   chunk_size: 4096\n") == "E_CONFIG_PARSE");
    assert(error_code_of("  port: 7000\n") == "E_CONFIG_PARSE");
    assert(error_code_of("colour: blue\n") == "E_CONFIG_VALUE");
    assert(error_code_of("chunk_size: lots\n") == "E_CONFIG_VALUE");
    assert(error_code_of("direct_port: 0\n") == "E_CONFIG_VALUE");
    assert(error_code_of("relay:\n  port: 70000\n") == "E_CONFIG_VALUE");
    assert(error_code_of("logging: maybe\n") == "E_CONFIG_VALUE");
    assert(error_code_of("chunk_size: 0\n") == "E_CONFIG_VALUE");
    assert(error_code_of("protocol_version: 0\n") == "E_CONFIG_VALUE");
    assert(error_code_of("code_words: 17\n") == "E_CONFIG_VALUE");
    assert(error_code_of("log_level: verbose\n") == "E_CONFIG_VALUE");
    assert(error_code_of("max_frame_size: 2048\nchunk_size: 2000\n") == "E_CONFIG_VALUE");
    assert(error_code_of("max_frame_size: 2048\nchunk_size: 1024\n").empty());

    {
        const auto path = std::filesystem::temp_directory_path() / "zapwire_config_test.yaml";
        {
            std::ofstream out(path, std::ios::trunc);
            out << "relay:\n  host: localhost\n";
        }
        Config config{};
        load_config_file(path, config);
        assert(config.relay_host == std::string("localhost"));
        std::filesystem::remove(path);

        bool missing = false;
        try {
            load_config_file(path, config);
        } catch (const ConfigError& error) {
            missing = error.code() == "E_CONFIG_NOT_FOUND" && !error.hint().empty();
        }
        assert(missing);
    }

    return 0;
}
