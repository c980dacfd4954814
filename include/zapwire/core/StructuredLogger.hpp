#pragma once

#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace zapwire::core {

// One JSON object per line: {"ts":..,"level":..,"event":..,"fields":{..}}.
class StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    void set_min_level(Level level);
    [[nodiscard]] Level min_level() const noexcept;

    // nullptr restores std::clog.
    void set_output(std::ostream* output);

    static std::optional<Level> parse_level(std::string_view text);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string level_to_string(Level level);
    static std::string escape_json(std::string_view value);

    std::string format_timestamp();

    bool enabled_{true};
    Level min_level_{Level::Info};
    std::ostream* output_{nullptr};
    mutable std::mutex mutex_;
};

}  // namespace zapwire::core
