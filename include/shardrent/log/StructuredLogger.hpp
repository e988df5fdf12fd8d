#pragma once

#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shardrent::log {

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

    void debug(std::string_view event, FieldList fields = {}) { log(Level::Debug, event, std::move(fields)); }
    void info(std::string_view event, FieldList fields = {}) { log(Level::Info, event, std::move(fields)); }
    void warning(std::string_view event, FieldList fields = {}) { log(Level::Warning, event, std::move(fields)); }
    void error(std::string_view event, FieldList fields = {}) { log(Level::Error, event, std::move(fields)); }

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    void set_min_level(Level level);
    [[nodiscard]] Level min_level() const noexcept;

    // nullptr restores std::clog. The stream must outlive its use here.
    void set_sink(std::ostream* sink);

    static std::string level_to_string(Level level);
    static bool parse_level(std::string_view text, Level& level);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string escape_json(std::string_view value);

    std::string format_timestamp();

    bool enabled_{true};
    Level min_level_{Level::Info};
    std::ostream* sink_{nullptr};
    mutable std::mutex mutex_;
};

}  // namespace shardrent::log
