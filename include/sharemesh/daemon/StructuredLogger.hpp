#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sharemesh::daemon {

// One JSON object per line: ts, level, event, then the fields in the order given.
class StructuredLogger {
public:
    enum class Level : std::uint8_t {
        Info = 0,
        Warning = 1,
        Error = 2
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    static std::string_view to_string(Level level) noexcept;
    static std::optional<Level> parse_level(std::string_view text) noexcept;

    void log(Level level, std::string_view event, const FieldList& fields = {});

    void info(std::string_view event, const FieldList& fields = {}) { log(Level::Info, event, fields); }
    void warning(std::string_view event, const FieldList& fields = {}) { log(Level::Warning, event, fields); }
    void error(std::string_view event, const FieldList& fields = {}) { log(Level::Error, event, fields); }

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    // Records below the threshold are dropped.
    void set_threshold(Level level);

    // nullptr restores std::clog.
    void set_stream(std::ostream* stream);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    bool enabled_{true};
    Level threshold_{Level::Info};
    std::ostream* stream_{nullptr};
    mutable std::mutex mutex_;
};

}  // namespace sharemesh::daemon
