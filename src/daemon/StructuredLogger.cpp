#include "sharemesh/daemon/StructuredLogger.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace sharemesh::daemon {

namespace {

constexpr std::array<std::string_view, 3> kLevelNames{"info", "warning", "error"};
// Keys the logger writes itself; a field with one of these names is prefixed.
constexpr std::array<std::string_view, 3> kReservedKeys{"ts", "level", "event"};

void append_escaped(std::string& out, std::string_view value) {
    constexpr char kHex[] = "0123456789abcdef";
    out.push_back('"');
    for (const unsigned char ch : value) {
        if (ch == '"' || ch == '\\') {
            out.push_back('\\');
            out.push_back(static_cast<char>(ch));
        } else if (ch == '\n') {
            out += "\\n";
        } else if (ch == '\r') {
            out += "\\r";
        } else if (ch == '\t') {
            out += "\\t";
        } else if (ch < 0x20) {
            out += "\\u00";
            out.push_back(kHex[ch >> 4]);
            out.push_back(kHex[ch & 0x0f]);
        } else {
            out.push_back(static_cast<char>(ch));
        }
    }
    out.push_back('"');
}

void append_timestamp(std::string& out) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::floor<std::chrono::seconds>(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t raw = std::chrono::system_clock::to_time_t(seconds);

    std::tm utc{};
    gmtime_r(&raw, &utc);

    std::array<char, 32> buffer{};
    const auto written = std::snprintf(buffer.data(), buffer.size(), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                                       utc.tm_sec, static_cast<int>(millis));
    out.push_back('"');
    if (written > 0) {
        out.append(buffer.data(), static_cast<std::size_t>(written));
    }
    out.push_back('"');
}

bool reserved(std::string_view key) {
    for (const auto name : kReservedKeys) {
        if (key == name) {
            return true;
        }
    }
    return false;
}

}  // namespace

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

std::string_view StructuredLogger::to_string(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    return index < kLevelNames.size() ? kLevelNames[index] : kLevelNames.front();
}

std::optional<StructuredLogger::Level> StructuredLogger::parse_level(std::string_view text) noexcept {
    for (std::size_t index = 0; index < kLevelNames.size(); ++index) {
        if (text == kLevelNames[index]) {
            return static_cast<Level>(index);
        }
    }
    return std::nullopt;
}

void StructuredLogger::log(Level level, std::string_view event, const FieldList& fields) {
    {
        std::scoped_lock lock(mutex_);
        if (!enabled_ || level < threshold_) {
            return;
        }
    }

    std::string line;
    line.reserve(96 + fields.size() * 24);
    line += "{\"ts\":";
    append_timestamp(line);
    line += ",\"level\":\"";
    line += to_string(level);
    line += "\",\"event\":";
    append_escaped(line, event);
    for (const auto& [key, value] : fields) {
        line.push_back(',');
        append_escaped(line, reserved(key) ? "field_" + key : key);
        line.push_back(':');
        append_escaped(line, value);
    }
    line += "}\n";

    std::scoped_lock lock(mutex_);
    auto& out = stream_ != nullptr ? *stream_ : std::clog;
    out << line;
    out.flush();
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_threshold(Level level) {
    std::scoped_lock lock(mutex_);
    threshold_ = level;
}

void StructuredLogger::set_stream(std::ostream* stream) {
    std::scoped_lock lock(mutex_);
    stream_ = stream;
}

}  // namespace sharemesh::daemon
