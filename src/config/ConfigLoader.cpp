#include "sharemesh/config/ConfigLoader.hpp"

#include "sharemesh/Types.hpp"
#include "sharemesh/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <limits>
#include <optional>
#include <sstream>
#include <string_view>

namespace sharemesh::config {

namespace {

bool parse_floating_token(const char* begin, const char* end, double& value) {
    std::string buffer(begin, end);
    if (buffer.empty()) {
        return false;
    }
    char* parsed_end = nullptr;
    errno = 0;
    value = std::strtod(buffer.c_str(), &parsed_end);
    if (parsed_end != buffer.c_str() + buffer.size()) {
        return false;
    }
    return errno != ERANGE;
}

std::string join_path(const std::vector<std::string>& path) {
    std::string combined;
    for (std::size_t i = 0; i < path.size(); ++i) {
        combined += path[i];
        if (i + 1 < path.size()) {
            combined += '.';
        }
    }
    return combined.empty() ? std::string{"<root>"} : combined;
}

const Value* find_path(const Value& root, const std::vector<std::string>& path) {
    const Value* node = &root;
    for (const auto& segment : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        const auto it = node->object_value.find(segment);
        if (it == node->object_value.end()) {
            return nullptr;
        }
        node = &it->second;
    }
    return node;
}

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    if (node->is_string()) {
        std::string lowered = node->string_value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (lowered == "true" || lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "false" || lowered == "no" || lowered == "off") {
            return false;
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    if (node->is_double()) {
        const double value = node->double_value;
        const double rounded = std::floor(value + 0.5);
        if (std::abs(value - rounded) < 1e-9) {
            return static_cast<std::int64_t>(rounded);
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

// Integer constrained to [min, max]; out-of-range values are E_CONFIG_VALUE.
std::optional<std::int64_t> get_ranged(const Value& root,
                                       const std::vector<std::string>& path,
                                       std::int64_t min,
                                       std::int64_t max) {
    const auto value = get_int64(root, path);
    if (value.has_value() && (*value < min || *value > max)) {
        throw ConfigError("E_CONFIG_VALUE",
                          "Value " + std::to_string(*value) + " out of range at config path " + join_path(path),
                          "Expected a value between " + std::to_string(min) + " and " + std::to_string(max));
    }
    return value;
}

constexpr std::int64_t kMaxSeconds = 7 * 24 * 3600;
constexpr std::int64_t kMaxMillis = kMaxSeconds * 1000;

template <typename Target>
void assign(const std::optional<std::int64_t>& value, Target& target) {
    if (value.has_value()) {
        target = static_cast<Target>(*value);
    }
}

void assign_seconds(const std::optional<std::int64_t>& value, std::chrono::seconds& target) {
    if (value.has_value()) {
        target = std::chrono::seconds(*value);
    }
}

void assign_millis(const std::optional<std::int64_t>& value, std::chrono::milliseconds& target) {
    if (value.has_value()) {
        target = std::chrono::milliseconds(*value);
    }
}

void require_object(const Value& document, const std::string& section) {
    const Value* node = find_path(document, {section});
    if (node && !node->is_object()) {
        throw ConfigError("E_CONFIG_TYPE", "Section '" + section + "' must be an object");
    }
}

}  // namespace

Value Value::make_object() {
    Value value;
    value.type = ValueType::Object;
    return value;
}

Value Value::make_array() {
    Value value;
    value.type = ValueType::Array;
    return value;
}

ConfigError::ConfigError(std::string c, std::string m, std::string h)
    : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
    if (!code.empty()) {
        formatted = "[" + code + "] " + message;
    } else {
        formatted = message;
    }
}

Value JsonParser::parse() {
    skip_whitespace();
    Value value = parse_value();
    skip_whitespace();
    if (!at_end()) {
        throw ConfigError("E_CONFIG_PARSE", "Unexpected trailing content in JSON config");
    }
    return value;
}

void JsonParser::skip_whitespace() {
    while (!at_end()) {
        const char ch = peek();
        if (ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t') {
            ++position_;
        } else {
            break;
        }
    }
}

Value JsonParser::parse_value() {
    skip_whitespace();
    if (at_end()) {
        throw ConfigError("E_CONFIG_PARSE", "Unexpected end of JSON while parsing value");
    }

    const char ch = peek();
    if (ch == '{') {
        return parse_object();
    }
    if (ch == '[') {
        return parse_array();
    }
    if (ch == '"') {
        return Value(parse_string());
    }
    if (ch == 't' || ch == 'f') {
        return Value(parse_boolean());
    }
    if (ch == 'n') {
        parse_null();
        return Value();
    }
    if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
        return parse_number();
    }
    throw ConfigError("E_CONFIG_PARSE", "Unexpected token in JSON value");
}

Value JsonParser::parse_object() {
    Value object = Value::make_object();
    get();  // '{'
    skip_whitespace();
    if (peek() == '}') {
        get();
        return object;
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            throw ConfigError("E_CONFIG_PARSE", "Expected string key in JSON object");
        }
        std::string key = parse_string();
        skip_whitespace();
        if (get() != ':') {
            throw ConfigError("E_CONFIG_PARSE", "Expected ':' after key in JSON object");
        }
        object.object_value.insert_or_assign(std::move(key), parse_value());

        skip_whitespace();
        if (at_end()) {
            throw ConfigError("E_CONFIG_PARSE", "Unexpected end of JSON while parsing object");
        }
        const char ch = get();
        if (ch == '}') {
            break;
        }
        if (ch != ',') {
            throw ConfigError("E_CONFIG_PARSE", "Expected ',' or '}' in JSON object");
        }
    }
    return object;
}

Value JsonParser::parse_array() {
    Value array = Value::make_array();
    get();  // '['
    skip_whitespace();
    if (peek() == ']') {
        get();
        return array;
    }

    while (true) {
        array.array_value.push_back(parse_value());
        skip_whitespace();
        if (at_end()) {
            throw ConfigError("E_CONFIG_PARSE", "Unexpected end of JSON while parsing array");
        }
        const char ch = get();
        if (ch == ']') {
            break;
        }
        if (ch != ',') {
            throw ConfigError("E_CONFIG_PARSE", "Expected ',' or ']' in JSON array");
        }
    }
    return array;
}

std::string JsonParser::parse_string() {
    if (get() != '"') {
        throw ConfigError("E_CONFIG_PARSE", "Expected opening quote for JSON string");
    }

    std::string result;
    while (!at_end()) {
        const char ch = get();
        if (ch == '"') {
            return result;
        }
        if (ch != '\\') {
            if (static_cast<unsigned char>(ch) < 0x20) {
                throw ConfigError("E_CONFIG_PARSE", "Control characters must be escaped in JSON strings");
            }
            result.push_back(ch);
            continue;
        }
        if (at_end()) {
            throw ConfigError("E_CONFIG_PARSE", "Incomplete escape sequence in JSON string");
        }
        const char esc = get();
        switch (esc) {
        case '"':
        case '\\':
        case '/':
            result.push_back(esc);
            break;
        case 'b':
            result.push_back('\b');
            break;
        case 'f':
            result.push_back('\f');
            break;
        case 'n':
            result.push_back('\n');
            break;
        case 'r':
            result.push_back('\r');
            break;
        case 't':
            result.push_back('\t');
            break;
        case 'u':
            result += parse_unicode_escape();
            break;
        default:
            throw ConfigError("E_CONFIG_PARSE", "Unsupported escape sequence in JSON string");
        }
    }
    throw ConfigError("E_CONFIG_PARSE", "Unterminated JSON string literal");
}

std::string JsonParser::parse_unicode_escape() {
    if (position_ + 4 > text_.size()) {
        throw ConfigError("E_CONFIG_PARSE", "Incomplete unicode escape in JSON string");
    }
    unsigned int code_point = 0;
    for (int i = 0; i < 4; ++i) {
        const char ch = text_[position_++];
        code_point <<= 4;
        if (ch >= '0' && ch <= '9') {
            code_point += static_cast<unsigned int>(ch - '0');
        } else if (ch >= 'a' && ch <= 'f') {
            code_point += 10u + static_cast<unsigned int>(ch - 'a');
        } else if (ch >= 'A' && ch <= 'F') {
            code_point += 10u + static_cast<unsigned int>(ch - 'A');
        } else {
            throw ConfigError("E_CONFIG_PARSE", "Invalid hex digit in unicode escape");
        }
    }

    std::string utf8;
    if (code_point <= 0x7F) {
        utf8.push_back(static_cast<char>(code_point));
    } else if (code_point <= 0x7FF) {
        utf8.push_back(static_cast<char>(0xC0 | ((code_point >> 6) & 0x1F)));
        utf8.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        utf8.push_back(static_cast<char>(0xE0 | ((code_point >> 12) & 0x0F)));
        utf8.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        utf8.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
    return utf8;
}

Value JsonParser::parse_number() {
    const std::size_t start = position_;
    if (peek() == '-') {
        ++position_;
    }
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
        ++position_;
    }
    bool is_fractional = false;
    if (peek() == '.') {
        is_fractional = true;
        ++position_;
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            ++position_;
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        is_fractional = true;
        ++position_;
        if (peek() == '+' || peek() == '-') {
            ++position_;
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            ++position_;
        }
    }

    const char* token_begin = text_.data() + start;
    const char* token_end = text_.data() + position_;
    if (is_fractional) {
        double value{};
        if (!parse_floating_token(token_begin, token_end, value)) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid floating point number in JSON");
        }
        return Value(value);
    }
    std::int64_t int_value{};
    const auto result = std::from_chars(token_begin, token_end, int_value);
    if (result.ec != std::errc{} || result.ptr != token_end) {
        throw ConfigError("E_CONFIG_PARSE", "Invalid integer number in JSON");
    }
    return Value(int_value);
}

bool JsonParser::parse_boolean() {
    if (text_.compare(position_, 4, "true") == 0) {
        position_ += 4;
        return true;
    }
    if (text_.compare(position_, 5, "false") == 0) {
        position_ += 5;
        return false;
    }
    throw ConfigError("E_CONFIG_PARSE", "Invalid boolean literal in JSON");
}

void JsonParser::parse_null() {
    if (text_.compare(position_, 4, "null") != 0) {
        throw ConfigError("E_CONFIG_PARSE", "Invalid null literal in JSON");
    }
    position_ += 4;
}

Config apply_config(const Value& document, Config base) {
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_TYPE", "Configuration root must be an object");
    }
    for (const auto* section :
         {"network", "discovery", "session", "transfer", "identity", "access", "storage", "logging"}) {
        require_object(document, section);
    }

    Config config = std::move(base);
    constexpr std::int64_t kMaxPort = std::numeric_limits<std::uint16_t>::max();

    if (auto value = get_string(document, {"network", "listen_host"})) {
        config.listen_host = *value;
    }
    assign(get_ranged(document, {"network", "listen_port"}, 0, kMaxPort), config.listen_port);
    if (auto value = get_string(document, {"network", "advertise_host"})) {
        config.advertise_host = *value;
    }
    assign(get_ranged(document, {"network", "connect_attempts"}, 1, 100), config.connect_attempts);
    assign(get_ranged(document, {"network", "protocol_version"}, 1, 255), config.protocol_version);

    if (auto value = get_bool(document, {"discovery", "enabled"})) {
        config.discovery_enabled = *value;
    }
    assign(get_ranged(document, {"discovery", "port"}, 1, kMaxPort), config.discovery_port);
    if (auto value = get_string(document, {"discovery", "multicast_group"})) {
        config.multicast_group = *value;
    }
    assign_seconds(get_ranged(document, {"discovery", "peer_ttl_seconds"}, 1, kMaxSeconds), config.peer_ttl);
    assign_seconds(get_ranged(document, {"discovery", "announce_interval_seconds"}, 1, kMaxSeconds),
                   config.announce_interval);
    assign_seconds(get_ranged(document, {"discovery", "sweep_interval_seconds"}, 1, kMaxSeconds),
                   config.sweep_interval);
    assign_seconds(get_ranged(document, {"discovery", "auth_failure_cooldown_seconds"}, 0, kMaxSeconds),
                   config.auth_failure_cooldown);

    assign_millis(get_ranged(document, {"session", "handshake_timeout_ms"}, 1, kMaxMillis), config.handshake_timeout);
    assign_seconds(get_ranged(document, {"session", "freshness_seconds"}, 1, kMaxSeconds), config.handshake_freshness);
    assign_seconds(get_ranged(document, {"session", "idle_timeout_seconds"}, 1, kMaxSeconds),
                   config.session_idle_timeout);
    assign_seconds(get_ranged(document, {"session", "lifetime_seconds"}, 1, kMaxSeconds), config.session_lifetime);
    assign_seconds(get_ranged(document, {"session", "keepalive_seconds"}, 1, kMaxSeconds), config.keepalive_interval);
    assign(get_ranged(document, {"session", "max_per_peer"}, 1, 64), config.max_sessions_per_peer);

    assign(get_ranged(document, {"transfer", "chunk_size"}, static_cast<std::int64_t>(kMinChunkSize),
                      static_cast<std::int64_t>(kMaxChunkSize)),
           config.chunk_size);
    assign(get_ranged(document, {"transfer", "max_file_size"}, 1, std::numeric_limits<std::int64_t>::max()),
           config.max_file_size);
    assign(get_ranged(document, {"transfer", "max_concurrent_jobs"}, 1, 1024), config.max_concurrent_jobs);
    assign(get_ranged(document, {"transfer", "per_job_concurrency"}, 1, 256), config.per_job_concurrency);
    assign(get_ranged(document, {"transfer", "max_chunk_retries"}, 0, 1000), config.max_chunk_retries);
    assign_millis(get_ranged(document, {"transfer", "chunk_request_timeout_ms"}, 1, kMaxMillis),
                  config.chunk_request_timeout);
    assign(get_ranged(document, {"transfer", "max_network_retries"}, 0, 1000), config.max_network_retries);
    assign_millis(get_ranged(document, {"transfer", "retry_initial_backoff_ms"}, 1, kMaxMillis),
                  config.retry_initial_backoff);
    assign_millis(get_ranged(document, {"transfer", "retry_max_backoff_ms"}, 1, kMaxMillis),
                  config.retry_max_backoff);
    if (config.retry_max_backoff < config.retry_initial_backoff) {
        throw ConfigError("E_CONFIG_VALUE", "transfer.retry_max_backoff_ms is below transfer.retry_initial_backoff_ms");
    }

    if (auto value = get_string(document, {"identity", "user_id"})) {
        if (value->empty()) {
            throw ConfigError("E_CONFIG_VALUE", "identity.user_id must not be empty");
        }
        config.user_id = *value;
    }
    if (auto value = get_string(document, {"identity", "key_path"})) {
        config.identity_key_path = *value;
    }
    if (auto value = get_string(document, {"identity", "seed"})) {
        const auto bytes = from_hex(*value);
        if (!bytes.has_value() || bytes->size() != 32) {
            throw ConfigError("E_CONFIG_VALUE", "identity.seed must be 64 hex characters");
        }
        std::array<std::uint8_t, 32> seed{};
        std::copy(bytes->begin(), bytes->end(), seed.begin());
        config.identity_seed = seed;
    }

    if (const Value* users = find_path(document, {"access", "users"}); users && !users->is_null()) {
        if (!users->is_object()) {
            throw ConfigError("E_CONFIG_TYPE", "Expected object at config path access.users");
        }
        for (const auto& [user, peer] : users->object_value) {
            if (!peer.is_string()) {
                throw ConfigError("E_CONFIG_TYPE", "Expected string at config path access.users." + user);
            }
            if (user.empty() || !peer_id_from_string(peer.string_value).has_value()) {
                throw ConfigError("E_CONFIG_VALUE", "Invalid binding for user '" + user + "'",
                                  "Map each user id to the 64 hex character peer id of its node");
            }
            config.user_peers.insert_or_assign(user, peer.string_value);
        }
    }

    if (auto value = get_string(document, {"storage", "download_directory"})) {
        config.download_directory = *value;
    }
    if (auto value = get_string(document, {"storage", "download_log"})) {
        config.download_log_path = *value;
    }

    if (auto value = get_bool(document, {"logging", "enabled"})) {
        config.logging_enabled = *value;
    }
    if (auto value = get_string(document, {"logging", "level"})) {
        if (!daemon::StructuredLogger::parse_level(*value).has_value()) {
            throw ConfigError("E_CONFIG_VALUE", "Unknown logging.level '" + *value + "'",
                              "Use one of: info, warning, error");
        }
        config.log_level = *value;
    }

    return config;
}

Config load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigError("E_CONFIG_IO", "Configuration file not readable: " + path.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    const std::string contents = buffer.str();
    return apply_config(JsonParser(contents).parse());
}

}  // namespace sharemesh::config
