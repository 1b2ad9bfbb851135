#pragma once

#include "sharemesh/Config.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace sharemesh::config {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    Double,
    String,
    Object,
    Array
};

struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    double double_value{0.0};
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(double value) : type(ValueType::Double), double_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}

    static Value make_object();
    static Value make_array();

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_double() const { return type == ValueType::Double; }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }
    bool is_array() const { return type == ValueType::Array; }
};

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {});

    const char* what() const noexcept override { return formatted.c_str(); }
};

class JsonParser {
public:
    explicit JsonParser(const std::string& text) : text_(text) {}

    // Throws ConfigError with code E_CONFIG_PARSE.
    Value parse();

private:
    bool at_end() const { return position_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[position_]; }
    char get() { return at_end() ? '\0' : text_[position_++]; }

    void skip_whitespace();
    Value parse_value();
    Value parse_object();
    Value parse_array();
    std::string parse_string();
    std::string parse_unicode_escape();
    Value parse_number();
    bool parse_boolean();
    void parse_null();

    const std::string& text_;
    std::size_t position_{0};
};

// Overlays the sections of a parsed document onto base. Missing keys keep their base value.
Config apply_config(const Value& document, Config base = {});

Config load_config(const std::filesystem::path& path);

}  // namespace sharemesh::config
