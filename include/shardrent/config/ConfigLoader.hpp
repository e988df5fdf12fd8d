#pragma once

#include "shardrent/Config.hpp"
#include "shardrent/Export.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shardrent::config {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    String,
    Object
};

// Parsed JSON document node. Arrays are rejected by the parser.
struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    std::string string_value;
    std::map<std::string, Value> object_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}

    static Value make_object();

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }
};

// Throws ConfigError("E_CONFIG_PARSE") on malformed input.
Value parse_json(const std::string& text);

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path);
std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path);
std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path);

// Overlays the document onto the defaults and validates the result.
SHARDRENT_API Config parse_config(const std::string& text);
SHARDRENT_API Config load_config(const std::filesystem::path& path);

// Throws ConfigError("E_CONFIG_VALUE") when the policy constants are unusable.
void validate_config(const Config& config);

// Pushes the logging switches into the process-wide logger.
void apply_logging(const Config& config);

}  // namespace shardrent::config
