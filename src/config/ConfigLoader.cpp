#include "shardrent/config/ConfigLoader.hpp"

#include "shardrent/Errors.hpp"
#include "shardrent/crypto/PieceCipher.hpp"
#include "shardrent/erasure/ReedSolomon.hpp"
#include "shardrent/log/StructuredLogger.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>

namespace shardrent::config {

namespace {

class JsonParser {
public:
    explicit JsonParser(const std::string& text) : text_(text) {}

    Value parse() {
        skip_whitespace();
        Value value = parse_value();
        skip_whitespace();
        if (!at_end()) {
            throw ConfigError("E_CONFIG_PARSE", "Unexpected trailing content in JSON config");
        }
        return value;
    }

private:
    const std::string& text_;
    std::size_t position_{0};

    bool at_end() const { return position_ >= text_.size(); }

    char peek() const { return at_end() ? '\0' : text_[position_]; }

    char get() { return at_end() ? '\0' : text_[position_++]; }

    void skip_whitespace() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) {
            ++position_;
        }
    }

    Value parse_value() {
        skip_whitespace();
        if (at_end()) {
            throw ConfigError("E_CONFIG_PARSE", "Unexpected end of JSON while parsing value");
        }

        const char ch = peek();
        if (ch == '{') {
            return parse_object();
        }
        if (ch == '[') {
            throw ConfigError("E_CONFIG_PARSE", "JSON arrays are not used in the config");
        }
        if (ch == '"') {
            return Value(parse_string());
        }
        if (ch == 't' || ch == 'f') {
            return Value(parse_boolean());
        }
        if (ch == 'n') {
            expect_literal("null");
            return Value();
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
            return parse_integer();
        }
        throw ConfigError("E_CONFIG_PARSE", "Unexpected token in JSON value");
    }

    Value parse_object() {
        Value object = Value::make_object();
        get();
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
            const char ch = get();
            if (ch == '}') {
                return object;
            }
            if (ch != ',') {
                throw ConfigError("E_CONFIG_PARSE", "Expected ',' or '}' in JSON object");
            }
        }
    }

    std::string parse_string() {
        get();
        std::string result;
        while (!at_end()) {
            const char ch = get();
            if (ch == '"') {
                return result;
            }
            if (static_cast<unsigned char>(ch) < 0x20) {
                throw ConfigError("E_CONFIG_PARSE", "Control characters must be escaped in JSON strings");
            }
            if (ch != '\\') {
                result.push_back(ch);
                continue;
            }

            switch (get()) {
                case '"':
                    result.push_back('"');
                    break;
                case '\\':
                    result.push_back('\\');
                    break;
                case '/':
                    result.push_back('/');
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
                    append_utf8(result, parse_code_unit());
                    break;
                default:
                    throw ConfigError("E_CONFIG_PARSE", "Unsupported escape sequence in JSON string");
            }
        }
        throw ConfigError("E_CONFIG_PARSE", "Unterminated JSON string literal");
    }

    unsigned int parse_code_unit() {
        if (position_ + 4 > text_.size()) {
            throw ConfigError("E_CONFIG_PARSE", "Incomplete unicode escape in JSON string");
        }
        unsigned int code_point = 0;
        const auto* begin = text_.data() + position_;
        const auto result = std::from_chars(begin, begin + 4, code_point, 16);
        if (result.ec != std::errc{} || result.ptr != begin + 4) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid hex digit in unicode escape");
        }
        position_ += 4;
        return code_point;
    }

    static void append_utf8(std::string& out, unsigned int code_point) {
        if (code_point <= 0x7F) {
            out.push_back(static_cast<char>(code_point));
        } else if (code_point <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code_point >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xE0 | ((code_point >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        }
    }

    Value parse_integer() {
        const std::size_t start = position_;
        if (peek() == '-') {
            ++position_;
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            ++position_;
        }
        if (peek() == '.' || peek() == 'e' || peek() == 'E') {
            throw ConfigError("E_CONFIG_PARSE", "Only integer numbers are accepted in the config");
        }
        std::int64_t value{};
        const auto* begin = text_.data() + start;
        const auto* end = text_.data() + position_;
        const auto result = std::from_chars(begin, end, value);
        if (result.ec != std::errc{} || result.ptr != end) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid integer number in JSON");
        }
        return Value(value);
    }

    bool parse_boolean() {
        if (peek() == 't') {
            expect_literal("true");
            return true;
        }
        expect_literal("false");
        return false;
    }

    void expect_literal(std::string_view literal) {
        if (text_.compare(position_, literal.size(), literal) != 0) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid literal in JSON: expected " + std::string(literal));
        }
        position_ += literal.size();
    }
};

std::string join_path(const std::vector<std::string>& path) {
    if (path.empty()) {
        return "<root>";
    }
    std::string combined;
    for (std::size_t i = 0; i < path.size(); ++i) {
        combined += path[i];
        if (i + 1 < path.size()) {
            combined += '.';
        }
    }
    return combined;
}

const Value* find_path(const Value& root, const std::vector<std::string>& path) {
    const Value* node = &root;
    for (const auto& key : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        const auto it = node->object_value.find(key);
        if (it == node->object_value.end()) {
            return nullptr;
        }
        node = &it->second;
    }
    return node->is_null() ? nullptr : node;
}

std::uint64_t require_unsigned(const Value& root, const std::vector<std::string>& path, std::uint64_t current) {
    const auto value = get_int64(root, path);
    if (!value) {
        return current;
    }
    if (*value < 0) {
        throw ConfigError("E_CONFIG_VALUE", join_path(path) + " must not be negative");
    }
    return static_cast<std::uint64_t>(*value);
}

}  // namespace

Value Value::make_object() {
    Value value;
    value.type = ValueType::Object;
    return value;
}

Value parse_json(const std::string& text) {
    return JsonParser(text).parse();
}

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

Config parse_config(const std::string& text) {
    const Value document = parse_json(text);
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be an object");
    }

    Config config;
    config.default_duration = require_unsigned(document, {"upload", "duration"}, config.default_duration);

    const auto data = require_unsigned(document, {"upload", "data_pieces"}, config.default_data_pieces);
    const auto parity = require_unsigned(document, {"upload", "parity_pieces"}, config.default_parity_pieces);
    if (data > erasure::ReedSolomon::kMaxPieces || parity > erasure::ReedSolomon::kMaxPieces) {
        throw ConfigError("E_CONFIG_VALUE", "upload piece counts must not exceed 255",
                          "Lower upload.data_pieces or upload.parity_pieces");
    }
    config.default_data_pieces = static_cast<std::uint8_t>(data);
    config.default_parity_pieces = static_cast<std::uint8_t>(parity);

    config.default_piece_size = require_unsigned(document, {"upload", "piece_size"}, config.default_piece_size);
    config.small_piece_size = require_unsigned(document, {"upload", "small_piece_size"}, config.small_piece_size);
    config.max_file_size = require_unsigned(document, {"upload", "max_file_size"}, config.max_file_size);

    const auto percent = require_unsigned(document, {"upload", "host_sample_percent"}, config.host_sample_percent);
    if (percent > std::numeric_limits<std::uint32_t>::max()) {
        throw ConfigError("E_CONFIG_VALUE", "upload.host_sample_percent is out of range");
    }
    config.host_sample_percent = static_cast<std::uint32_t>(percent);
    config.cost_buffer_factor = require_unsigned(document, {"upload", "cost_buffer_factor"}, config.cost_buffer_factor);

    if (auto directory = get_string(document, {"renter", "directory"})) {
        config.renter_directory = *directory;
    }

    config.http_connect_timeout = std::chrono::seconds(
        require_unsigned(document, {"http", "connect_timeout_seconds"},
                         static_cast<std::uint64_t>(config.http_connect_timeout.count())));
    config.http_transfer_timeout = std::chrono::seconds(
        require_unsigned(document, {"http", "transfer_timeout_seconds"},
                         static_cast<std::uint64_t>(config.http_transfer_timeout.count())));

    if (auto enabled = get_bool(document, {"logging", "enabled"})) {
        config.logging_enabled = *enabled;
    }
    if (auto level = get_string(document, {"logging", "level"})) {
        config.log_level = *level;
    }

    validate_config(config);
    return config;
}

Config load_config(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND", "Configuration file not found: " + path.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

void validate_config(const Config& config) {
    if (config.default_data_pieces == 0) {
        throw ConfigError("E_CONFIG_VALUE", "upload.data_pieces must be at least 1");
    }
    if (static_cast<std::size_t>(config.default_data_pieces) + config.default_parity_pieces >
        erasure::ReedSolomon::kMaxPieces) {
        throw ConfigError("E_CONFIG_VALUE", "upload.data_pieces + upload.parity_pieces must not exceed 255");
    }
    for (const auto& [name, size] : {std::pair<const char*, std::uint64_t>{"upload.piece_size", config.default_piece_size},
                                     std::pair<const char*, std::uint64_t>{"upload.small_piece_size", config.small_piece_size}}) {
        if (size == 0 || (size + crypto::kPieceCipherOverhead) % crypto::kSegmentSize != 0) {
            throw ConfigError("E_CONFIG_VALUE",
                              std::string(name) + " plus the " + std::to_string(crypto::kPieceCipherOverhead) +
                                  " byte cipher overhead must be a positive multiple of " +
                                  std::to_string(crypto::kSegmentSize),
                              "Use a size such as 65508 or 4194276");
        }
    }
    if (config.small_piece_size > config.default_piece_size) {
        throw ConfigError("E_CONFIG_VALUE", "upload.small_piece_size must not exceed upload.piece_size");
    }
    if (config.host_sample_percent < 100) {
        throw ConfigError("E_CONFIG_VALUE", "upload.host_sample_percent must be at least 100");
    }
    if (config.cost_buffer_factor == 0) {
        throw ConfigError("E_CONFIG_VALUE", "upload.cost_buffer_factor must be at least 1");
    }
    if (config.renter_directory.empty()) {
        throw ConfigError("E_CONFIG_VALUE", "renter.directory must not be empty");
    }
    log::StructuredLogger::Level level{};
    if (!log::StructuredLogger::parse_level(config.log_level, level)) {
        throw ConfigError("E_CONFIG_VALUE", "logging.level must be one of debug, info, warning, error");
    }
}

void apply_logging(const Config& config) {
    auto level = log::StructuredLogger::Level::Info;
    if (!log::StructuredLogger::parse_level(config.log_level, level)) {
        throw ConfigError("E_CONFIG_VALUE", "Unknown log level: " + config.log_level);
    }
    auto& logger = log::StructuredLogger::instance();
    logger.set_enabled(config.logging_enabled);
    logger.set_min_level(level);
}

}  // namespace shardrent::config
