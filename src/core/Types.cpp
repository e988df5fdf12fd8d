#include "shardrent/Types.hpp"

#include <iomanip>
#include <sstream>

namespace shardrent {

namespace {

int hex_digit_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
        return 10 + (ch - 'A');
    }
    return -1;
}

}  // namespace

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase;
    for (const auto byte : bytes) {
        oss << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

std::string contract_id_to_string(const ContractId& id) {
    return bytes_to_hex(id);
}

std::optional<ContractId> contract_id_from_string(const std::string& text) {
    if (text.size() != ContractId{}.size() * 2) {
        return std::nullopt;
    }

    ContractId id{};
    for (std::size_t index = 0; index < id.size(); ++index) {
        const auto high = hex_digit_value(text[index * 2]);
        const auto low = hex_digit_value(text[index * 2 + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        id[index] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return id;
}

}  // namespace shardrent
