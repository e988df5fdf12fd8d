#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace shardrent {

using ByteBuffer = std::vector<std::uint8_t>;
using ContractId = std::array<std::uint8_t, 32>;
using HostAddress = std::string;
using Currency = std::uint64_t;
using BlockHeight = std::uint64_t;

std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
std::string contract_id_to_string(const ContractId& id);
std::optional<ContractId> contract_id_from_string(const std::string& text);

}  // namespace shardrent
