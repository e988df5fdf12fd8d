#pragma once

#include "shardrent/Types.hpp"
#include "shardrent/upload/File.hpp"

#include <memory>
#include <span>

namespace shardrent::renter {

// Current on-disk layout of a file record.
constexpr std::uint8_t kFileRecordVersion = 1;

ByteBuffer encode_file(const upload::File& file);

// Throws std::invalid_argument on truncated, malformed or unknown-version input.
std::unique_ptr<upload::File> decode_file(std::span<const std::uint8_t> bytes);

}  // namespace shardrent::renter
