#pragma once

#include "shardrent/Types.hpp"
#include "shardrent/crypto/Sha256.hpp"

#include <cstdint>
#include <vector>

namespace shardrent::upload {

// Where one sealed piece lives inside the host's contract data.
struct PieceRecord {
    std::uint64_t chunk_index{0};
    std::uint64_t piece_index{0};
    std::uint64_t offset{0};
    std::uint64_t length{0};
    crypto::Digest merkle_root{};
};

// Everything a single host has stored for one file.
struct FileContract {
    ContractId id{};
    HostAddress address;
    BlockHeight duration{0};
    std::vector<PieceRecord> pieces;

    std::uint64_t stored_bytes() const noexcept;
    bool holds(std::uint64_t chunk_index, std::uint64_t piece_index) const noexcept;
};

}  // namespace shardrent::upload
