#pragma once

#include "shardrent/crypto/Sha256.hpp"

#include <cstdint>
#include <span>

namespace shardrent::crypto {

class MerkleTree {
public:
    // Root over kSegmentSize-byte leaves. Throws std::invalid_argument when the
    // input is empty or not segment aligned.
    static Digest segment_root(std::span<const std::uint8_t> data);

    static Digest leaf_hash(std::span<const std::uint8_t> segment) noexcept;
    static Digest node_hash(const Digest& left, const Digest& right) noexcept;
};

}  // namespace shardrent::crypto
