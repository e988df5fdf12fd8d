#include "shardrent/crypto/MerkleTree.hpp"

#include "shardrent/crypto/PieceCipher.hpp"

#include <stdexcept>
#include <vector>

namespace shardrent::crypto {

Digest MerkleTree::leaf_hash(std::span<const std::uint8_t> segment) noexcept {
    Sha256 hasher;
    hasher.update(std::uint8_t{0x00}).update(segment);
    return hasher.finalize();
}

Digest MerkleTree::node_hash(const Digest& left, const Digest& right) noexcept {
    Sha256 hasher;
    hasher.update(std::uint8_t{0x01}).update(left).update(right);
    return hasher.finalize();
}

Digest MerkleTree::segment_root(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        throw std::invalid_argument("cannot build a merkle root over no data");
    }
    if (data.size() % kSegmentSize != 0) {
        throw std::invalid_argument("merkle input is not segment aligned");
    }

    std::vector<Digest> level;
    level.reserve(data.size() / kSegmentSize);
    for (std::size_t offset = 0; offset < data.size(); offset += kSegmentSize) {
        level.push_back(leaf_hash(data.subspan(offset, kSegmentSize)));
    }

    while (level.size() > 1) {
        std::vector<Digest> parents;
        parents.reserve((level.size() + 1) / 2);
        for (std::size_t i = 0; i + 1 < level.size(); i += 2) {
            parents.push_back(node_hash(level[i], level[i + 1]));
        }
        // An unpaired node is promoted unchanged.
        if (level.size() % 2 == 1) {
            parents.push_back(level.back());
        }
        level = std::move(parents);
    }
    return level.front();
}

}  // namespace shardrent::crypto
