#include "shardrent/upload/FileContract.hpp"

#include <algorithm>

namespace shardrent::upload {

std::uint64_t FileContract::stored_bytes() const noexcept {
    std::uint64_t total = 0;
    for (const auto& piece : pieces) {
        total += piece.length;
    }
    return total;
}

bool FileContract::holds(std::uint64_t chunk_index, std::uint64_t piece_index) const noexcept {
    return std::any_of(pieces.begin(), pieces.end(), [&](const PieceRecord& record) {
        return record.chunk_index == chunk_index && record.piece_index == piece_index;
    });
}

}  // namespace shardrent::upload
