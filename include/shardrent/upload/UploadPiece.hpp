#pragma once

#include "shardrent/Types.hpp"

#include <cstdint>

namespace shardrent::upload {

struct UploadPiece {
    ByteBuffer data;
    std::uint64_t chunk_index{0};
    std::uint64_t piece_index{0};
};

}  // namespace shardrent::upload
