#pragma once

#include "shardrent/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace shardrent::erasure {

// Turns one chunk into num_pieces() equally sized pieces such that any
// min_pieces() of them reconstruct the chunk. Implementations hold no mutable
// state and may be shared across threads.
class ErasureCoder {
public:
    virtual ~ErasureCoder() = default;

    virtual std::size_t data_pieces() const noexcept = 0;
    virtual std::size_t parity_pieces() const noexcept = 0;

    std::size_t num_pieces() const noexcept { return data_pieces() + parity_pieces(); }
    std::size_t min_pieces() const noexcept { return data_pieces(); }

    // chunk.size() must equal piece_size * data_pieces(); throws EncodingError otherwise.
    virtual std::vector<ByteBuffer> encode(std::span<const std::uint8_t> chunk, std::size_t piece_size) const = 0;

    // pieces holds num_pieces() slots, missing pieces as std::nullopt. Returns
    // the first output_size bytes of the reconstructed chunk.
    virtual ByteBuffer recover(const std::vector<std::optional<ByteBuffer>>& pieces,
                               std::size_t piece_size,
                               std::size_t output_size) const = 0;
};

}  // namespace shardrent::erasure
