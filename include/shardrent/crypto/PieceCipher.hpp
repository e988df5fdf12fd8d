#pragma once

#include "shardrent/Types.hpp"
#include "shardrent/crypto/ChaCha20.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace shardrent::crypto {

// Hosts build their storage proofs over segments of this size.
constexpr std::size_t kSegmentSize = 64;

constexpr std::size_t kPieceNonceSize = 12;
constexpr std::size_t kPieceTagSize = 16;

// Bytes added to every piece by seal(). Piece sizes are chosen as a multiple
// of kSegmentSize minus this overhead so sealed pieces stay segment aligned.
constexpr std::size_t kPieceCipherOverhead = kPieceNonceSize + kPieceTagSize;

class PieceCipher {
public:
    explicit PieceCipher(const Key& master_key);

    // nonce || ciphertext || tag
    ByteBuffer seal(std::uint64_t chunk_index,
                    std::uint64_t piece_index,
                    std::span<const std::uint8_t> plaintext) const;

    std::optional<ByteBuffer> open(std::uint64_t chunk_index,
                                   std::uint64_t piece_index,
                                   std::span<const std::uint8_t> sealed) const;

    static Key generate_key();
    static void random_bytes(std::span<std::uint8_t> buffer);

private:
    Key master_key_;

    Key derive_piece_key(std::uint64_t chunk_index, std::uint64_t piece_index) const;
};

}  // namespace shardrent::crypto
