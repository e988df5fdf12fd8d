#pragma once

#include "shardrent/erasure/ErasureCoder.hpp"

#include <memory>
#include <vector>

namespace shardrent::erasure {

// Systematic Reed-Solomon code over GF(2^8). The first data_pieces outputs are
// the chunk itself; parity rows come from a Cauchy matrix, so every square
// submatrix of the generator is invertible.
class ReedSolomon final : public ErasureCoder {
public:
    static constexpr std::size_t kMaxPieces = 255;

    ReedSolomon(std::size_t data_pieces, std::size_t parity_pieces);

    std::size_t data_pieces() const noexcept override { return data_pieces_; }
    std::size_t parity_pieces() const noexcept override { return parity_pieces_; }

    std::vector<ByteBuffer> encode(std::span<const std::uint8_t> chunk, std::size_t piece_size) const override;

    ByteBuffer recover(const std::vector<std::optional<ByteBuffer>>& pieces,
                       std::size_t piece_size,
                       std::size_t output_size) const override;

private:
    std::size_t data_pieces_;
    std::size_t parity_pieces_;
    // parity_pieces_ rows of data_pieces_ coefficients
    std::vector<std::uint8_t> parity_matrix_;

    std::vector<std::uint8_t> generator_row(std::size_t piece_index) const;
};

std::shared_ptr<const ErasureCoder> make_reed_solomon(std::size_t data_pieces, std::size_t parity_pieces);

}  // namespace shardrent::erasure
