#include "shardrent/erasure/ReedSolomon.hpp"

#include "shardrent/Errors.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace shardrent::erasure {

namespace {

constexpr std::uint16_t kFieldPolynomial = 0x11Du;

struct GaloisTables {
    std::array<std::uint8_t, 512> exp{};
    std::array<std::uint8_t, 256> log{};
    // mul[a * 256 + b] == a * b
    std::vector<std::uint8_t> mul;

    GaloisTables() : mul(256 * 256, 0) {
        std::uint16_t x = 1;
        for (std::size_t i = 0; i < 255; ++i) {
            exp[i] = static_cast<std::uint8_t>(x & 0xFFu);
            log[exp[i]] = static_cast<std::uint8_t>(i);
            x <<= 1U;
            if (x & 0x100U) {
                x ^= kFieldPolynomial;
            }
        }
        for (std::size_t i = 255; i < exp.size(); ++i) {
            exp[i] = exp[i - 255];
        }
        for (std::size_t a = 1; a < 256; ++a) {
            for (std::size_t b = 1; b < 256; ++b) {
                mul[a * 256 + b] = exp[static_cast<std::size_t>(log[a]) + log[b]];
            }
        }
    }
};

const GaloisTables& tables() {
    static const GaloisTables instance;
    return instance;
}

std::uint8_t gf_mul(std::uint8_t a, std::uint8_t b) {
    return tables().mul[static_cast<std::size_t>(a) * 256 + b];
}

std::uint8_t gf_inv(std::uint8_t a) {
    if (a == 0) {
        throw std::invalid_argument("zero has no inverse in GF(256)");
    }
    const auto& t = tables();
    return t.exp[255 - t.log[a]];
}

// out ^= coefficient * in, byte-wise
void mul_add_row(std::uint8_t coefficient, const std::uint8_t* in, std::uint8_t* out, std::size_t length) {
    if (coefficient == 0) {
        return;
    }
    const auto* row = tables().mul.data() + static_cast<std::size_t>(coefficient) * 256;
    for (std::size_t i = 0; i < length; ++i) {
        out[i] ^= row[in[i]];
    }
}

// Gauss-Jordan inversion of an n x n matrix stored row-major.
std::vector<std::uint8_t> invert(std::vector<std::uint8_t> matrix, std::size_t n) {
    std::vector<std::uint8_t> inverse(n * n, 0);
    for (std::size_t i = 0; i < n; ++i) {
        inverse[i * n + i] = 1;
    }

    for (std::size_t col = 0; col < n; ++col) {
        std::size_t pivot = col;
        while (pivot < n && matrix[pivot * n + col] == 0) {
            ++pivot;
        }
        if (pivot == n) {
            throw EncodingError("erasure decode matrix is singular");
        }
        if (pivot != col) {
            std::swap_ranges(matrix.begin() + static_cast<std::ptrdiff_t>(pivot * n),
                             matrix.begin() + static_cast<std::ptrdiff_t>(pivot * n + n),
                             matrix.begin() + static_cast<std::ptrdiff_t>(col * n));
            std::swap_ranges(inverse.begin() + static_cast<std::ptrdiff_t>(pivot * n),
                             inverse.begin() + static_cast<std::ptrdiff_t>(pivot * n + n),
                             inverse.begin() + static_cast<std::ptrdiff_t>(col * n));
        }

        const auto scale = gf_inv(matrix[col * n + col]);
        for (std::size_t k = 0; k < n; ++k) {
            matrix[col * n + k] = gf_mul(matrix[col * n + k], scale);
            inverse[col * n + k] = gf_mul(inverse[col * n + k], scale);
        }

        for (std::size_t row = 0; row < n; ++row) {
            if (row == col) {
                continue;
            }
            const auto factor = matrix[row * n + col];
            if (factor == 0) {
                continue;
            }
            mul_add_row(factor, &matrix[col * n], &matrix[row * n], n);
            mul_add_row(factor, &inverse[col * n], &inverse[row * n], n);
        }
    }
    return inverse;
}

}  // namespace

ReedSolomon::ReedSolomon(std::size_t data_pieces, std::size_t parity_pieces)
    : data_pieces_(data_pieces),
      parity_pieces_(parity_pieces) {
    if (data_pieces_ == 0) {
        throw std::invalid_argument("erasure code needs at least one data piece");
    }
    if (data_pieces_ + parity_pieces_ > kMaxPieces) {
        throw std::invalid_argument("erasure code cannot exceed " + std::to_string(kMaxPieces) + " pieces");
    }

    parity_matrix_.resize(parity_pieces_ * data_pieces_);
    for (std::size_t i = 0; i < parity_pieces_; ++i) {
        const auto x = static_cast<std::uint8_t>(data_pieces_ + i);
        for (std::size_t j = 0; j < data_pieces_; ++j) {
            const auto y = static_cast<std::uint8_t>(j);
            parity_matrix_[i * data_pieces_ + j] = gf_inv(static_cast<std::uint8_t>(x ^ y));
        }
    }
}

std::vector<std::uint8_t> ReedSolomon::generator_row(std::size_t piece_index) const {
    std::vector<std::uint8_t> row(data_pieces_, 0);
    if (piece_index < data_pieces_) {
        row[piece_index] = 1;
        return row;
    }
    const auto offset = (piece_index - data_pieces_) * data_pieces_;
    std::copy_n(parity_matrix_.begin() + static_cast<std::ptrdiff_t>(offset), data_pieces_, row.begin());
    return row;
}

std::vector<ByteBuffer> ReedSolomon::encode(std::span<const std::uint8_t> chunk, std::size_t piece_size) const {
    if (piece_size == 0) {
        throw EncodingError("piece size must be positive");
    }
    if (chunk.size() != piece_size * data_pieces_) {
        throw EncodingError("chunk of " + std::to_string(chunk.size()) + " bytes does not match " +
                            std::to_string(data_pieces_) + " pieces of " + std::to_string(piece_size) + " bytes");
    }

    std::vector<ByteBuffer> pieces;
    pieces.reserve(num_pieces());
    for (std::size_t j = 0; j < data_pieces_; ++j) {
        const auto slice = chunk.subspan(j * piece_size, piece_size);
        pieces.emplace_back(slice.begin(), slice.end());
    }

    for (std::size_t i = 0; i < parity_pieces_; ++i) {
        ByteBuffer parity(piece_size, 0);
        for (std::size_t j = 0; j < data_pieces_; ++j) {
            mul_add_row(parity_matrix_[i * data_pieces_ + j], pieces[j].data(), parity.data(), piece_size);
        }
        pieces.push_back(std::move(parity));
    }
    return pieces;
}

ByteBuffer ReedSolomon::recover(const std::vector<std::optional<ByteBuffer>>& pieces,
                                std::size_t piece_size,
                                std::size_t output_size) const {
    if (pieces.size() != num_pieces()) {
        throw EncodingError("expected " + std::to_string(num_pieces()) + " piece slots, got " +
                            std::to_string(pieces.size()));
    }
    if (output_size > piece_size * data_pieces_) {
        throw EncodingError("requested output exceeds chunk size");
    }

    std::vector<std::size_t> chosen;
    chosen.reserve(data_pieces_);
    for (std::size_t index = 0; index < pieces.size() && chosen.size() < data_pieces_; ++index) {
        if (!pieces[index].has_value()) {
            continue;
        }
        if (pieces[index]->size() != piece_size) {
            throw EncodingError("piece " + std::to_string(index) + " has the wrong size");
        }
        chosen.push_back(index);
    }
    if (chosen.size() < data_pieces_) {
        throw EncodingError("only " + std::to_string(chosen.size()) + " of the " + std::to_string(data_pieces_) +
                            " required pieces are available");
    }

    ByteBuffer chunk(piece_size * data_pieces_, 0);
    const bool all_data = chosen.back() < data_pieces_;
    if (all_data) {
        for (std::size_t j = 0; j < data_pieces_; ++j) {
            std::copy(pieces[j]->begin(), pieces[j]->end(), chunk.begin() + static_cast<std::ptrdiff_t>(j * piece_size));
        }
    } else {
        std::vector<std::uint8_t> sub_matrix;
        sub_matrix.reserve(data_pieces_ * data_pieces_);
        for (const auto index : chosen) {
            const auto row = generator_row(index);
            sub_matrix.insert(sub_matrix.end(), row.begin(), row.end());
        }
        const auto decode = invert(std::move(sub_matrix), data_pieces_);

        for (std::size_t j = 0; j < data_pieces_; ++j) {
            auto* out = chunk.data() + j * piece_size;
            for (std::size_t k = 0; k < data_pieces_; ++k) {
                mul_add_row(decode[j * data_pieces_ + k], pieces[chosen[k]]->data(), out, piece_size);
            }
        }
    }

    chunk.resize(output_size);
    return chunk;
}

std::shared_ptr<const ErasureCoder> make_reed_solomon(std::size_t data_pieces, std::size_t parity_pieces) {
    return std::make_shared<ReedSolomon>(data_pieces, parity_pieces);
}

}  // namespace shardrent::erasure
