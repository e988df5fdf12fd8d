#include "shardrent/Errors.hpp"
#include "shardrent/erasure/ReedSolomon.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <optional>
#include <stdexcept>
#include <vector>

namespace {

using shardrent::ByteBuffer;
using shardrent::EncodingError;
using shardrent::erasure::ReedSolomon;

std::vector<std::optional<ByteBuffer>> keep_only(const std::vector<ByteBuffer>& pieces, unsigned mask) {
    std::vector<std::optional<ByteBuffer>> slots(pieces.size());
    for (std::size_t i = 0; i < pieces.size(); ++i) {
        if (mask & (1u << i)) {
            slots[i] = pieces[i];
        }
    }
    return slots;
}

unsigned popcount(unsigned value) {
    unsigned count = 0;
    while (value != 0) {
        count += value & 1u;
        value >>= 1u;
    }
    return count;
}

}  // namespace

int main() {
    const ReedSolomon code{3, 4};
    assert(code.num_pieces() == 7);
    assert(code.min_pieces() == 3);

    const std::size_t piece_size = 100;
    const auto chunk = shardrent::test::patterned_bytes(piece_size * 3);
    const auto pieces = code.encode(chunk, piece_size);
    assert(pieces.size() == 7);
    for (const auto& piece : pieces) {
        assert(piece.size() == piece_size);
    }

    // Systematic: the data pieces are the chunk itself.
    for (std::size_t j = 0; j < 3; ++j) {
        assert(std::equal(pieces[j].begin(), pieces[j].end(), chunk.begin() + static_cast<std::ptrdiff_t>(j * piece_size)));
    }

    // Deterministic across calls.
    assert(code.encode(chunk, piece_size) == pieces);

    // Any three of the seven pieces restore the chunk.
    for (unsigned mask = 0; mask < (1u << 7); ++mask) {
        if (popcount(mask) != 3) {
            continue;
        }
        const auto recovered = code.recover(keep_only(pieces, mask), piece_size, chunk.size());
        assert(recovered == chunk);
    }

    // Output can be trimmed to the meaningful prefix.
    const auto prefix = code.recover(keep_only(pieces, 0b1110000u), piece_size, 42);
    assert(prefix.size() == 42);
    assert(std::equal(prefix.begin(), prefix.end(), chunk.begin()));

    bool threw = false;
    try {
        (void)code.recover(keep_only(pieces, 0b1000001u), piece_size, chunk.size());
    } catch (const EncodingError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)code.encode(ByteBuffer(piece_size * 3 - 1), piece_size);
    } catch (const EncodingError& ex) {
        threw = true;
        assert(ex.code() == "E_ENCODING");
    }
    assert(threw);

    threw = false;
    try {
        auto wrong = keep_only(pieces, 0b0000111u);
        wrong[1]->pop_back();
        (void)code.recover(wrong, piece_size, chunk.size());
    } catch (const EncodingError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ReedSolomon invalid{0, 3};
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ReedSolomon invalid{200, 56};
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Default shape: two data pieces, ten parity pieces, restored from parity alone.
    const auto wide = shardrent::erasure::make_reed_solomon(2, 10);
    const auto wide_chunk = shardrent::test::patterned_bytes(2 * 36, 99);
    const auto wide_pieces = wide->encode(wide_chunk, 36);
    assert(wide_pieces.size() == 12);
    std::vector<std::optional<ByteBuffer>> parity_only(12);
    parity_only[7] = wide_pieces[7];
    parity_only[11] = wide_pieces[11];
    assert(wide->recover(parity_only, 36, wide_chunk.size()) == wide_chunk);

    // A single-piece code with no parity is a plain copy.
    const ReedSolomon copy{1, 0};
    const auto single = copy.encode(wide_chunk, wide_chunk.size());
    assert(single.size() == 1 && single[0] == wide_chunk);

    return 0;
}
