#include "shardrent/crypto/ChaCha20.hpp"

#include <algorithm>

namespace shardrent::crypto {

namespace {

[[nodiscard]] constexpr std::uint32_t rotl32(std::uint32_t value, int shift) noexcept {
    return static_cast<std::uint32_t>((value << shift) | (value >> (32 - shift)));
}

[[nodiscard]] std::uint32_t load32_le(const std::uint8_t* data) noexcept {
    return static_cast<std::uint32_t>(data[0]) |
           (static_cast<std::uint32_t>(data[1]) << 8) |
           (static_cast<std::uint32_t>(data[2]) << 16) |
           (static_cast<std::uint32_t>(data[3]) << 24);
}

void store32_le(std::uint8_t* dst, std::uint32_t value) noexcept {
    for (int i = 0; i < 4; ++i) {
        dst[i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
    }
}

// Column rounds use the index quads in the first four rows, diagonal rounds
// the last four.
constexpr std::array<std::array<std::size_t, 4>, 8> kRoundIndices{{
    {0, 4, 8, 12},
    {1, 5, 9, 13},
    {2, 6, 10, 14},
    {3, 7, 11, 15},
    {0, 5, 10, 15},
    {1, 6, 11, 12},
    {2, 7, 8, 13},
    {3, 4, 9, 14},
}};

void mix(std::array<std::uint32_t, 16>& x, const std::array<std::size_t, 4>& idx) noexcept {
    auto& a = x[idx[0]];
    auto& b = x[idx[1]];
    auto& c = x[idx[2]];
    auto& d = x[idx[3]];
    a += b; d = rotl32(d ^ a, 16);
    c += d; b = rotl32(b ^ c, 12);
    a += b; d = rotl32(d ^ a, 8);
    c += d; b = rotl32(b ^ c, 7);
}

}  // namespace

ChaCha20::ChaCha20(const Key& key, const Nonce& nonce, std::uint32_t counter) noexcept {
    // "expand 32-byte k"
    input_[0] = 0x61707865u;
    input_[1] = 0x3320646eu;
    input_[2] = 0x79622d32u;
    input_[3] = 0x6b206574u;
    for (std::size_t i = 0; i < 8; ++i) {
        input_[4 + i] = load32_le(key.bytes.data() + i * 4);
    }
    input_[12] = counter;
    for (std::size_t i = 0; i < 3; ++i) {
        input_[13 + i] = load32_le(nonce.bytes.data() + i * 4);
    }
}

ChaCha20::~ChaCha20() {
    input_.fill(0);
    keystream_.fill(0);
}

void ChaCha20::refill() noexcept {
    auto working = input_;
    for (int round = 0; round < 10; ++round) {
        for (const auto& quad : kRoundIndices) {
            mix(working, quad);
        }
    }
    for (std::size_t i = 0; i < working.size(); ++i) {
        store32_le(keystream_.data() + i * 4, working[i] + input_[i]);
    }
    ++input_[12];
    keystream_used_ = 0;
}

void ChaCha20::xor_stream(std::span<std::uint8_t> data) noexcept {
    std::size_t offset = 0;
    while (offset < data.size()) {
        if (keystream_used_ == kBlockSize) {
            refill();
        }
        const auto take = std::min(kBlockSize - keystream_used_, data.size() - offset);
        for (std::size_t i = 0; i < take; ++i) {
            data[offset + i] ^= keystream_[keystream_used_ + i];
        }
        keystream_used_ += take;
        offset += take;
    }
}

void ChaCha20::apply(const Key& key,
                     const Nonce& nonce,
                     std::span<std::uint8_t> data,
                     std::uint32_t counter) noexcept {
    ChaCha20 stream{key, nonce, counter};
    stream.xor_stream(data);
}

}  // namespace shardrent::crypto
