#include "shardrent/crypto/Sha256.hpp"

#include <algorithm>
#include <cstring>

namespace shardrent::crypto {

namespace {

constexpr std::array<std::uint32_t, 8> kInitialState{
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u};

constexpr std::array<std::uint32_t, 64> kK{
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

constexpr std::uint32_t rotr(std::uint32_t x, int n) noexcept {
    return (x >> n) | (x << (32 - n));
}

}  // namespace

Sha256::Sha256() noexcept : state_(kInitialState) {}

Sha256& Sha256::update(std::span<const std::uint8_t> data) noexcept {
    total_bytes_ += data.size();
    auto remaining = data;

    if (pending_size_ > 0) {
        const auto take = std::min(pending_.size() - pending_size_, remaining.size());
        std::memcpy(pending_.data() + pending_size_, remaining.data(), take);
        pending_size_ += take;
        remaining = remaining.subspan(take);
        if (pending_size_ < pending_.size()) {
            return *this;
        }
        compress(pending_.data());
        pending_size_ = 0;
    }

    while (remaining.size() >= pending_.size()) {
        compress(remaining.data());
        remaining = remaining.subspan(pending_.size());
    }

    if (!remaining.empty()) {
        std::memcpy(pending_.data(), remaining.data(), remaining.size());
        pending_size_ = remaining.size();
    }
    return *this;
}

Sha256& Sha256::update(std::uint8_t byte) noexcept {
    return update(std::span<const std::uint8_t>{&byte, 1});
}

Digest Sha256::finalize() noexcept {
    const std::uint64_t bit_length = total_bytes_ * 8;

    pending_[pending_size_++] = 0x80;
    if (pending_size_ > 56) {
        std::fill(pending_.begin() + static_cast<std::ptrdiff_t>(pending_size_), pending_.end(), std::uint8_t{0});
        compress(pending_.data());
        pending_size_ = 0;
    }
    std::fill(pending_.begin() + static_cast<std::ptrdiff_t>(pending_size_), pending_.begin() + 56, std::uint8_t{0});
    for (int i = 0; i < 8; ++i) {
        pending_[56 + i] = static_cast<std::uint8_t>(bit_length >> (56 - 8 * i));
    }
    compress(pending_.data());

    Digest out{};
    for (std::size_t i = 0; i < state_.size(); ++i) {
        out[i * 4 + 0] = static_cast<std::uint8_t>(state_[i] >> 24);
        out[i * 4 + 1] = static_cast<std::uint8_t>(state_[i] >> 16);
        out[i * 4 + 2] = static_cast<std::uint8_t>(state_[i] >> 8);
        out[i * 4 + 3] = static_cast<std::uint8_t>(state_[i]);
    }

    state_ = kInitialState;
    pending_.fill(0);
    pending_size_ = 0;
    total_bytes_ = 0;
    return out;
}

Digest Sha256::digest(std::span<const std::uint8_t> data) noexcept {
    return Sha256{}.update(data).finalize();
}

void Sha256::compress(const std::uint8_t* block) noexcept {
    // Message schedule kept as a 16-word ring.
    std::array<std::uint32_t, 16> w{};
    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = (static_cast<std::uint32_t>(block[i * 4]) << 24) |
               (static_cast<std::uint32_t>(block[i * 4 + 1]) << 16) |
               (static_cast<std::uint32_t>(block[i * 4 + 2]) << 8) |
               static_cast<std::uint32_t>(block[i * 4 + 3]);
    }

    auto v = state_;
    for (std::size_t t = 0; t < 64; ++t) {
        if (t >= 16) {
            const auto w15 = w[(t - 15) & 15];
            const auto w2 = w[(t - 2) & 15];
            const auto s0 = rotr(w15, 7) ^ rotr(w15, 18) ^ (w15 >> 3);
            const auto s1 = rotr(w2, 17) ^ rotr(w2, 19) ^ (w2 >> 10);
            w[t & 15] += s0 + w[(t - 7) & 15] + s1;
        }

        const auto& [a, b, c, d, e, f, g, h] = v;
        const auto t1 = h + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25)) + ((e & f) ^ (~e & g)) + kK[t] + w[t & 15];
        const auto t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22)) + ((a & b) ^ (a & c) ^ (b & c));
        v = {t1 + t2, a, b, c, d + t1, e, f, g};
    }

    for (std::size_t i = 0; i < state_.size(); ++i) {
        state_[i] += v[i];
    }
}

}  // namespace shardrent::crypto
