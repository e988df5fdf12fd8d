#include "shardrent/crypto/HmacSha256.hpp"

#include <algorithm>

namespace shardrent::crypto {

HmacSha256::HmacSha256(std::span<const std::uint8_t> key) noexcept {
    std::array<std::uint8_t, kBlockSize> key_block{};
    if (key.size() > kBlockSize) {
        const auto hashed = Sha256::digest(key);
        std::copy(hashed.begin(), hashed.end(), key_block.begin());
    } else {
        std::copy(key.begin(), key.end(), key_block.begin());
    }

    std::array<std::uint8_t, kBlockSize> inner_pad{};
    for (std::size_t i = 0; i < kBlockSize; ++i) {
        inner_pad[i] = static_cast<std::uint8_t>(key_block[i] ^ 0x36);
        outer_pad_[i] = static_cast<std::uint8_t>(key_block[i] ^ 0x5c);
    }
    inner_.update(inner_pad);
    key_block.fill(0);
}

HmacSha256& HmacSha256::update(std::span<const std::uint8_t> data) noexcept {
    inner_.update(data);
    return *this;
}

Digest HmacSha256::finalize() noexcept {
    const auto inner_hash = inner_.finalize();
    Sha256 outer;
    outer.update(outer_pad_).update(inner_hash);
    outer_pad_.fill(0);
    return outer.finalize();
}

Digest HmacSha256::compute(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) noexcept {
    return HmacSha256{key}.update(data).finalize();
}

Digest HmacSha256::compute(std::span<const std::uint8_t> key,
                           std::initializer_list<std::span<const std::uint8_t>> parts) noexcept {
    HmacSha256 mac{key};
    for (const auto part : parts) {
        mac.update(part);
    }
    return mac.finalize();
}

bool HmacSha256::equal(std::span<const std::uint8_t> expected, std::span<const std::uint8_t> actual) noexcept {
    if (expected.size() > actual.size() || expected.empty()) {
        return false;
    }
    std::uint8_t diff = 0;
    for (std::size_t i = 0; i < expected.size(); ++i) {
        diff |= static_cast<std::uint8_t>(expected[i] ^ actual[i]);
    }
    return diff == 0;
}

}  // namespace shardrent::crypto
