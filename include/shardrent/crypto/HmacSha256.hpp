#pragma once

#include "shardrent/crypto/Sha256.hpp"

#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>

namespace shardrent::crypto {

class HmacSha256 {
public:
    static constexpr std::size_t kBlockSize = 64;
    static constexpr std::size_t kDigestSize = 32;

    explicit HmacSha256(std::span<const std::uint8_t> key) noexcept;

    HmacSha256& update(std::span<const std::uint8_t> data) noexcept;
    Digest finalize() noexcept;

    static Digest compute(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) noexcept;
    static Digest compute(std::span<const std::uint8_t> key,
                          std::initializer_list<std::span<const std::uint8_t>> parts) noexcept;

    // Constant-time comparison of the first expected.size() bytes of a MAC.
    static bool equal(std::span<const std::uint8_t> expected, std::span<const std::uint8_t> actual) noexcept;

private:
    std::array<std::uint8_t, kBlockSize> outer_pad_{};
    Sha256 inner_;
};

}  // namespace shardrent::crypto
